#include "drop_synth/core/utils.hpp"
#include "drop_synth/core/errors.hpp"
#include "drop_synth/core/random.hpp"
#include "drop_synth/core/types.hpp"

#include <filesystem>
#include <fstream>
#include <vector>

#include <catch2/catch_test_macros.hpp>

namespace fs = std::filesystem;
namespace core = drop_synth::core;
using drop_synth::RandomSource;
using drop_synth::ShapeKind;

TEST_CASE("string_to_shape_kind_is_case_and_space_insensitive") {
    REQUIRE(drop_synth::string_to_shape_kind(" Teardrop ") == ShapeKind::TEARDROP);
    REQUIRE(drop_synth::string_to_shape_kind("SPLASH") == ShapeKind::SPLASH);
    REQUIRE_FALSE(drop_synth::string_to_shape_kind("cube").has_value());
    for (ShapeKind kind : drop_synth::all_shape_kinds()) {
        REQUIRE(drop_synth::string_to_shape_kind(drop_synth::shape_kind_to_string(kind)) == kind);
    }
}

TEST_CASE("random_source_same_seed_same_sequence") {
    RandomSource a(314);
    RandomSource b(314);
    for (int i = 0; i < 50; ++i) {
        REQUIRE(a.uniform_int(-100, 100) == b.uniform_int(-100, 100));
        REQUIRE(a.uniform_real(0.0, 1.0) == b.uniform_real(0.0, 1.0));
    }
}

TEST_CASE("random_source_ranges_are_respected") {
    RandomSource rng(2);
    for (int i = 0; i < 200; ++i) {
        const int v = rng.uniform_int(3, 6);
        REQUIRE(v >= 3);
        REQUIRE(v <= 6);
        const double r = rng.uniform_real(1.2, 2.0);
        REQUIRE(r >= 1.2);
        REQUIRE(r < 2.0);
    }
    REQUIRE(rng.uniform_int(5, 5) == 5);
    REQUIRE(rng.uniform_int(9, 4) == 9);
    REQUIRE_FALSE(rng.bernoulli(0.0));
    REQUIRE(rng.bernoulli(1.0));
}

TEST_CASE("random_source_pick_from_empty_throws") {
    RandomSource rng(2);
    std::vector<int> empty;
    REQUIRE_THROWS_AS(rng.pick(empty), drop_synth::ValidationError);
    std::vector<int> one{42};
    REQUIRE(rng.pick(one) == 42);
}

TEST_CASE("string_helpers") {
    REQUIRE(core::to_lower("IMG_01.PNG") == "img_01.png");
    REQUIRE(core::ends_with("frame.jpeg", ".jpeg"));
    REQUIRE_FALSE(core::ends_with("a", ".png"));
    // Bytes of multi-byte UTF-8 sequences pass through untouched.
    REQUIRE(core::to_lower("\xC3\x84PFEL.JPG") == "\xC3\x84pfel.jpg");
    REQUIRE(core::is_image_file("Stra\xC3\x9F" "E.PNG"));
}

TEST_CASE("discover_images_returns_sorted_image_files_only") {
    fs::path dir = fs::temp_directory_path() / "drop_synth_test_discover";
    fs::remove_all(dir);
    fs::create_directories(dir);
    for (const char* name : {"b.PNG", "a.jpg", "notes.txt", "c.bmp"}) {
        std::ofstream(dir / name) << "x";
    }
    fs::create_directories(dir / "nested.png");

    auto images = core::discover_images(dir);

    REQUIRE(images.size() == 3);
    REQUIRE(images[0].filename() == "a.jpg");
    REQUIRE(images[1].filename() == "b.PNG");
    REQUIRE(images[2].filename() == "c.bmp");
    REQUIRE(core::discover_images(dir / "missing").empty());
    fs::remove_all(dir);
}

TEST_CASE("run_id_has_timestamp_and_suffix") {
    const std::string id = core::get_run_id();
    REQUIRE(id.size() == 24);
    REQUIRE(id[8] == '_');
    REQUIRE(id[15] == '_');
    REQUIRE(core::get_iso_timestamp().back() == 'Z');
}
