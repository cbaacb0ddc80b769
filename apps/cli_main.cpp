#include "drop_synth/config/configuration.hpp"
#include "drop_synth/core/errors.hpp"
#include "drop_synth/core/utils.hpp"
#include "drop_synth/io/image_io.hpp"
#include "drop_synth/pipeline/engine.hpp"
#include "drop_synth/runner/events.hpp"

#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>
#include <yaml-cpp/yaml.h>

#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace drop_synth;

static void print_json(const json& j) {
    std::cout << j.dump(2) << std::endl;
}

// ============================================================================
// get-schema
// ============================================================================
int cmd_get_schema() {
    std::cout << config::get_schema_json() << std::endl;
    return 0;
}

// ============================================================================
// validate-config --path <path> [--strict-exit-codes]
// ============================================================================
int cmd_validate_config(const std::string& path, bool strict_exit) {
    json result;
    result["valid"] = false;
    result["errors"] = json::array();
    result["path"] = path;

    try {
        config::Config cfg = config::Config::load(path);
        cfg.validate();
        result["valid"] = true;
    } catch (const DropSynthError& e) {
        result["errors"].push_back(e.what());
    } catch (const YAML::Exception& e) {
        result["errors"].push_back(std::string("YAML error: ") + e.what());
    }

    print_json(result);
    if (strict_exit) {
        return result["valid"].get<bool>() ? 0 : 1;
    }
    return 0;
}

// ============================================================================
// generate --input DIR --output-image DIR [...]
// ============================================================================
struct GenerateOptions {
    std::string input_dir;
    std::string output_image_dir;
    std::string output_label_dir;
    std::string config_path;
    std::string preset;
    std::string seed;
    std::string label_input;
    std::string events_log;
};

static config::Config resolve_config(const GenerateOptions& opts) {
    config::Config cfg;
    if (!opts.config_path.empty()) {
        cfg = config::Config::load(opts.config_path);
    } else if (!opts.preset.empty()) {
        cfg = config::Config::preset(opts.preset);
    }
    if (!opts.seed.empty()) {
        try {
            cfg.random.seed = std::stoll(opts.seed);
        } catch (const std::exception&) {
            throw ConfigError("--seed expects an integer, got '" + opts.seed + "'");
        }
    }
    if (!opts.output_label_dir.empty()) {
        cfg.label.return_label = true;
    }
    cfg.validate();
    return cfg;
}

int cmd_generate(const GenerateOptions& opts) {
    config::Config cfg;
    std::vector<fs::path> images;
    cv::Mat external_label;
    try {
        cfg = resolve_config(opts);
        std::error_code ec;
        if (!fs::is_directory(opts.input_dir, ec)) {
            throw IOError("Input directory not found: " + opts.input_dir);
        }
        images = core::discover_images(opts.input_dir);
        if (!opts.label_input.empty()) {
            external_label = io::read_label(opts.label_input);
        }
    } catch (const DropSynthError& e) {
        std::cerr << "generate: " << e.what() << std::endl;
        return 2;
    }

    std::ofstream event_log_file;
    if (!opts.events_log.empty()) {
        fs::path log_path(opts.events_log);
        if (log_path.has_parent_path()) {
            std::error_code ec;
            fs::create_directories(log_path.parent_path(), ec);
            if (ec) {
                std::cerr << "generate: cannot create " << log_path.parent_path().string()
                          << ": " << ec.message() << std::endl;
                return 2;
            }
        }
        event_log_file.open(log_path);
        if (!event_log_file) {
            std::cerr << "generate: cannot open events log " << opts.events_log << std::endl;
            return 2;
        }
    }
    runner::EventEmitter emitter(std::cout, event_log_file.is_open() ? &event_log_file : nullptr);

    RandomSource rng = pipeline::make_random_source(cfg);
    const std::string run_id = core::get_run_id();
    const int total = static_cast<int>(images.size());

    emitter.run_start(run_id, {
        {"input_dir", opts.input_dir},
        {"output_image_dir", opts.output_image_dir},
        {"output_label_dir", opts.output_label_dir},
        {"images", total},
        {"seed", rng.seed()},
        {"external_label", !external_label.empty()}
    });

    int failed = 0;
    for (int i = 0; i < total; ++i) {
        const fs::path& src = images[static_cast<size_t>(i)];
        const std::string name = src.filename().string();
        try {
            cv::Mat image = io::read_rgb(src);
            pipeline::DropResult result = external_label.empty()
                ? pipeline::generate_drops(image, cfg, rng)
                : pipeline::generate_drops_with_label(image, external_label, cfg, rng);

            fs::path out_image = fs::path(opts.output_image_dir) / src.filename();
            io::write_rgb(out_image, result.image);

            json extra = {
                {"droplets", result.droplets.size()},
                {"collision_pairs", result.collisions.pair_count()},
                {"warp_fallbacks", result.warp_fallbacks},
                {"output_image", out_image.string()}
            };
            if (!opts.output_label_dir.empty()) {
                fs::path out_label = fs::path(opts.output_label_dir) / src.filename();
                out_label.replace_extension(".png");
                io::write_label(out_label, result.label);
                extra["output_label"] = out_label.string();
            }
            emitter.image_done(run_id, i, total, name, extra);
        } catch (const DropSynthError& e) {
            ++failed;
            emitter.image_failed(run_id, i, total, name, e.what());
        } catch (const cv::Exception& e) {
            ++failed;
            emitter.image_failed(run_id, i, total, name, std::string("OpenCV error: ") + e.what());
        }
    }

    const bool success = failed == 0;
    emitter.run_end(run_id, success, {
        {"images", total},
        {"succeeded", total - failed},
        {"failed", failed}
    });
    return success ? 0 : 1;
}

// ============================================================================
// Main
// ============================================================================
void print_usage() {
    std::cout << "Usage: drop_synth_cli <command> [options]\n"
              << "\nCommands:\n"
              << "  get-schema                      Print JSON schema for config\n"
              << "  validate-config --path P [--strict-exit-codes]  Validate config\n"
              << "  generate --input DIR --output-image DIR [--output-label DIR]\n"
              << "           [--config P | --preset NAME] [--seed N] [--label-input FILE]\n"
              << "           [--events-log FILE]    Overlay raindrops on every image in DIR\n"
              << "\nPresets:";
    for (const auto& name : config::preset_names()) {
        std::cout << " " << name;
    }
    std::cout << "\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string command = argv[1];

    // Helper to find argument value
    auto get_arg = [&](const char* name) -> std::string {
        for (int i = 2; i < argc - 1; ++i) {
            if (std::strcmp(argv[i], name) == 0) {
                return argv[i + 1];
            }
        }
        return "";
    };

    auto has_flag = [&](const char* name) -> bool {
        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], name) == 0) return true;
        }
        return false;
    };

    if (command == "get-schema") {
        return cmd_get_schema();
    }

    if (command == "validate-config") {
        std::string path = get_arg("--path");
        if (path.empty()) {
            std::cerr << "validate-config requires --path\n";
            return 1;
        }
        return cmd_validate_config(path, has_flag("--strict-exit-codes"));
    }

    if (command == "generate") {
        GenerateOptions opts;
        opts.input_dir = get_arg("--input");
        opts.output_image_dir = get_arg("--output-image");
        opts.output_label_dir = get_arg("--output-label");
        opts.config_path = get_arg("--config");
        opts.preset = get_arg("--preset");
        opts.seed = get_arg("--seed");
        opts.label_input = get_arg("--label-input");
        opts.events_log = get_arg("--events-log");

        if (opts.input_dir.empty() || opts.output_image_dir.empty()) {
            std::cerr << "generate requires --input and --output-image\n";
            return 1;
        }
        if (!opts.config_path.empty() && !opts.preset.empty()) {
            std::cerr << "generate accepts either --config or --preset, not both\n";
            return 1;
        }
        return cmd_generate(opts);
    }

    std::cerr << "Unknown command: " << command << std::endl;
    print_usage();
    return 1;
}
