#pragma once

#include "drop_synth/core/types.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace drop_synth::config {

namespace fs = std::filesystem;

struct DropsConfig {
  int min_radius = 30;
  int max_radius = 50;
  int min_count = 30;
  int max_count = 30;
};

struct ShapeConfig {
  bool variety = true; // false => every droplet uses `fixed`
  ShapeKind fixed = ShapeKind::DEFAULT;
  std::vector<ShapeKind> allowed = all_shape_kinds();
};

struct ComposeConfig {
  float edge_dark_ratio = 0.3f; // rim darkening strength, [0,1]
};

struct LabelConfig {
  bool return_label = false;
  int threshold = 128; // coverage threshold in alpha units, [0,255]
};

struct AugmentConfig {
  float probability = 1.0f;
  ChannelOrder channel_order = ChannelOrder::RGB;
};

struct RandomConfig {
  std::int64_t seed = -1; // < 0 => seed from entropy
};

struct Config {
  DropsConfig drops;
  ShapeConfig shape;
  ComposeConfig compose;
  LabelConfig label;
  AugmentConfig augment;
  RandomConfig random;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);
  static Config preset(const std::string &name);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

std::vector<std::string> preset_names();

std::string get_schema_json();

} // namespace drop_synth::config
