#include "drop_synth/config/configuration.hpp"
#include "drop_synth/core/errors.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

namespace drop_synth::config {

static std::vector<ShapeKind> read_shape_list(const YAML::Node& n) {
    if (!n.IsSequence()) {
        throw ConfigError("shape.allowed must be a sequence");
    }
    std::vector<ShapeKind> out;
    for (const auto& it : n) {
        const std::string name = it.as<std::string>();
        auto kind = string_to_shape_kind(name);
        if (!kind) {
            throw ConfigError("Unknown droplet shape: " + name);
        }
        if (std::find(out.begin(), out.end(), *kind) == out.end()) {
            out.push_back(*kind);
        }
    }
    return out;
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    try {
        if (node["drops"]) {
            auto d = node["drops"];
            if (d["min_radius"]) cfg.drops.min_radius = d["min_radius"].as<int>();
            if (d["max_radius"]) cfg.drops.max_radius = d["max_radius"].as<int>();
            if (d["min_count"]) cfg.drops.min_count = d["min_count"].as<int>();
            if (d["max_count"]) cfg.drops.max_count = d["max_count"].as<int>();
        }

        if (node["shape"]) {
            auto s = node["shape"];
            if (s["variety"]) cfg.shape.variety = s["variety"].as<bool>();
            if (s["fixed"]) {
                const std::string name = s["fixed"].as<std::string>();
                auto kind = string_to_shape_kind(name);
                if (!kind) {
                    throw ConfigError("Unknown droplet shape: " + name);
                }
                cfg.shape.fixed = *kind;
            }
            if (s["allowed"]) cfg.shape.allowed = read_shape_list(s["allowed"]);
        }

        if (node["compose"]) {
            auto c = node["compose"];
            if (c["edge_dark_ratio"]) cfg.compose.edge_dark_ratio = c["edge_dark_ratio"].as<float>();
        }

        if (node["label"]) {
            auto l = node["label"];
            if (l["return_label"]) cfg.label.return_label = l["return_label"].as<bool>();
            if (l["threshold"]) cfg.label.threshold = l["threshold"].as<int>();
        }

        if (node["augment"]) {
            auto a = node["augment"];
            if (a["probability"]) cfg.augment.probability = a["probability"].as<float>();
            if (a["channel_order"]) {
                const std::string name = a["channel_order"].as<std::string>();
                auto order = string_to_channel_order(name);
                if (!order) {
                    throw ConfigError("augment.channel_order must be 'RGB' or 'BGR', got '" + name + "'");
                }
                cfg.augment.channel_order = *order;
            }
        }

        if (node["random"]) {
            auto r = node["random"];
            if (r["seed"]) cfg.random.seed = r["seed"].as<std::int64_t>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(e.what());
    }

    return cfg;
}

Config Config::preset(const std::string& name) {
    Config cfg;
    if (name == "default") {
        return cfg;
    }

    if (name == "pose_training" || name == "pose_stage1") {
        cfg.drops.min_radius = 15;
        cfg.drops.max_radius = 25;
        cfg.drops.min_count = 5;
        cfg.drops.max_count = 15;
        cfg.compose.edge_dark_ratio = (name == "pose_stage1") ? 0.25f : 0.2f;
        cfg.shape.variety = true;
        cfg.shape.allowed = {ShapeKind::DEFAULT, ShapeKind::ROUND,
                             ShapeKind::OVAL, ShapeKind::TEARDROP};
        cfg.augment.probability = 0.4f;
        return cfg;
    }

    throw ConfigError("Unknown preset: " + name);
}

std::vector<std::string> preset_names() {
    return {"default", "pose_training", "pose_stage1"};
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["drops"]["min_radius"] = drops.min_radius;
    node["drops"]["max_radius"] = drops.max_radius;
    node["drops"]["min_count"] = drops.min_count;
    node["drops"]["max_count"] = drops.max_count;

    node["shape"]["variety"] = shape.variety;
    node["shape"]["fixed"] = shape_kind_to_string(shape.fixed);
    node["shape"]["allowed"] = YAML::Node(YAML::NodeType::Sequence);
    for (ShapeKind kind : shape.allowed) {
        node["shape"]["allowed"].push_back(shape_kind_to_string(kind));
    }

    node["compose"]["edge_dark_ratio"] = compose.edge_dark_ratio;

    node["label"]["return_label"] = label.return_label;
    node["label"]["threshold"] = label.threshold;

    node["augment"]["probability"] = augment.probability;
    node["augment"]["channel_order"] = channel_order_to_string(augment.channel_order);

    node["random"]["seed"] = random.seed;

    return node;
}

void Config::validate() const {
    if (drops.min_radius <= 0) {
        throw ValidationError("drops.min_radius must be > 0");
    }
    if (drops.max_radius < drops.min_radius) {
        throw ValidationError("drops.max_radius must be >= drops.min_radius");
    }
    if (drops.min_count < 0) {
        throw ValidationError("drops.min_count must be >= 0");
    }
    if (drops.max_count < drops.min_count) {
        throw ValidationError("drops.max_count must be >= drops.min_count");
    }

    if (shape.variety && shape.allowed.empty()) {
        throw ValidationError("shape.allowed must not be empty when shape.variety is enabled");
    }

    if (!(compose.edge_dark_ratio >= 0.0f && compose.edge_dark_ratio <= 1.0f)) {
        throw ValidationError("compose.edge_dark_ratio must be in [0,1]");
    }

    if (label.threshold < 0 || label.threshold > 255) {
        throw ValidationError("label.threshold must be in [0,255]");
    }

    if (!(augment.probability >= 0.0f && augment.probability <= 1.0f)) {
        throw ValidationError("augment.probability must be in [0,1]");
    }
}

std::string get_schema_json() {
    return R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "properties": {
    "drops": {
      "type": "object",
      "properties": {
        "min_radius": {"type": "integer", "minimum": 1},
        "max_radius": {"type": "integer", "minimum": 1},
        "min_count": {"type": "integer", "minimum": 0},
        "max_count": {"type": "integer", "minimum": 0}
      }
    },
    "shape": {
      "type": "object",
      "properties": {
        "variety": {"type": "boolean"},
        "fixed": {"type": "string", "enum": ["default", "round", "oval", "teardrop", "irregular", "splash"]},
        "allowed": {
          "type": "array",
          "items": {"type": "string", "enum": ["default", "round", "oval", "teardrop", "irregular", "splash"]}
        }
      }
    },
    "compose": {
      "type": "object",
      "properties": {
        "edge_dark_ratio": {"type": "number", "minimum": 0, "maximum": 1}
      }
    },
    "label": {
      "type": "object",
      "properties": {
        "return_label": {"type": "boolean"},
        "threshold": {"type": "integer", "minimum": 0, "maximum": 255}
      }
    },
    "augment": {
      "type": "object",
      "properties": {
        "probability": {"type": "number", "minimum": 0, "maximum": 1},
        "channel_order": {"type": "string", "enum": ["RGB", "BGR"]}
      }
    },
    "random": {
      "type": "object",
      "properties": {
        "seed": {"type": "integer"}
      }
    }
  }
})";
}

} // namespace drop_synth::config
