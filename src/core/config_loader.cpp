/// @file src/core/config_loader.cpp
/// @brief yaml-cpp based configuration loading.

#include "wxs/config_loader.hpp"
#include "wxs/errors.hpp"
#include "wxs/logging.hpp"

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include <cmath>
#include <fstream>
#include <map>
#include <sstream>

namespace wxs::core {

namespace {

std::string join(const std::string& prefix, const std::string& key) {
    return prefix.empty() ? key : prefix + "." + key;
}

/// Flatten nested maps of numbers into dotted keys.
void flatten(const YAML::Node& node, const std::string& prefix,
             std::map<std::string, double>& out) {
    if (node.IsNull()) {
        return;
    }
    if (node.IsMap()) {
        for (const auto& entry : node) {
            flatten(entry.second, join(prefix, entry.first.as<std::string>()), out);
        }
        return;
    }
    if (!node.IsScalar()) {
        throw ConfigurationError(prefix, "expected a number or a mapping");
    }
    double value = 0.0;
    if (!YAML::convert<double>::decode(node, value) || !std::isfinite(value)) {
        throw ConfigurationError(prefix, fmt::format("'{}' is not a finite number", node.Scalar()));
    }
    if (!out.emplace(prefix, value).second) {
        throw ConfigurationError(prefix, "key given twice");
    }
}

YAML::Node load_document(const std::string& yaml) {
    try {
        return YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("", fmt::format("YAML error: {}", e.what()));
    }
}

std::string read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigurationError(path, "cannot open configuration file");
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

}  // namespace

// ── profiles ─────────────────────────────────────────────────────────────────

profile::UserProfile ConfigLoader::parse_profile(const std::string& yaml) {
    const YAML::Node doc = load_document(yaml);
    profile::UserProfile profile;
    if (doc.IsNull()) {
        return profile;
    }
    if (!doc.IsMap()) {
        throw ConfigurationError("", "profile document must be a mapping");
    }

    try {
        for (const auto& entry : doc) {
            const std::string key = entry.first.as<std::string>();
            if (key == "user" || key == "user_id") {
                profile.user_id = entry.second.as<std::string>("");
            } else if (key == "weights") {
                flatten(entry.second, "", profile.weights);
            } else if (key == "thresholds") {
                flatten(entry.second, "", profile.thresholds);
            } else {
                throw ConfigurationError(key, "unknown profile section");
            }
        }
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("", fmt::format("malformed profile: {}", e.what()));
    }

    WXS_DEBUG("loaded profile '{}' ({} weights, {} thresholds)",
              profile.user_id, profile.weights.size(), profile.thresholds.size());
    return profile;
}

profile::UserProfile ConfigLoader::load_profile(const std::string& path) {
    return parse_profile(read_file(path));
}

std::string ConfigLoader::emit_profile(const profile::UserProfile& profile) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "user" << YAML::Value << profile.user_id;

    out << YAML::Key << "weights" << YAML::Value << YAML::BeginMap;
    for (const auto& [key, value] : profile.weights) {
        out << YAML::Key << key << YAML::Value << value;
    }
    out << YAML::EndMap;

    out << YAML::Key << "thresholds" << YAML::Value << YAML::BeginMap;
    for (const auto& [key, value] : profile.thresholds) {
        out << YAML::Key << key << YAML::Value << value;
    }
    out << YAML::EndMap;

    out << YAML::EndMap;
    return out.c_str();
}

// ── catalog parameters ───────────────────────────────────────────────────────

catalog::CatalogParameters
ConfigLoader::parse_parameters(const std::string& yaml, const catalog::CatalogParameters& base) {
    const YAML::Node doc = load_document(yaml);
    std::map<std::string, double> values;
    if (!doc.IsNull() && !doc.IsMap()) {
        throw ConfigurationError("", "parameter document must be a mapping");
    }
    try {
        flatten(doc, "", values);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("", fmt::format("malformed parameters: {}", e.what()));
    }

    catalog::CatalogParameters params = base;
    for (const auto& [key, value] : values) {
        const catalog::ParameterSpec* spec = catalog::find_parameter(key);
        if (spec == nullptr) {
            throw ConfigurationError(key, "unknown catalog parameter");
        }
        spec->set(params, value);
    }
    catalog::validate_parameters(params);

    WXS_INFO("applied {} catalog parameter overrides", values.size());
    return params;
}

catalog::CatalogParameters
ConfigLoader::load_parameters(const std::string& path, const catalog::CatalogParameters& base) {
    return parse_parameters(read_file(path), base);
}

}  // namespace wxs::core
