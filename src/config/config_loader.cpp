#include "internal/config/config_loader.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <string>

namespace vha {
namespace config {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

YAML::Node require(const YAML::Node& node, const std::string& key, const std::string& path) {
    YAML::Node child = node[key];
    if (!child || child.IsNull()) {
        throw ConfigError(ErrorCode::MISSING_FIELD,
            "Missing required field '" + path + "." + key + "'");
    }
    return child;
}

template <typename T>
T readValue(const YAML::Node& node, const std::string& key, const std::string& path) {
    YAML::Node child = require(node, key, path);
    try {
        return child.as<T>();
    } catch (const YAML::Exception& e) {
        throw ConfigError("Invalid value for '" + path + "." + key + "': " + e.what());
    }
}

template <typename T>
T readOptional(const YAML::Node& node, const std::string& key, const std::string& path, T fallback) {
    if (!node || !node[key]) {
        return fallback;
    }
    return readValue<T>(node, key, path);
}

// 时间常数可以是标量或序列 (取第一个值)
double readTimeConstant(const YAML::Node& node, const std::string& key, const std::string& path) {
    YAML::Node child = require(node, key, path);
    if (child.IsSequence()) {
        if (child.size() == 0) {
            throw ConfigError("Time constant '" + path + "." + key + "' must not be an empty list");
        }
        YAML::Node first = child[0];
        try {
            return first.as<double>();
        } catch (const YAML::Exception& e) {
            throw ConfigError("Invalid value for '" + path + "." + key + "[0]': " + e.what());
        }
    }
    if (!child.IsScalar()) {
        throw ConfigError("Time constant '" + path + "." + key + "' must be either a number or a list");
    }
    return readValue<double>(node, key, path);
}

FrontendConfig parseFrontend(const YAML::Node& node) {
    const std::string path = "parameters.frontend";
    FrontendConfig frontend;
    frontend.type = readOptional<std::string>(node, "type", path, frontend.type);
    frontend.name = readOptional<std::string>(node, "name", path, frontend.name);
    frontend.buffer_size_s = readValue<double>(node, "buffer_size_s", path);
    frontend.nbands = readValue<int>(node, "nbands", path);
    frontend.fs = readValue<double>(node, "fs", path);
    frontend.spl_reference_db = readValue<double>(node, "spl_reference_db", path);
    frontend.spl_power_estimate_lower_bound_db = readValue<double>(node, "spl_power_estimate_lower_bound_db", path);
    frontend.apcoefficient = readValue<double>(node, "apcoefficient", path);
    return frontend;
}

SemBackendConfig parseSemBackend(const YAML::Node& node) {
    const std::string path = "parameters.backend";
    SemBackendConfig backend;

    YAML::Node general = require(node, "general", path);
    backend.name = readValue<std::string>(general, "name", path + ".general");
    backend.type = readValue<std::string>(general, "type", path + ".general");

    YAML::Node inference = require(node, "inference", path);
    backend.iterations = readValue<int>(inference, "iterations", path + ".inference");
    backend.autostart = readValue<bool>(inference, "autostart", path + ".inference");
    backend.free_energy = readValue<bool>(inference, "free_energy", path + ".inference");

    YAML::Node filters = require(node, "filters", path);
    const std::string tc_path = path + ".filters.time_constants90";
    YAML::Node tc = require(filters, "time_constants90", path + ".filters");
    backend.tau_speech_ms = readTimeConstant(tc, "s", tc_path);
    backend.tau_noise_ms = readTimeConstant(tc, "n", tc_path);
    backend.tau_xnr_ms = readTimeConstant(tc, "xnr", tc_path);

    YAML::Node priors = require(node, "priors", path);
    YAML::Node speech = require(priors, "speech", path + ".priors");
    YAML::Node noise = require(priors, "noise", path + ".priors");
    backend.speech_prior_mean = readValue<double>(speech, "mean", path + ".priors.speech");
    backend.speech_prior_precision = readValue<double>(speech, "precision", path + ".priors.speech");
    backend.noise_prior_mean = readValue<double>(noise, "mean", path + ".priors.noise");
    backend.noise_prior_precision = readValue<double>(noise, "precision", path + ".priors.noise");

    YAML::Node gain = node["gain"];
    backend.gain_threshold_db = readOptional<double>(gain, "threshold", path + ".gain", 12.0);
    backend.gain_slope = readOptional<double>(gain, "slope", path + ".gain", 1.0);

    YAML::Node gate = node["switch"];
    backend.switch_threshold_db = readOptional<double>(gate, "threshold", path + ".switch", 0.0);
    backend.switch_slope = readOptional<double>(gate, "slope", path + ".switch", 1.0);

    if (node["smoothing"]) {
        backend.smoothing = parseSmoothingMode(readValue<std::string>(node, "smoothing", path));
    }
    return backend;
}

HearingAidConfig parseRoot(const YAML::Node& root) {
    YAML::Node parameters = require(root, "parameters", "<root>");

    HearingAidConfig config;
    YAML::Node hearingaid = require(parameters, "hearingaid", "parameters");
    config.type = parseHearingAidType(readValue<std::string>(hearingaid, "type", "parameters.hearingaid"));
    config.name = readOptional<std::string>(hearingaid, "name", "parameters.hearingaid",
                                            hearingAidTypeToString(config.type));
    if (hearingaid["processing_strategy"]) {
        config.processing_strategy = parseProcessingStrategy(
            readValue<std::string>(hearingaid, "processing_strategy", "parameters.hearingaid"));
    } else {
        config.processing_strategy = HearingAidConfig::defaultStrategy(config.type);
    }

    config.frontend = parseFrontend(require(parameters, "frontend", "parameters"));
    if (config.type == HearingAidType::SEM) {
        config.backend = parseSemBackend(require(parameters, "backend", "parameters"));
    }

    auto err = config.validate();
    if (!err.isOk()) {
        throw ConfigError(err.code, err.message);
    }
    return config;
}

}  // namespace

// =============================================================================
// 加载
// =============================================================================

HearingAidConfig loadHearingAidConfig(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::BadFile&) {
        throw ConfigError(ErrorCode::FILE_READ_ERROR, "Failed to open config file: " + path);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to parse config file " + path + ": " + e.what());
    }
    return parseRoot(root);
}

HearingAidConfig parseHearingAidConfig(const std::string& yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Failed to parse config: ") + e.what());
    }
    return parseRoot(root);
}

// =============================================================================
// 名称解析
// =============================================================================

ProcessingStrategy parseProcessingStrategy(const std::string& name) {
    const std::string s = toLower(name);
    if (s == "streaming" || s == "stream") {
        return ProcessingStrategy::STREAMING;
    }
    if (s == "batchprocessingonline" || s == "online" || s == "batch_online") {
        return ProcessingStrategy::BATCH_ONLINE;
    }
    if (s == "batchprocessingoffline" || s == "offline" || s == "batch_offline") {
        return ProcessingStrategy::BATCH_OFFLINE;
    }
    throw ConfigError("Unknown processing strategy '" + name +
        "', expected streaming, online or offline");
}

HearingAidType parseHearingAidType(const std::string& name) {
    const std::string s = toLower(name);
    if (s == "semhearingaid" || s == "sem") {
        return HearingAidType::SEM;
    }
    if (s == "baselinehearingaid" || s == "baseline") {
        return HearingAidType::BASELINE;
    }
    throw ConfigError("Unknown hearing aid type '" + name + "', expected SEMHearingAid or BaselineHearingAid");
}

SmoothingMode parseSmoothingMode(const std::string& name) {
    const std::string s = toLower(name);
    if (s == "none") {
        return SmoothingMode::NONE;
    }
    if (s == "xi_smooth" || s == "xismooth") {
        return SmoothingMode::XI_SMOOTH;
    }
    throw ConfigError("Unknown smoothing mode '" + name + "', expected none or xi_smooth");
}

}  // namespace config
}  // namespace vha
