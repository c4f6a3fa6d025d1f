#include "capbox/config.hpp"
#include "capbox/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace capbox {

namespace {

struct SizeKey {
    const char* name;
    size_t EngineConfig::*field;
};

struct RealKey {
    const char* name;
    double EngineConfig::*field;
};

const SizeKey SIZE_KEYS[] = {
    {"MIN_ANNOTATIONS_FOR_RETRAIN", &EngineConfig::min_annotations_for_retrain},
    {"MIN_SAMPLES_FOR_IMPORTANCE", &EngineConfig::min_samples_for_importance},
    {"BATCH_SIZE", &EngineConfig::batch_size},
    {"MAX_BOXES_PER_UPDATE", &EngineConfig::max_boxes_per_update},
    {"REVERSAL_WINDOW_SIZE", &EngineConfig::reversal_window_size},
    {"MIN_BOXES_BEFORE_CHECK", &EngineConfig::min_boxes_before_check},
    {"ANNOTATION_COUNT_THRESHOLD", &EngineConfig::annotation_count_threshold},
    {"HIGH_RATE_MIN_ANNOTATIONS", &EngineConfig::high_rate_min_annotations},
};

const RealKey REAL_KEYS[] = {
    {"MIN_STD", &EngineConfig::min_std},
    {"MAX_MAHALANOBIS_DISTANCE", &EngineConfig::max_mahalanobis_distance},
    {"UNCERTAINTY_WEIGHT", &EngineConfig::uncertainty_weight},
    {"SIMILARITY_WEIGHT", &EngineConfig::similarity_weight},
    {"BOUNDARY_SENSITIVITY_WEIGHT", &EngineConfig::boundary_sensitivity_weight},
    {"MIN_CHANGE_PROBABILITY", &EngineConfig::min_change_probability},
    {"TARGET_REVERSAL_RATE", &EngineConfig::target_reversal_rate},
    {"MIN_RETRAIN_INTERVAL_SECONDS", &EngineConfig::min_retrain_interval_seconds},
    {"HIGH_ANNOTATION_RATE_PER_MINUTE", &EngineConfig::high_annotation_rate_per_minute},
    {"MAX_RETRAIN_INTERVAL_SECONDS", &EngineConfig::max_retrain_interval_seconds},
};

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

size_t parse_size(const std::string& key, const std::string& value) {
    const std::string v = trim(value);
    if (v.empty() || v[0] == '-') {
        throw ConfigError(key + " expects a non-negative integer, got '" + value + "'");
    }
    size_t pos = 0;
    unsigned long long parsed = 0;
    try {
        parsed = std::stoull(v, &pos);
    } catch (const std::exception&) {
        throw ConfigError(key + " expects a non-negative integer, got '" + value + "'");
    }
    if (pos != v.size()) {
        throw ConfigError(key + " expects a non-negative integer, got '" + value + "'");
    }
    return static_cast<size_t>(parsed);
}

double parse_real(const std::string& key, const std::string& value) {
    const std::string v = trim(value);
    size_t pos = 0;
    double parsed = 0.0;
    try {
        parsed = std::stod(v, &pos);
    } catch (const std::exception&) {
        throw ConfigError(key + " expects a number, got '" + value + "'");
    }
    if (pos != v.size()) {
        throw ConfigError(key + " expects a number, got '" + value + "'");
    }
    return parsed;
}

void require(bool ok, const std::string& msg) {
    if (!ok) throw ConfigError(msg);
}

}  // namespace

const std::vector<std::string>& EngineConfig::keys() {
    static const std::vector<std::string> all = [] {
        std::vector<std::string> k;
        for (const auto& e : SIZE_KEYS) k.emplace_back(e.name);
        for (const auto& e : REAL_KEYS) k.emplace_back(e.name);
        return k;
    }();
    return all;
}

void EngineConfig::set(const std::string& key, const std::string& value) {
    std::string upper = trim(key);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "NUM_FEATURES") {
        throw ConfigError("NUM_FEATURES is fixed by the feature layout and cannot be overridden");
    }
    for (const auto& e : SIZE_KEYS) {
        if (upper == e.name) {
            this->*(e.field) = parse_size(upper, value);
            return;
        }
    }
    for (const auto& e : REAL_KEYS) {
        if (upper == e.name) {
            this->*(e.field) = parse_real(upper, value);
            return;
        }
    }
    throw ConfigError("unknown key '" + key + "'");
}

void EngineConfig::load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("cannot open config file: " + path);
    }

    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        size_t hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        line = trim(line);
        if (line.empty()) continue;

        size_t sep = line.find('=');
        if (sep == std::string::npos) sep = line.find_first_of(" \t");
        if (sep == std::string::npos) {
            throw ConfigError(path + ":" + std::to_string(line_no) + ": expected KEY=VALUE");
        }
        set(line.substr(0, sep), line.substr(sep + 1));
    }
}

void EngineConfig::apply_env_overrides() {
    for (const auto& key : keys()) {
        const std::string var = "CAPBOX_" + key;
        const char* value = std::getenv(var.c_str());
        if (value && *value) {
            set(key, value);
        }
    }
}

void EngineConfig::validate() const {
    require(min_std > 0.0, "MIN_STD must be > 0");
    require(max_mahalanobis_distance > 0.0, "MAX_MAHALANOBIS_DISTANCE must be > 0");
    require(uncertainty_weight >= 0.0 && similarity_weight >= 0.0 &&
                boundary_sensitivity_weight >= 0.0,
            "change-probability weights must be non-negative");
    require(uncertainty_weight + similarity_weight + boundary_sensitivity_weight <= 1.0 + 1e-9,
            "change-probability weights must sum to at most 1");
    require(min_change_probability >= 0.0 && min_change_probability <= 1.0,
            "MIN_CHANGE_PROBABILITY must be in [0, 1]");
    require(target_reversal_rate >= 0.0 && target_reversal_rate <= 1.0,
            "TARGET_REVERSAL_RATE must be in [0, 1]");
    require(batch_size > 0, "BATCH_SIZE must be > 0");
    require(max_boxes_per_update > 0, "MAX_BOXES_PER_UPDATE must be > 0");
    require(reversal_window_size > 0, "REVERSAL_WINDOW_SIZE must be > 0");
    require(min_retrain_interval_seconds >= 0.0 && max_retrain_interval_seconds >= 0.0,
            "retrain intervals must be non-negative");
}

std::string EngineConfig::to_string() const {
    std::ostringstream oss;
    for (const auto& e : SIZE_KEYS) {
        oss << e.name << "=" << this->*(e.field) << "\n";
    }
    for (const auto& e : REAL_KEYS) {
        oss << e.name << "=" << this->*(e.field) << "\n";
    }
    return oss.str();
}

}  // namespace capbox
