#include "core/config.hpp"

#include <cmath>
#include <fstream>
#include <sstream>
#include <utility>

#include <opencv2/core.hpp>

namespace framegov {

namespace {

template <typename T>
void readOrDefault(const cv::FileNode& node, const char* key, T& out) {
    const cv::FileNode child = node[key];
    if (!child.empty()) {
        child >> out;
    }
}

void readBoolOrDefault(const cv::FileNode& node, const char* key, bool& out) {
    const cv::FileNode child = node[key];
    if (child.empty()) {
        return;
    }
    if (child.isString()) {
        const std::string s = static_cast<std::string>(child);
        out = (s == "true" || s == "True" || s == "1");
        return;
    }
    int v = out ? 1 : 0;
    child >> v;
    out = (v != 0);
}

std::string trim(const std::string& s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) {
        return {};
    }
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::string unquote(std::string v) {
    v = trim(v);
    if (v.size() >= 2) {
        if ((v.front() == '"' && v.back() == '"') || (v.front() == '\'' && v.back() == '\'')) {
            v = v.substr(1, v.size() - 2);
        }
    }
    return v;
}

bool toBool(const std::string& v, bool& out) {
    const std::string t = trim(v);
    if (t == "true" || t == "True" || t == "1") {
        out = true;
        return true;
    }
    if (t == "false" || t == "False" || t == "0") {
        out = false;
        return true;
    }
    return false;
}

bool loadConfigPlainYaml(const std::string& path, AppConfig& out, std::string& error) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        error = "failed to open config file: " + path;
        return false;
    }

    std::string section;
    std::string line;
    while (std::getline(ifs, line)) {
        std::string t = trim(line);
        if (t.empty() || t[0] == '#') {
            continue;
        }

        // section header, e.g. "governor:"
        if (t.back() == ':' && t.find(' ') == std::string::npos) {
            section = t.substr(0, t.size() - 1);
            continue;
        }

        const auto colon = t.find(':');
        if (colon == std::string::npos || section.empty()) {
            continue;
        }

        const std::string key = trim(t.substr(0, colon));
        std::string value = trim(t.substr(colon + 1));
        const auto hash = value.find(" #");
        if (hash != std::string::npos) {
            value = trim(value.substr(0, hash));
        }
        value = unquote(value);

        try {
            if (section == "governor") {
                auto& g = out.governor;
                if (key == "adaptive_enable") {
                    bool b = g.adaptive_enable;
                    if (toBool(value, b)) g.adaptive_enable = b;
                } else if (key == "adaptive_check_period_ms") g.adaptive_check_period_ms = std::stoi(value);
                else if (key == "reporting_enable") {
                    bool b = g.reporting_enable;
                    if (toBool(value, b)) g.reporting_enable = b;
                } else if (key == "report_period_ms") g.report_period_ms = std::stoi(value);
                else if (key == "collaborator_timeout_ms") g.collaborator_timeout_ms = std::stoi(value);
                else if (key == "target_fps") g.target_fps = std::stod(value);
                else if (key == "min_acceptable_fps") g.min_acceptable_fps = std::stod(value);
                else if (key == "recovery_fraction") g.recovery_fraction = std::stod(value);
                else if (key == "memory_critical_mb") g.memory_critical_mb = std::stod(value);
                else if (key == "memory_warning_mb") g.memory_warning_mb = std::stod(value);
                else if (key == "low_power_scale_new") g.low_power_scale_new = std::stod(value);
                else if (key == "low_power_scale_live") g.low_power_scale_live = std::stod(value);
                else if (key == "long_animation_ms") g.long_animation_ms = std::stoi(value);
            } else if (section == "host") {
                if (key == "frame_source") out.host.frame_source = value;
                else if (key == "synthetic_frame_ms") out.host.synthetic_frame_ms = std::stod(value);
                else if (key == "synthetic_jitter_ms") out.host.synthetic_jitter_ms = std::stod(value);
                else if (key == "cache_capacity") out.host.cache_capacity = std::stoi(value);
                else if (key == "cache_ttl_ms") out.host.cache_ttl_ms = std::stoi(value);
            } else if (section == "control") {
                if (key == "enable") {
                    bool b = out.control.enable;
                    if (toBool(value, b)) out.control.enable = b;
                } else if (key == "socket_path") out.control.socket_path = value;
            }
        } catch (const std::exception&) {
            // keep defaults/previous values on parse failure
        }
    }

    return validateConfig(out, error);
}

}  // namespace

bool validateGovernorConfig(const GovernorConfig& cfg, std::string& error) {
    // NaN compares false against everything, so check before any ordering test
    const std::pair<const char*, double> thresholds[] = {
        {"target_fps", cfg.target_fps},
        {"min_acceptable_fps", cfg.min_acceptable_fps},
        {"recovery_fraction", cfg.recovery_fraction},
        {"memory_critical_mb", cfg.memory_critical_mb},
        {"memory_warning_mb", cfg.memory_warning_mb},
        {"low_power_scale_new", cfg.low_power_scale_new},
        {"low_power_scale_live", cfg.low_power_scale_live},
    };
    for (const auto& t : thresholds) {
        if (!std::isfinite(t.second)) {
            error = std::string("governor.") + t.first + " must be a finite number";
            return false;
        }
    }
    if (cfg.adaptive_check_period_ms <= 0) {
        error = "governor.adaptive_check_period_ms must be > 0";
        return false;
    }
    if (cfg.report_period_ms <= 0) {
        error = "governor.report_period_ms must be > 0";
        return false;
    }
    if (cfg.collaborator_timeout_ms < 0) {
        error = "governor.collaborator_timeout_ms must be >= 0";
        return false;
    }
    if (!(cfg.target_fps > 0.0) || cfg.target_fps > 120.0) {
        error = "governor.target_fps must be in (0,120]";
        return false;
    }
    if (!(cfg.recovery_fraction > 0.0) || cfg.recovery_fraction > 1.0) {
        error = "governor.recovery_fraction must be in (0,1]";
        return false;
    }
    if (!(cfg.min_acceptable_fps > 0.0) || cfg.min_acceptable_fps >= cfg.lowPowerExitFps()) {
        error = "governor.min_acceptable_fps must be > 0 and below target_fps * recovery_fraction";
        return false;
    }
    if (!(cfg.memory_warning_mb > 0.0) || cfg.memory_warning_mb >= cfg.memory_critical_mb) {
        error = "governor.memory_warning_mb must be > 0 and below memory_critical_mb";
        return false;
    }
    auto inScaleRange = [](double s) { return s > 0.0 && s <= 1.0; };
    if (!inScaleRange(cfg.low_power_scale_new) || !inScaleRange(cfg.low_power_scale_live)) {
        error = "governor.low_power_scale_* must be in (0,1]";
        return false;
    }
    if (cfg.long_animation_ms < 0) {
        error = "governor.long_animation_ms must be >= 0";
        return false;
    }
    error.clear();
    return true;
}

bool validateConfig(const AppConfig& cfg, std::string& error) {
    if (!validateGovernorConfig(cfg.governor, error)) {
        return false;
    }
    if (cfg.host.frame_source != "synthetic" && cfg.host.frame_source != "none") {
        error = "host.frame_source must be 'synthetic' or 'none'";
        return false;
    }
    if (!(cfg.host.synthetic_frame_ms > 0.0) || !std::isfinite(cfg.host.synthetic_frame_ms)) {
        error = "host.synthetic_frame_ms must be > 0";
        return false;
    }
    if (!(cfg.host.synthetic_jitter_ms >= 0.0) || cfg.host.synthetic_jitter_ms >= cfg.host.synthetic_frame_ms) {
        error = "host.synthetic_jitter_ms must be in [0, synthetic_frame_ms)";
        return false;
    }
    if (cfg.host.cache_capacity <= 0 || cfg.host.cache_ttl_ms <= 0) {
        error = "host.cache_capacity and host.cache_ttl_ms must be > 0";
        return false;
    }
    if (cfg.control.enable && cfg.control.socket_path.empty()) {
        error = "control.socket_path must not be empty when control.enable=true";
        return false;
    }
    error.clear();
    return true;
}

bool loadConfig(const std::string& path, AppConfig& out, std::string& error) {
    try {
        const cv::FileStorage fs(path, cv::FileStorage::READ);
        if (fs.isOpened()) {
            const cv::FileNode governor = fs["governor"];
            const cv::FileNode host = fs["host"];
            const cv::FileNode control = fs["control"];

            readBoolOrDefault(governor, "adaptive_enable", out.governor.adaptive_enable);
            readOrDefault(governor, "adaptive_check_period_ms", out.governor.adaptive_check_period_ms);
            readBoolOrDefault(governor, "reporting_enable", out.governor.reporting_enable);
            readOrDefault(governor, "report_period_ms", out.governor.report_period_ms);
            readOrDefault(governor, "collaborator_timeout_ms", out.governor.collaborator_timeout_ms);
            readOrDefault(governor, "target_fps", out.governor.target_fps);
            readOrDefault(governor, "min_acceptable_fps", out.governor.min_acceptable_fps);
            readOrDefault(governor, "recovery_fraction", out.governor.recovery_fraction);
            readOrDefault(governor, "memory_critical_mb", out.governor.memory_critical_mb);
            readOrDefault(governor, "memory_warning_mb", out.governor.memory_warning_mb);
            readOrDefault(governor, "low_power_scale_new", out.governor.low_power_scale_new);
            readOrDefault(governor, "low_power_scale_live", out.governor.low_power_scale_live);
            readOrDefault(governor, "long_animation_ms", out.governor.long_animation_ms);

            readOrDefault(host, "frame_source", out.host.frame_source);
            readOrDefault(host, "synthetic_frame_ms", out.host.synthetic_frame_ms);
            readOrDefault(host, "synthetic_jitter_ms", out.host.synthetic_jitter_ms);
            readOrDefault(host, "cache_capacity", out.host.cache_capacity);
            readOrDefault(host, "cache_ttl_ms", out.host.cache_ttl_ms);

            readBoolOrDefault(control, "enable", out.control.enable);
            readOrDefault(control, "socket_path", out.control.socket_path);

            return validateConfig(out, error);
        }
    } catch (const cv::Exception&) {
        // fall through to plain YAML parser below
    }

    return loadConfigPlainYaml(path, out, error);
}

}  // namespace framegov
