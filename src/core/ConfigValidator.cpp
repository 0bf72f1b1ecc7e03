#include "ConfigValidator.h"
#include "Logging.h"
#include <iostream>
#include <algorithm>
#include <cctype>

namespace netgrave {

bool ConfigValidator::validate(Config& cfg) {
    std::transform(cfg.protocol.begin(), cfg.protocol.end(), cfg.protocol.begin(), [](unsigned char c){ return std::tolower(c); });
    if(!validate_protocol(cfg.protocol)) {
        std::cerr << "Invalid --protocol value: " << cfg.protocol << " (expected tcp or udp)\n";
        return false;
    }

    LogLevel lvl;
    if(!parse_log_level(cfg.log_level, lvl)) {
        std::cerr << "Invalid --log-level value: " << cfg.log_level << "\n";
        return false;
    }

    if(cfg.max_sockets < 0) {
        std::cerr << "--max-sockets must not be negative\n";
        return false;
    }

    if(cfg.latency_low_ms > cfg.latency_high_ms) {
        std::cerr << "--latency-low-ms must not exceed --latency-high-ms\n";
        return false;
    }

    if(cfg.max_visible_endpoints == 0 || cfg.max_list_endpoints == 0) {
        std::cerr << "Endpoint ceilings must be positive\n";
        return false;
    }
    // The list view ceiling is never smaller than the dense map ceiling
    if(cfg.max_list_endpoints < cfg.max_visible_endpoints) {
        cfg.max_list_endpoints = cfg.max_visible_endpoints;
    }

    if(cfg.canvas_width <= 0 || cfg.canvas_height <= 0) {
        std::cerr << "--canvas dimensions must be positive\n";
        return false;
    }

    if(cfg.keep_cap_dac && !cfg.drop_priv) {
        std::cerr << "--keep-cap-dac requires --drop-priv\n";
        return false;
    }
    if(cfg.seccomp_strict) cfg.seccomp = true;

    if(cfg.iterations < 0) {
        std::cerr << "--iterations must not be negative\n";
        return false;
    }
    if(cfg.once) cfg.iterations = 1;

    clamp_refresh(cfg);
    return true;
}

bool ConfigValidator::validate_protocol(const std::string& proto) const {
    return proto.empty() || proto == "tcp" || proto == "udp";
}

void ConfigValidator::clamp_refresh(Config& cfg) const {
    uint64_t refresh = std::clamp(cfg.refresh_ms, MIN_REFRESH_MS, MAX_REFRESH_MS);
    if(refresh != cfg.refresh_ms) {
        Logger::instance().warn("refresh interval clamped to " + std::to_string(refresh) + "ms");
        cfg.refresh_ms = refresh;
    }
    cfg.data_multiplier = std::clamp(cfg.data_multiplier, MIN_DATA_MULTIPLIER, MAX_DATA_MULTIPLIER);
}

}
