#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace netgrave {

// Refresh cadence bounds
constexpr uint64_t MIN_REFRESH_MS = 50;
constexpr uint64_t MAX_REFRESH_MS = 10000;
constexpr uint64_t REFRESH_STEP_MS = 50;
constexpr uint64_t DEFAULT_REFRESH_MS = 500;
constexpr uint64_t MIN_DATA_MULTIPLIER = 1;
constexpr uint64_t MAX_DATA_MULTIPLIER = 60;
constexpr uint64_t DATA_MULTIPLIER_STEP = 1;
constexpr uint64_t DEFAULT_DATA_MULTIPLIER = 10;

struct Config {
    std::string proc_root = "/proc"; // root of the proc filesystem (fixture trees in tests)
    std::string protocol; // "tcp" | "udp" | empty=both
    bool include_ipv6 = true;
    int max_sockets = 0; // 0 = unlimited
    // Refresh cadence
    uint64_t refresh_ms = DEFAULT_REFRESH_MS; // UI tick interval
    uint64_t data_multiplier = DEFAULT_DATA_MULTIPLIER; // data-scan interval = refresh_ms * data_multiplier
    // Latency ring thresholds
    uint64_t latency_low_ms = 50;
    uint64_t latency_high_ms = 200;
    // Endpoint ceilings
    size_t max_visible_endpoints = 12; // dense map view
    size_t max_list_endpoints = 64; // list view
    bool list_view = false;
    // Suspicion rules
    std::string rules_dir; // empty = no rules
    std::optional<int> focus_pid; // start in focus mode on this pid
    std::string host_name; // shown on the centre node; empty = unknown
    // Headless canvas used when no renderer supplies one
    int canvas_width = 100;
    int canvas_height = 100;
    // Output
    bool once = false;
    int iterations = 0; // 0 = run until stopped
    std::string output_file;
    bool pretty = false;
    // Privilege reduction
    bool drop_priv = false;
    bool keep_cap_dac = false;
    bool seccomp = false;
    bool seccomp_strict = false;
    std::string log_level = "info";
};

}
