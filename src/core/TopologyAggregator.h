#pragma once
#include "Topology.h"
#include "Connection.h"
#include "EndpointClassifier.h"
#include <vector>
#include <string>
#include <unordered_map>
#include <optional>

namespace netgrave {

constexpr size_t DEFAULT_MAX_VISIBLE_ENDPOINTS = 12;
constexpr size_t HEAVY_TALKER_RANK = 5;

struct AggregateOptions {
    size_t max_visible = DEFAULT_MAX_VISIBLE_ENDPOINTS;
    LatencyThresholds latency;
    std::unordered_map<std::string, uint64_t> latency_samples; // remote addr -> ms
    std::optional<int> focus_pid; // labels the centre node only; filtering happens upstream
    std::string host_label = "HOST";
};

// Heavy-talker flags for counts ranked descending. With at least
// HEAVY_TALKER_RANK entries every count >= the 5th highest is flagged;
// with fewer, only the first (largest) entry is.
std::vector<bool> heavy_talkers(const std::vector<size_t>& ranked_counts);

// Dominant state of an endpoint's members: highest display rank wins.
ConnectionState dominant_state(const std::vector<ConnectionState>& states);

// "HOST", or "HOST (name)" when the host name is known.
std::string host_label(const std::string& hostname);

std::string center_label(const std::vector<Connection>& connections, const AggregateOptions& opts);

// Groups connections by remote address into a bounded, ranked Graph.
// `classifications` must be parallel to `connections`. Summary counters cover
// every connection, not only the visible endpoints.
Graph aggregate(const std::vector<Connection>& connections,
                const std::vector<Classification>& classifications,
                const AggregateOptions& opts);

}
