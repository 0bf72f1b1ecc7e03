#pragma once
#include "Connection.h"
#include "Severity.h"
#include <string>
#include <vector>
#include <set>
#include <map>
#include <optional>

namespace netgrave {

enum class Locality { Loopback, Private, Public, ListenOnly };
enum class LatencyBucket { Low, Medium, High, Unknown };

const char* locality_name(Locality l);
bool parse_locality(const std::string& name, Locality& out);
const char* latency_bucket_name(LatencyBucket b);

// Per-connection classifier output, parallel to the connection list.
struct Classification {
    Locality locality = Locality::Public;
    size_t repeat_count = 0; // connections sharing this remote address
    std::set<std::string> matched_rules;
    std::set<std::string> tags;
    std::optional<Severity> max_severity; // empty when no rule matched
};

struct Point {
    double x = 0.0;
    double y = 0.0;
};

struct Endpoint {
    std::string remote_addr;
    size_t conn_count = 0;
    ConnectionState dominant_state = ConnectionState::Unknown;
    Locality locality = Locality::Public;
    LatencyBucket latency = LatencyBucket::Unknown;
    bool heavy_talker = false;
    std::set<std::string> suspicion; // matched rule ids across members
    std::set<std::string> tags;
    std::optional<Severity> max_severity;
    Point position;
};

struct CenterNode {
    std::string label = "HOST";
    std::optional<int> pid; // set in focus mode
};

struct GraphSummary {
    size_t total_connections = 0;
    size_t listen_count = 0;
    size_t endpoint_count = 0; // distinct endpoints before bounding
    size_t suspicious_count = 0; // connections matching at least one rule
    std::map<ConnectionState, size_t> state_counts;
    std::set<std::string> tags;
    std::optional<Severity> max_severity;
};

// One complete aggregation pass. Replaced wholesale each cycle.
struct Graph {
    CenterNode center;
    std::vector<Endpoint> endpoints; // ranked, bounded
    size_t dropped = 0; // endpoints beyond the visible ceiling
    GraphSummary summary;
};

}
