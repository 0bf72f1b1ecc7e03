#pragma once
#include "Connection.h"
#include "Topology.h"
#include "RuleEngine.h"
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <cstdint>

namespace netgrave {

struct LatencyThresholds {
    uint64_t low_ms = 50;
    uint64_t high_ms = 200;
};

// Remote-address locality, in precedence order:
// loopback, listen-only, private, public.
Locality classify(const Connection& conn);
Locality classify_address(const std::string& addr);

LatencyBucket classify_latency(std::optional<uint64_t> sample_ms, const LatencyThresholds& thresholds);

// Ids of every rule whose predicate holds for the connection.
std::set<std::string> evaluate_suspicion(const Connection& conn, const RuleEngine& rules,
                                         Locality locality, size_t repeat_count);

// Pure evaluator over a rule set; holds no state between calls.
class EndpointClassifier {
public:
    explicit EndpointClassifier(const RuleEngine& rules) : rules_(rules) {}

    // One Classification per connection, in input order. Repetition counts
    // are taken over the whole list.
    std::vector<Classification> classify_all(const std::vector<Connection>& connections) const;
private:
    const RuleEngine& rules_;
};

}
