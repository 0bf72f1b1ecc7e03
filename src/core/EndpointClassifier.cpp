#include "EndpointClassifier.h"
#include <unordered_map>
#include <arpa/inet.h>

namespace netgrave {

namespace {

bool parse_v4(const std::string& addr, unsigned char out[4]){
    return inet_pton(AF_INET, addr.c_str(), out) == 1;
}

bool parse_v6(const std::string& addr, unsigned char out[16]){
    return inet_pton(AF_INET6, addr.c_str(), out) == 1;
}

// ::ffff:a.b.c.d
bool v4_mapped(const unsigned char b[16], unsigned char v4[4]){
    for(int i = 0; i < 10; ++i) if(b[i] != 0) return false;
    if(b[10] != 0xff || b[11] != 0xff) return false;
    for(int i = 0; i < 4; ++i) v4[i] = b[12 + i];
    return true;
}

bool v4_loopback(const unsigned char b[4]){
    return b[0] == 127 || (b[0] == 0 && b[1] == 0 && b[2] == 0 && b[3] == 0);
}

bool v4_private(const unsigned char b[4]){
    if(b[0] == 10) return true;
    if(b[0] == 172 && b[1] >= 16 && b[1] <= 31) return true;
    if(b[0] == 192 && b[1] == 168) return true;
    return false;
}

bool v6_unspecified(const unsigned char b[16]){
    for(int i = 0; i < 16; ++i) if(b[i] != 0) return false;
    return true;
}

bool v6_loopback(const unsigned char b[16]){
    for(int i = 0; i < 15; ++i) if(b[i] != 0) return false;
    return b[15] == 1;
}

}

Locality classify_address(const std::string& addr){
    unsigned char v4[4];
    if(parse_v4(addr, v4)){
        if(v4_loopback(v4)) return Locality::Loopback;
        if(v4_private(v4)) return Locality::Private;
        return Locality::Public;
    }
    unsigned char v6[16];
    if(parse_v6(addr, v6)){
        if(v4_mapped(v6, v4)){
            if(v4_loopback(v4)) return Locality::Loopback;
            if(v4_private(v4)) return Locality::Private;
            return Locality::Public;
        }
        if(v6_loopback(v6)) return Locality::Loopback;
        if(v6_unspecified(v6)) return Locality::ListenOnly;
        if((v6[0] & 0xfe) == 0xfc) return Locality::Private;              // fc00::/7
        if(v6[0] == 0xfe && (v6[1] & 0xc0) == 0x80) return Locality::Private; // fe80::/10
        return Locality::Public;
    }
    // Not an address (empty or garbage): nothing on the far side
    return Locality::ListenOnly;
}

Locality classify(const Connection& conn){
    Locality by_addr = classify_address(conn.remote_addr);
    if(by_addr == Locality::Loopback) return Locality::Loopback;
    if(conn.state == ConnectionState::Listen) return Locality::ListenOnly;
    if(is_wildcard_address(conn.remote_addr) && conn.remote_port == 0) return Locality::ListenOnly;
    return by_addr;
}

LatencyBucket classify_latency(std::optional<uint64_t> sample_ms, const LatencyThresholds& thresholds){
    if(!sample_ms) return LatencyBucket::Unknown;
    if(*sample_ms < thresholds.low_ms) return LatencyBucket::Low;
    if(*sample_ms <= thresholds.high_ms) return LatencyBucket::Medium;
    return LatencyBucket::High;
}

std::set<std::string> evaluate_suspicion(const Connection& conn, const RuleEngine& rules,
                                         Locality locality, size_t repeat_count){
    std::set<std::string> ids;
    RuleSubject subject{conn, locality, repeat_count};
    for(const Rule* r : rules.match(subject)) ids.insert(r->id);
    return ids;
}

std::vector<Classification> EndpointClassifier::classify_all(const std::vector<Connection>& connections) const {
    std::unordered_map<std::string, size_t> per_remote;
    for(const auto& c : connections) per_remote[c.remote_addr]++;

    std::vector<Classification> out;
    out.reserve(connections.size());
    for(const auto& c : connections){
        Classification cls;
        cls.locality = classify(c);
        cls.repeat_count = per_remote[c.remote_addr];
        RuleSubject subject{c, cls.locality, cls.repeat_count};
        for(const Rule* r : rules_.match(subject)){
            cls.matched_rules.insert(r->id);
            cls.tags.insert(r->tags.begin(), r->tags.end());
            if(!cls.max_severity || r->severity > *cls.max_severity) cls.max_severity = r->severity;
        }
        out.push_back(std::move(cls));
    }
    return out;
}

}
