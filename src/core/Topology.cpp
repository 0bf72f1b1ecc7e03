#include "Topology.h"
#include <algorithm>
#include <cctype>

namespace netgrave {

const char* locality_name(Locality l){
    switch(l){
        case Locality::Loopback: return "loopback";
        case Locality::Private: return "private";
        case Locality::Public: return "public";
        case Locality::ListenOnly: return "listen_only";
    }
    return "public";
}

bool parse_locality(const std::string& name, Locality& out){
    std::string s = name; std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    std::replace(s.begin(), s.end(), '-', '_');
    if(s=="loopback" || s=="localhost") { out = Locality::Loopback; return true; }
    if(s=="private") { out = Locality::Private; return true; }
    if(s=="public") { out = Locality::Public; return true; }
    if(s=="listen_only" || s=="listen") { out = Locality::ListenOnly; return true; }
    return false;
}

const char* latency_bucket_name(LatencyBucket b){
    switch(b){
        case LatencyBucket::Low: return "low";
        case LatencyBucket::Medium: return "medium";
        case LatencyBucket::High: return "high";
        case LatencyBucket::Unknown: return "unknown";
    }
    return "unknown";
}

}
