#include "TopologyAggregator.h"
#include "Logging.h"
#include <algorithm>
#include <stdexcept>

namespace netgrave {

namespace {

struct Group {
    std::string addr;
    std::vector<size_t> members; // indices into the connection list
};

}

std::vector<bool> heavy_talkers(const std::vector<size_t>& ranked_counts){
    std::vector<bool> flags(ranked_counts.size(), false);
    if(ranked_counts.empty()) return flags;
    if(ranked_counts.size() < HEAVY_TALKER_RANK){
        flags[0] = ranked_counts[0] > 0;
        return flags;
    }
    size_t threshold = ranked_counts[HEAVY_TALKER_RANK - 1];
    for(size_t i = 0; i < ranked_counts.size(); ++i){
        flags[i] = ranked_counts[i] > 0 && ranked_counts[i] >= threshold;
    }
    return flags;
}

ConnectionState dominant_state(const std::vector<ConnectionState>& states){
    if(states.empty()) return ConnectionState::Unknown;
    ConnectionState best = states.front();
    for(auto s : states){
        if(state_display_rank(s) > state_display_rank(best)) best = s;
    }
    return best;
}

std::string host_label(const std::string& hostname){
    if(hostname.empty()) return "HOST";
    return "HOST (" + hostname + ")";
}

std::string center_label(const std::vector<Connection>& connections, const AggregateOptions& opts){
    if(!opts.focus_pid) return opts.host_label;
    std::string name;
    for(const auto& c : connections){
        if(c.pid == opts.focus_pid && c.process_name && !c.process_name->empty()){ name = *c.process_name; break; }
    }
    if(name.empty()) return "pid " + std::to_string(*opts.focus_pid);
    if(name.size() > 8) name = name.substr(0, 5) + "...";
    return name + " (" + std::to_string(*opts.focus_pid) + ")";
}

Graph aggregate(const std::vector<Connection>& connections,
                const std::vector<Classification>& classifications,
                const AggregateOptions& opts){
    if(classifications.size() != connections.size()){
        throw std::invalid_argument("classification count does not match connection count");
    }

    Graph g;
    g.center.label = center_label(connections, opts);
    g.center.pid = opts.focus_pid;

    std::unordered_map<std::string, size_t> index;
    std::vector<Group> groups;
    for(size_t i = 0; i < connections.size(); ++i){
        const auto& c = connections[i];
        const auto& cls = classifications[i];
        auto& s = g.summary;
        s.total_connections++;
        s.state_counts[c.state]++;
        if(!cls.matched_rules.empty()){
            s.suspicious_count++;
            s.tags.insert(cls.tags.begin(), cls.tags.end());
            if(cls.max_severity && (!s.max_severity || *cls.max_severity > *s.max_severity)) s.max_severity = cls.max_severity;
        }
        if(c.state == ConnectionState::Listen){ s.listen_count++; continue; }
        if(is_wildcard_address(c.remote_addr)) continue;
        auto it = index.find(c.remote_addr);
        if(it == index.end()){
            index.emplace(c.remote_addr, groups.size());
            groups.push_back(Group{c.remote_addr, {i}});
        } else {
            groups[it->second].members.push_back(i);
        }
    }
    g.summary.endpoint_count = groups.size();

    std::sort(groups.begin(), groups.end(), [](const Group& a, const Group& b){
        if(a.members.size() != b.members.size()) return a.members.size() > b.members.size();
        return a.addr < b.addr;
    });

    std::vector<size_t> counts;
    counts.reserve(groups.size());
    for(const auto& gr : groups) counts.push_back(gr.members.size());
    std::vector<bool> heavy = heavy_talkers(counts);

    size_t visible = std::min(groups.size(), opts.max_visible);
    g.dropped = groups.size() - visible;
    g.endpoints.reserve(visible);
    for(size_t gi = 0; gi < visible; ++gi){
        const auto& gr = groups[gi];
        Endpoint ep;
        ep.remote_addr = gr.addr;
        ep.conn_count = gr.members.size();
        ep.heavy_talker = heavy[gi];
        std::vector<ConnectionState> states;
        for(size_t m : gr.members){
            states.push_back(connections[m].state);
            const auto& cls = classifications[m];
            ep.suspicion.insert(cls.matched_rules.begin(), cls.matched_rules.end());
            ep.tags.insert(cls.tags.begin(), cls.tags.end());
            if(cls.max_severity && (!ep.max_severity || *cls.max_severity > *ep.max_severity)) ep.max_severity = cls.max_severity;
        }
        ep.dominant_state = dominant_state(states);
        ep.locality = classifications[gr.members.front()].locality;
        std::optional<uint64_t> sample;
        auto ls = opts.latency_samples.find(gr.addr);
        if(ls != opts.latency_samples.end()) sample = ls->second;
        ep.latency = classify_latency(sample, opts.latency);
        g.endpoints.push_back(std::move(ep));
    }

    Logger::instance().debug("aggregate: " + std::to_string(g.summary.total_connections) + " connections, " +
                             std::to_string(groups.size()) + " endpoints, " + std::to_string(g.dropped) + " dropped");
    return g;
}

}
