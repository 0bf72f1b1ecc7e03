#include "GraphWriter.h"
#include "JsonUtil.h"
#include "Monitor.h"
#include "Report.h"
#include <sstream>

namespace netgrave {

namespace {

using jsonutil::escape;
using jsonutil::format_double;

std::string quoted(const std::string& s){ return "\"" + escape(s) + "\""; }

template<typename Set>
std::string string_array(const Set& items){
    std::string out = "[";
    bool first = true;
    for(const auto& i : items){
        if(!first) out += ",";
        out += quoted(i);
        first = false;
    }
    return out + "]";
}

std::string optional_severity(const std::optional<Severity>& s){
    return s ? quoted(severity_to_string(*s)) : "null";
}

void write_summary(std::ostringstream& os, const GraphSummary& s, size_t dropped){
    os << "\"summary\":{";
    os << "\"total_connections\":" << s.total_connections;
    os << ",\"listen_count\":" << s.listen_count;
    os << ",\"endpoint_count\":" << s.endpoint_count;
    os << ",\"dropped\":" << dropped;
    os << ",\"suspicious_count\":" << s.suspicious_count;
    os << ",\"max_severity\":" << optional_severity(s.max_severity);
    os << ",\"tags\":" << string_array(s.tags);
    os << ",\"states\":{";
    bool first = true;
    for(const auto& [state, count] : s.state_counts){
        if(!first) os << ",";
        os << quoted(state_name(state)) << ":" << count;
        first = false;
    }
    os << "}}";
}

void write_endpoint(std::ostringstream& os, const Endpoint& ep){
    os << "{\"remote_addr\":" << quoted(ep.remote_addr);
    os << ",\"conn_count\":" << ep.conn_count;
    os << ",\"state\":" << quoted(state_name(ep.dominant_state));
    os << ",\"locality\":" << quoted(locality_name(ep.locality));
    os << ",\"latency\":" << quoted(latency_bucket_name(ep.latency));
    os << ",\"heavy_talker\":" << (ep.heavy_talker ? "true" : "false");
    os << ",\"suspicion\":" << string_array(ep.suspicion);
    os << ",\"tags\":" << string_array(ep.tags);
    os << ",\"max_severity\":" << optional_severity(ep.max_severity);
    os << ",\"x\":" << format_double(ep.position.x);
    os << ",\"y\":" << format_double(ep.position.y);
    os << "}";
}

}

std::string GraphWriter::write(const Graph& graph, const LayoutConfig& layout,
                               const RefreshState* state, const Report* report, bool pretty) const {
    std::ostringstream os;
    os << "{";
    os << "\"center\":{\"label\":" << quoted(graph.center.label)
       << ",\"pid\":" << (graph.center.pid ? std::to_string(*graph.center.pid) : "null")
       << ",\"x\":" << format_double(layout.center.x) << ",\"y\":" << format_double(layout.center.y) << "},";

    os << "\"layout\":{\"ring_low\":" << format_double(layout.ring_low)
       << ",\"ring_medium\":" << format_double(layout.ring_medium)
       << ",\"ring_high\":" << format_double(layout.ring_high)
       << ",\"edge_padding\":" << format_double(layout.edge_padding)
       << ",\"adaptive\":" << (layout.is_adaptive ? "true" : "false")
       << ",\"width\":" << format_double(layout.width)
       << ",\"height\":" << format_double(layout.height) << "},";

    write_summary(os, graph.summary, graph.dropped);

    os << ",\"endpoints\":[";
    for(size_t i = 0; i < graph.endpoints.size(); ++i){
        if(i) os << ",";
        write_endpoint(os, graph.endpoints[i]);
    }
    os << "]";

    if(state){
        os << ",\"refresh\":{\"refresh_ms\":" << state->refresh_ms
           << ",\"data_interval_ms\":" << state->data_interval().count()
           << ",\"mode\":" << quoted(view_mode_name(state->mode))
           << ",\"focused_pid\":" << (state->focused_pid ? std::to_string(*state->focused_pid) : "null")
           << ",\"pulse_phase\":" << format_double(state->pulse_phase)
           << ",\"blink\":" << (state->blink ? "true" : "false")
           << ",\"selected\":" << (state->selected ? std::to_string(*state->selected) : "null")
           << "}";
    }

    if(report){
        os << ",\"warnings\":[";
        auto warnings = report->warnings();
        for(size_t i = 0; i < warnings.size(); ++i){
            if(i) os << ",";
            os << "{\"source\":" << quoted(warnings[i].source)
               << ",\"code\":" << quoted(warn_code_name(warnings[i].code))
               << ",\"detail\":" << quoted(warnings[i].detail) << "}";
        }
        os << "],\"errors\":[";
        auto errors = report->errors();
        for(size_t i = 0; i < errors.size(); ++i){
            if(i) os << ",";
            os << "{\"stage\":" << quoted(errors[i].first) << ",\"message\":" << quoted(errors[i].second) << "}";
        }
        os << "]";
    }
    os << "}";
    return pretty ? jsonutil::pretty(os.str()) : os.str();
}

std::string GraphWriter::write(const Monitor& monitor, bool pretty) const {
    return write(*monitor.graph(), monitor.layout(), &monitor.state(), &monitor.report(), pretty);
}

}
