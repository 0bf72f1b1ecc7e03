#include "Connection.h"
#include <algorithm>
#include <cctype>

namespace netgrave {

namespace {
struct StateEntry { const char* hex; ConnectionState state; const char* name; };
const StateEntry kStates[] = {
    {"01", ConnectionState::Established, "ESTABLISHED"}, {"02", ConnectionState::SynSent, "SYN_SENT"},
    {"03", ConnectionState::SynRecv, "SYN_RECV"}, {"04", ConnectionState::FinWait1, "FIN_WAIT1"},
    {"05", ConnectionState::FinWait2, "FIN_WAIT2"}, {"06", ConnectionState::TimeWait, "TIME_WAIT"},
    {"07", ConnectionState::Close, "CLOSE"}, {"08", ConnectionState::CloseWait, "CLOSE_WAIT"},
    {"09", ConnectionState::LastAck, "LAST_ACK"}, {"0A", ConnectionState::Listen, "LISTEN"},
    {"0B", ConnectionState::Closing, "CLOSING"}
};

std::string upper(std::string s){
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::toupper(c); });
    return s;
}
}

const char* protocol_name(Protocol p){ return p == Protocol::Tcp ? "tcp" : "udp"; }

bool parse_protocol(const std::string& name, Protocol& out){
    std::string s = upper(name);
    if(s=="TCP") { out = Protocol::Tcp; return true; }
    if(s=="UDP") { out = Protocol::Udp; return true; }
    return false;
}

ConnectionState state_from_hex(const std::string& hex){
    std::string h = upper(hex);
    for(const auto& e : kStates){
        if(h == e.hex) return e.state;
    }
    return ConnectionState::Unknown;
}

const char* state_name(ConnectionState s){
    for(const auto& e : kStates){
        if(e.state == s) return e.name;
    }
    return "UNKNOWN";
}

bool parse_state(const std::string& name, ConnectionState& out){
    // FIN-WAIT-1, fin_wait1 and FINWAIT1 all name the same state
    auto squash = [](std::string v){
        v = upper(v);
        v.erase(std::remove_if(v.begin(), v.end(), [](char c){ return c=='_' || c=='-'; }), v.end());
        return v;
    };
    std::string n = squash(name);
    for(const auto& e : kStates){
        if(n == squash(e.name)) { out = e.state; return true; }
    }
    if(n == "UNKNOWN") { out = ConnectionState::Unknown; return true; }
    return false;
}

bool is_wait_state(ConnectionState s){
    switch(s){
        case ConnectionState::FinWait1:
        case ConnectionState::FinWait2:
        case ConnectionState::TimeWait:
        case ConnectionState::CloseWait:
        case ConnectionState::LastAck:
            return true;
        default:
            return false;
    }
}

int state_display_rank(ConnectionState s){
    switch(s){
        case ConnectionState::Established: return 0;
        case ConnectionState::Unknown: return 0;
        case ConnectionState::SynSent: return 1;
        case ConnectionState::SynRecv: return 1;
        case ConnectionState::Listen: return 2;
        case ConnectionState::Closing: return 4;
        case ConnectionState::Close: return 4;
        default: break;
    }
    return is_wait_state(s) ? 3 : 0;
}

bool is_wildcard_address(const std::string& addr){
    return addr.empty() || addr == "0.0.0.0" || addr == "::";
}

}
