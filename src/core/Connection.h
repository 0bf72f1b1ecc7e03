#pragma once
#include <string>
#include <optional>
#include <cstdint>

namespace netgrave {

enum class Protocol { Tcp, Udp };

enum class ConnectionState {
    Established, SynSent, SynRecv, FinWait1, FinWait2, TimeWait,
    Close, CloseWait, LastAck, Listen, Closing, Unknown
};

// One observed socket. Rebuilt from scratch on every scan cycle; only the
// correlator writes to it afterwards (pid / process_name).
struct Connection {
    Protocol protocol = Protocol::Tcp;
    bool ipv6 = false;
    std::string local_addr;
    uint16_t local_port = 0;
    std::string remote_addr;
    uint16_t remote_port = 0;
    ConnectionState state = ConnectionState::Unknown;
    std::optional<uint64_t> inode;
    std::optional<int> pid;
    std::optional<std::string> process_name;
};

const char* protocol_name(Protocol p);
bool parse_protocol(const std::string& name, Protocol& out);

// Kernel hex code ("01".."0B") to state; anything else is Unknown.
ConnectionState state_from_hex(const std::string& hex);
const char* state_name(ConnectionState s);
// Case-insensitive, accepts the kernel spelling (ESTABLISHED, SYN_SENT, ...).
bool parse_state(const std::string& name, ConnectionState& out);

// Display severity ranking used to pick an endpoint's dominant state:
// established < syn < listen < wait states < closing.
int state_display_rank(ConnectionState s);
bool is_wait_state(ConnectionState s);

// Wildcard remote ("0.0.0.0" or "::"), i.e. no peer.
bool is_wildcard_address(const std::string& addr);

}
