#pragma once
#include "../core/Scanner.h"
#include "../core/Connection.h"
#include <string>
#include <vector>
#include <optional>

namespace netgrave {

class Report;
struct Config;

// Reads the kernel socket tables (<proc_root>/net/{tcp,tcp6,udp,udp6}).
// Unreadable tables and malformed lines are reported, never thrown.
class SocketScanner : public Scanner {
public:
    std::string name() const override { return "sockets"; }
    std::string description() const override { return "Reads TCP/UDP socket tables from procfs"; }
    void scan(ScanContext& context) override;

    std::vector<Connection> collect(const Config& cfg, Report& report) const;
};

// Parses one data line of a socket table. Returns nullopt for malformed lines.
std::optional<Connection> parse_socket_line(const std::string& line, Protocol proto, bool ipv6);

// Hex address decoding as printed by the kernel (little-endian 32-bit words).
bool hex_to_ipv4(const std::string& hex, std::string& out);
bool hex_to_ipv6(const std::string& hex, std::string& out);

}
