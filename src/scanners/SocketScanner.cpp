#include "SocketScanner.h"
#include "../core/ScanContext.h"
#include "../core/Report.h"
#include "../core/Config.h"
#include "../core/Logging.h"
#include <fstream>
#include <sstream>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <cstdio>
#include <arpa/inet.h>

namespace netgrave {

namespace {

// Minimum columns: sl local rem st tx:rx tr:when retrnsmt uid timeout inode
const size_t MIN_SOCKET_COLUMNS = 10;

struct TableSpec { const char* file; Protocol proto; bool ipv6; };
const TableSpec kTables[] = {
    {"tcp", Protocol::Tcp, false}, {"tcp6", Protocol::Tcp, true},
    {"udp", Protocol::Udp, false}, {"udp6", Protocol::Udp, true}
};

bool all_hex(const std::string& s){
    if(s.empty()) return false;
    for(char c : s) if(!std::isxdigit(static_cast<unsigned char>(c))) return false;
    return true;
}

bool parse_hex_u32(const std::string& s, uint32_t& out){
    if(!all_hex(s) || s.size() > 8) return false;
    out = static_cast<uint32_t>(std::strtoul(s.c_str(), nullptr, 16));
    return true;
}

// "0100007F:0016" -> address text + port
bool split_endpoint(const std::string& tok, bool ipv6, std::string& addr, uint16_t& port){
    auto colon = tok.find(':');
    if(colon == std::string::npos) return false;
    std::string hex_addr = tok.substr(0, colon);
    std::string hex_port = tok.substr(colon + 1);
    uint32_t p = 0;
    if(hex_port.size() > 4 || !parse_hex_u32(hex_port, p)) return false;
    port = static_cast<uint16_t>(p);
    return ipv6 ? hex_to_ipv6(hex_addr, addr) : hex_to_ipv4(hex_addr, addr);
}

void word_to_bytes(uint32_t word, unsigned char* out){
    out[0] = static_cast<unsigned char>(word & 0xFF);
    out[1] = static_cast<unsigned char>((word >> 8) & 0xFF);
    out[2] = static_cast<unsigned char>((word >> 16) & 0xFF);
    out[3] = static_cast<unsigned char>((word >> 24) & 0xFF);
}

}

bool hex_to_ipv4(const std::string& hex, std::string& out){
    uint32_t word = 0;
    if(hex.size() != 8 || !parse_hex_u32(hex, word)) return false;
    unsigned char b[4];
    word_to_bytes(word, b);
    char buf[INET_ADDRSTRLEN];
    snprintf(buf, sizeof(buf), "%u.%u.%u.%u", unsigned(b[0]), unsigned(b[1]), unsigned(b[2]), unsigned(b[3]));
    out = buf;
    return true;
}

bool hex_to_ipv6(const std::string& hex, std::string& out){
    if(hex.size() != 32 || !all_hex(hex)) return false;
    unsigned char bytes[16];
    for(int i = 0; i < 4; ++i){
        uint32_t word = 0;
        if(!parse_hex_u32(hex.substr(i * 8, 8), word)) return false;
        word_to_bytes(word, bytes + i * 4);
    }
    char buf[INET6_ADDRSTRLEN];
    if(!inet_ntop(AF_INET6, bytes, buf, sizeof(buf))) return false;
    out = buf;
    return true;
}

std::optional<Connection> parse_socket_line(const std::string& line, Protocol proto, bool ipv6){
    std::istringstream in(line);
    std::vector<std::string> tokens;
    std::string tok;
    while(in >> tok) tokens.push_back(tok);
    if(tokens.size() < MIN_SOCKET_COLUMNS) return std::nullopt;
    // slot column looks like "12:"
    if(tokens[0].empty() || tokens[0].back() != ':') return std::nullopt;

    Connection c;
    c.protocol = proto;
    c.ipv6 = ipv6;
    if(!split_endpoint(tokens[1], ipv6, c.local_addr, c.local_port)) return std::nullopt;
    if(!split_endpoint(tokens[2], ipv6, c.remote_addr, c.remote_port)) return std::nullopt;
    if(tokens[3].size() != 2 || !all_hex(tokens[3])) return std::nullopt;
    c.state = state_from_hex(tokens[3]);

    const std::string& inode_s = tokens[9];
    if(inode_s.empty() || inode_s.find_first_not_of("0123456789") != std::string::npos) return std::nullopt;
    uint64_t inode = std::strtoull(inode_s.c_str(), nullptr, 10);
    if(inode != 0) c.inode = inode;
    return c;
}

std::vector<Connection> SocketScanner::collect(const Config& cfg, Report& report) const {
    std::vector<Connection> out;
    const size_t limit = cfg.max_sockets > 0 ? static_cast<size_t>(cfg.max_sockets) : 0;
    bool truncated = false;

    for(const auto& t : kTables){
        if(!cfg.protocol.empty() && cfg.protocol != protocol_name(t.proto)) continue;
        if(t.ipv6 && !cfg.include_ipv6) continue;

        std::string path = cfg.proc_root + "/net/" + t.file;
        std::ifstream f(path);
        if(!f) {
            report.add_warning(name(), WarnCode::NetTableUnreadable, path);
            Logger::instance().debug("socket table unreadable: " + path);
            continue;
        }

        std::string line;
        bool header_skipped = false;
        size_t malformed = 0, parsed = 0;
        while(std::getline(f, line)) {
            if(!header_skipped) { header_skipped = true; continue; }
            if(line.find_first_not_of(" \t\r") == std::string::npos) continue;
            if(limit && out.size() >= limit) { truncated = true; break; }
            auto conn = parse_socket_line(line, t.proto, t.ipv6);
            if(!conn) { ++malformed; continue; }
            out.push_back(std::move(*conn));
            ++parsed;
        }
        if(malformed) {
            report.add_warning(name(), WarnCode::MalformedRecord, path + ": " + std::to_string(malformed) + " malformed line(s) skipped");
        }
        Logger::instance().trace(path + ": " + std::to_string(parsed) + " sockets");
        if(truncated) break;
    }

    if(truncated) {
        report.add_warning(name(), WarnCode::SocketLimitReached, "socket scan truncated at " + std::to_string(limit) + " sockets");
    }
    return out;
}

void SocketScanner::scan(ScanContext& context) {
    auto conns = collect(context.config, context.report);
    context.connections.insert(context.connections.end(),
                               std::make_move_iterator(conns.begin()),
                               std::make_move_iterator(conns.end()));
}

}
