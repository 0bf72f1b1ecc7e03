#pragma once
#include "../core/Scanner.h"
#include "../core/Connection.h"
#include <string>
#include <vector>
#include <unordered_map>
#include <cstdint>

namespace netgrave {

class Report;

struct ProcessInfo {
    int pid = 0;
    std::string name; // /proc/<pid>/comm, may be empty
};

using InodeMap = std::unordered_map<uint64_t, ProcessInfo>;

struct InodeMapStats {
    size_t processes_seen = 0;
    size_t fd_tables_unreadable = 0;
};

// Attributes sockets to processes by walking /proc/<pid>/fd. Failures for a
// single process (exited, permission denied) only skip that process.
class ProcessCorrelator : public Scanner {
public:
    ProcessCorrelator() = default;
    explicit ProcessCorrelator(std::string proc_root) : proc_root_(std::move(proc_root)) {}

    std::string name() const override { return "process_correlator"; }
    std::string description() const override { return "Maps socket inodes to owning processes"; }
    void scan(ScanContext& context) override;

    // Fills pid/process_name for every connection whose inode is known.
    // Unmatched connections keep both fields empty.
    void correlate(std::vector<Connection>& connections, Report* report = nullptr) const;

    InodeMap build_inode_map(InodeMapStats* stats = nullptr) const;
    static void apply(const InodeMap& map, std::vector<Connection>& connections);
private:
    std::string proc_root_ = "/proc";
};

// Extracts N from "socket:[N]"; false for other link targets.
bool parse_socket_link(const std::string& target, uint64_t& inode);
std::string read_process_name(const std::string& proc_root, int pid);

}
