#include "ProcessCorrelator.h"
#include "../core/ScanContext.h"
#include "../core/Report.h"
#include "../core/Logging.h"
#include <fstream>
#include <climits>
#include <cstdlib>
#include <dirent.h>
#include <unistd.h>

namespace netgrave {

namespace {

bool is_valid_pid(const char* str, int* pid_out) {
    if (!str || !*str) return false;
    char* endptr;
    long val = strtol(str, &endptr, 10);
    if (*endptr != '\0' || val <= 0 || val > INT_MAX) return false;
    if (pid_out) *pid_out = static_cast<int>(val);
    return true;
}

// Returns false when the fd directory itself could not be opened.
bool collect_socket_fds(const std::string& proc_root, int pid, const std::string& pname, InodeMap& map) {
    std::string fd_path = proc_root + "/" + std::to_string(pid) + "/fd";
    DIR* fd_dir = opendir(fd_path.c_str());
    if (!fd_dir) return false;

    struct dirent* fd_entry;
    while ((fd_entry = readdir(fd_dir)) != nullptr) {
        if (fd_entry->d_name[0] == '.') continue;
        std::string link = fd_path + "/" + fd_entry->d_name;
        char target[128];
        ssize_t len = readlink(link.c_str(), target, sizeof(target) - 1);
        if (len <= 0) continue;
        target[len] = '\0';
        uint64_t inode = 0;
        if (!parse_socket_link(target, inode)) continue;
        // first holder wins; shared sockets keep the lowest pid seen
        map.emplace(inode, ProcessInfo{pid, pname});
    }
    closedir(fd_dir);
    return true;
}

}

bool parse_socket_link(const std::string& target, uint64_t& inode) {
    static const std::string prefix = "socket:[";
    if (target.compare(0, prefix.size(), prefix) != 0) return false;
    if (target.size() <= prefix.size() + 1 || target.back() != ']') return false;
    std::string digits = target.substr(prefix.size(), target.size() - prefix.size() - 1);
    if (digits.find_first_not_of("0123456789") != std::string::npos) return false;
    inode = std::strtoull(digits.c_str(), nullptr, 10);
    return inode != 0;
}

std::string read_process_name(const std::string& proc_root, int pid) {
    std::ifstream f(proc_root + "/" + std::to_string(pid) + "/comm");
    std::string name;
    if (!f || !std::getline(f, name)) return "";
    while (!name.empty() && (name.back() == '\n' || name.back() == '\r' || name.back() == ' ')) name.pop_back();
    return name;
}

InodeMap ProcessCorrelator::build_inode_map(InodeMapStats* stats) const {
    InodeMap map;
#ifdef __linux__
    DIR* dir = opendir(proc_root_.c_str());
    if (!dir) {
        Logger::instance().debug("cannot open " + proc_root_);
        return map;
    }

    struct dirent* entry;
    while ((entry = readdir(dir)) != nullptr) {
        int pid;
        if (!is_valid_pid(entry->d_name, &pid)) continue;
        if (stats) stats->processes_seen++;
        std::string pname = read_process_name(proc_root_, pid);
        if (!collect_socket_fds(proc_root_, pid, pname, map)) {
            if (stats) stats->fd_tables_unreadable++;
        }
    }
    closedir(dir);
#else
    (void)stats;
#endif
    return map;
}

void ProcessCorrelator::apply(const InodeMap& map, std::vector<Connection>& connections) {
    for (auto& c : connections) {
        if (!c.inode) continue;
        auto it = map.find(*c.inode);
        if (it == map.end()) continue;
        c.pid = it->second.pid;
        c.process_name = it->second.name;
    }
}

void ProcessCorrelator::correlate(std::vector<Connection>& connections, Report* report) const {
    InodeMapStats stats;
    InodeMap map = build_inode_map(&stats);
    apply(map, connections);

    if (report && stats.processes_seen > 0 && stats.fd_tables_unreadable == stats.processes_seen) {
        report->add_warning(name(), WarnCode::ProcessTableUnreadable,
                            "no readable fd table among " + std::to_string(stats.processes_seen) + " processes");
    }
    Logger::instance().trace("correlator: " + std::to_string(map.size()) + " socket inodes across " +
                             std::to_string(stats.processes_seen) + " processes");
}

void ProcessCorrelator::scan(ScanContext& context) {
    ProcessCorrelator scoped(context.config.proc_root);
    scoped.correlate(context.connections, &context.report);
}

}
