#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/scanners/ProcessCorrelator.h"
#include "../src/core/Config.h"
#include "../src/core/Report.h"
#include "../src/core/ScanContext.h"
#include "../src/core/Logging.h"
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace netgrave {

class ProcessCorrelatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().set_level(LogLevel::Error);
        root = fs::temp_directory_path() / ("netgrave_proc_test_" + std::to_string(getpid()));
        fs::create_directories(root);
    }

    void TearDown() override {
        fs::remove_all(root);
    }

    void add_process(int pid, const std::string& comm, const std::vector<std::string>& fd_targets) {
        fs::path p = root / std::to_string(pid);
        fs::create_directories(p / "fd");
        std::ofstream(p / "comm") << comm << "\n";
        int fd = 3;
        for (const auto& t : fd_targets) {
            fs::create_symlink(t, p / "fd" / std::to_string(fd++));
        }
    }

    Connection socket_with_inode(uint64_t inode) {
        Connection c;
        c.remote_addr = "10.0.0.2";
        c.inode = inode;
        return c;
    }

    fs::path root;
};

TEST(SocketLinkTest, ParsesSocketTargets) {
    uint64_t inode = 0;
    EXPECT_TRUE(parse_socket_link("socket:[12345]", inode));
    EXPECT_EQ(inode, 12345u);
    EXPECT_FALSE(parse_socket_link("pipe:[12345]", inode));
    EXPECT_FALSE(parse_socket_link("/dev/null", inode));
    EXPECT_FALSE(parse_socket_link("socket:[]", inode));
    EXPECT_FALSE(parse_socket_link("socket:[12a]", inode));
    EXPECT_FALSE(parse_socket_link("socket:[0]", inode));
}

TEST_F(ProcessCorrelatorTest, AttributesSocketsToOwners) {
    add_process(100, "sshd", {"socket:[5001]", "/dev/null"});
    add_process(200, "firefox", {"pipe:[9]", "socket:[5002]", "socket:[5003]"});

    std::vector<Connection> conns = {socket_with_inode(5001), socket_with_inode(5003), socket_with_inode(7777)};
    ProcessCorrelator correlator(root.string());
    correlator.correlate(conns);

    ASSERT_TRUE(conns[0].pid.has_value());
    EXPECT_EQ(*conns[0].pid, 100);
    EXPECT_EQ(conns[0].process_name.value_or(""), "sshd");
    EXPECT_EQ(conns[1].pid.value_or(0), 200);
    EXPECT_EQ(conns[1].process_name.value_or(""), "firefox");
    EXPECT_FALSE(conns[2].pid.has_value());
    EXPECT_FALSE(conns[2].process_name.has_value());
}

TEST_F(ProcessCorrelatorTest, CorrelationIsIdempotent) {
    add_process(100, "sshd", {"socket:[5001]"});
    add_process(200, "firefox", {"socket:[5002]"});

    std::vector<Connection> conns = {socket_with_inode(5001), socket_with_inode(5002), socket_with_inode(7777)};
    ProcessCorrelator correlator(root.string());
    correlator.correlate(conns);
    std::vector<Connection> first = conns;
    correlator.correlate(conns);

    ASSERT_EQ(conns.size(), first.size());
    for (size_t i = 0; i < conns.size(); ++i) {
        EXPECT_EQ(conns[i].pid, first[i].pid) << "index " << i;
        EXPECT_EQ(conns[i].process_name, first[i].process_name) << "index " << i;
    }
    EXPECT_EQ(conns[0].pid.value_or(0), 100);
    EXPECT_EQ(conns[1].pid.value_or(0), 200);
    EXPECT_FALSE(conns[2].pid.has_value());
}

TEST_F(ProcessCorrelatorTest, ConnectionsWithoutInodeStayUnattributed) {
    add_process(100, "sshd", {"socket:[5001]"});
    Connection c;
    c.remote_addr = "10.0.0.2";
    std::vector<Connection> conns = {c};
    ProcessCorrelator(root.string()).correlate(conns);
    EXPECT_FALSE(conns[0].pid.has_value());
}

TEST_F(ProcessCorrelatorTest, NonPidEntriesAreIgnored) {
    add_process(100, "sshd", {"socket:[5001]"});
    fs::create_directories(root / "self" / "fd");
    fs::create_directories(root / "net");
    InodeMapStats stats;
    InodeMap map = ProcessCorrelator(root.string()).build_inode_map(&stats);
    EXPECT_EQ(stats.processes_seen, 1u);
    EXPECT_EQ(map.size(), 1u);
}

TEST_F(ProcessCorrelatorTest, MissingFdTableSkipsProcessOnly) {
    add_process(100, "sshd", {"socket:[5001]"});
    fs::create_directories(root / "300");  // exited between listing and reading

    std::vector<Connection> conns = {socket_with_inode(5001)};
    Report report;
    ProcessCorrelator(root.string()).correlate(conns, &report);
    EXPECT_EQ(conns[0].pid.value_or(0), 100);
    EXPECT_FALSE(report.has_warning(WarnCode::ProcessTableUnreadable));
}

TEST_F(ProcessCorrelatorTest, ReportsWhenNoFdTableIsReadable) {
    fs::create_directories(root / "300");
    fs::create_directories(root / "301");
    std::vector<Connection> conns = {socket_with_inode(5001)};
    Report report;
    ProcessCorrelator(root.string()).correlate(conns, &report);
    EXPECT_TRUE(report.has_warning(WarnCode::ProcessTableUnreadable));
    EXPECT_FALSE(conns[0].pid.has_value());
}

TEST_F(ProcessCorrelatorTest, MissingCommLeavesEmptyName) {
    fs::create_directories(root / "400" / "fd");
    fs::create_symlink("socket:[6000]", root / "400" / "fd" / "3");
    std::vector<Connection> conns = {socket_with_inode(6000)};
    ProcessCorrelator(root.string()).correlate(conns);
    EXPECT_EQ(conns[0].pid.value_or(0), 400);
    EXPECT_EQ(conns[0].process_name.value_or("x"), "");
    EXPECT_EQ(read_process_name(root.string(), 400), "");
}

TEST_F(ProcessCorrelatorTest, ApplyUsesPrebuiltMap) {
    InodeMap map;
    map.emplace(42u, ProcessInfo{7, "nginx"});
    std::vector<Connection> conns = {socket_with_inode(42), socket_with_inode(43)};
    ProcessCorrelator::apply(map, conns);
    EXPECT_EQ(conns[0].pid.value_or(0), 7);
    EXPECT_EQ(conns[0].process_name.value_or(""), "nginx");
    EXPECT_FALSE(conns[1].pid.has_value());
}

TEST_F(ProcessCorrelatorTest, ScanUsesConfiguredProcRoot) {
    add_process(100, "sshd", {"socket:[5001]"});
    Config cfg;
    cfg.proc_root = root.string();
    Report report;
    ScanContext ctx(cfg, report);
    ctx.connections.push_back(socket_with_inode(5001));
    ProcessCorrelator correlator;
    correlator.scan(ctx);
    EXPECT_EQ(ctx.connections[0].pid.value_or(0), 100);
}

} // namespace netgrave

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
