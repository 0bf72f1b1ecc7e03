#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/core/RuleEngine.h"
#include "../src/core/Logging.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <unistd.h>

namespace fs = std::filesystem;

namespace netgrave {

class RuleEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().set_level(LogLevel::Error);
        temp_dir = fs::temp_directory_path() / ("netgrave_rule_test_" + std::to_string(getpid()));
        fs::create_directories(temp_dir);
    }

    void TearDown() override {
        fs::remove_all(temp_dir);
    }

    void create_rule_file(const std::string& filename, const std::string& content) {
        std::ofstream file(temp_dir / filename);
        file << content;
    }

    std::vector<std::string> warning_codes() const {
        std::vector<std::string> out;
        for (const auto& w : engine.warnings()) out.push_back(w.code);
        return out;
    }

    Connection established(const std::string& remote, uint16_t rport) {
        Connection c;
        c.local_addr = "10.0.0.5";
        c.local_port = 41000;
        c.remote_addr = remote;
        c.remote_port = rport;
        c.state = ConnectionState::Established;
        return c;
    }

    fs::path temp_dir;
    RuleEngine engine;
};

TEST_F(RuleEngineTest, EmptyDirectoryString) {
    std::string warnings;
    engine.load_dir("", warnings);
    EXPECT_TRUE(warnings.empty());
    EXPECT_TRUE(engine.rules().empty());
    EXPECT_TRUE(engine.warnings().empty());
}

TEST_F(RuleEngineTest, NonExistentDirectory) {
    std::string warnings;
    engine.load_dir("/non/existent/directory", warnings);
    EXPECT_EQ(warnings, "rules_dir_missing");
    EXPECT_TRUE(engine.rules().empty());
}

TEST_F(RuleEngineTest, LoadsRulesInFileOrder) {
    create_rule_file("b.rule", "id=second\nseverity=low\nfield=remote_port\nvalue=22\n");
    create_rule_file("a.rule", "id=first\nseverity=high\nfield=state\nvalue=LISTEN\n");
    create_rule_file("notes.txt", "id=ignored\nfield=state\nvalue=LISTEN\n");
    std::string warnings;
    engine.load_dir(temp_dir.string(), warnings);
    EXPECT_TRUE(warnings.empty()) << warnings;
    ASSERT_EQ(engine.rules().size(), 2u);
    EXPECT_EQ(engine.rules()[0].id, "first");
    EXPECT_EQ(engine.rules()[0].severity, Severity::High);
    EXPECT_EQ(engine.rules()[1].id, "second");
}

TEST_F(RuleEngineTest, MultipleRulesPerFileWithMetadata) {
    engine.load_text(
        "# comment\n"
        "id=one\nname=First rule\ndescription=desc\nseverity=medium\ntags=a, b\n"
        "condition1.field=protocol\ncondition1.value=udp\n"
        "\n"
        "id=two\nseverity=critical\ncondition1.field=remote_addr\ncondition1.op=contains\ncondition1.value=203.0.113.\n",
        "inline");
    ASSERT_EQ(engine.rules().size(), 2u);
    const Rule& r = engine.rules()[0];
    EXPECT_EQ(r.name, "First rule");
    EXPECT_EQ(r.description, "desc");
    EXPECT_THAT(r.tags, ::testing::ElementsAre("a", "b"));
    EXPECT_EQ(engine.rules()[1].name, "two");
}

TEST_F(RuleEngineTest, NumericOperators) {
    engine.load_text(
        "id=high\ncondition1.field=remote_port\ncondition1.op=gte\ncondition1.value=49152\n"
        "id=low\ncondition1.field=local_port\ncondition1.op=lte\ncondition1.value=1023\n"
        "id=set\ncondition1.field=remote_port\ncondition1.op=in\ncondition1.value=22, 23,3389\n",
        "inline");
    ASSERT_EQ(engine.rules().size(), 3u);

    Connection c = established("8.8.8.8", 49152);
    auto m = engine.match(RuleSubject{c, Locality::Public, 1});
    ASSERT_EQ(m.size(), 1u);
    EXPECT_EQ(m[0]->id, "high");

    c.remote_port = 23;
    c.local_port = 80;
    m = engine.match(RuleSubject{c, Locality::Public, 1});
    ASSERT_EQ(m.size(), 2u);
    EXPECT_EQ(m[0]->id, "low");
    EXPECT_EQ(m[1]->id, "set");
}

TEST_F(RuleEngineTest, TextOperators) {
    engine.load_text(
        "id=proc\ncondition1.field=process\ncondition1.op=regex\ncondition1.value=^(nc|ncat)$\n"
        "id=state\ncondition1.field=state\ncondition1.op=in\ncondition1.value=syn-sent,SYN_RECV\n",
        "inline");
    ASSERT_EQ(engine.rules().size(), 2u);

    Connection c = established("8.8.8.8", 4444);
    c.process_name = "ncat";
    c.state = ConnectionState::SynSent;
    auto m = engine.match(RuleSubject{c, Locality::Public, 1});
    ASSERT_EQ(m.size(), 2u);

    c.process_name = "ncat-helper";
    c.state = ConnectionState::Established;
    EXPECT_TRUE(engine.match(RuleSubject{c, Locality::Public, 1}).empty());
}

TEST_F(RuleEngineTest, AnyLogicAndNegation) {
    engine.load_text(
        "id=either\nlogic=any\n"
        "condition1.field=remote_port\ncondition1.value=22\n"
        "condition2.field=remote_port\ncondition2.value=23\n"
        "id=not_private\n"
        "condition1.field=locality\ncondition1.value=private\ncondition1.negate=true\n",
        "inline");
    ASSERT_EQ(engine.rules().size(), 2u);
    EXPECT_EQ(engine.rules()[0].predicate.kind, PredicateNode::Kind::Any);
    ASSERT_EQ(engine.rules()[1].predicate.children.size(), 1u);
    EXPECT_EQ(engine.rules()[1].predicate.children[0].kind, PredicateNode::Kind::Not);

    Connection c = established("10.0.0.9", 23);
    auto m = engine.match(RuleSubject{c, Locality::Private, 1});
    ASSERT_EQ(m.size(), 1u);
    EXPECT_EQ(m[0]->id, "either");

    c.remote_port = 443;
    m = engine.match(RuleSubject{c, Locality::Public, 1});
    ASSERT_EQ(m.size(), 1u);
    EXPECT_EQ(m[0]->id, "not_private");
}

TEST_F(RuleEngineTest, RepeatCountField) {
    engine.load_text("id=burst\ncondition1.field=repeat_count\ncondition1.op=gte\ncondition1.value=10\n", "inline");
    Connection c = established("8.8.8.8", 443);
    EXPECT_TRUE(engine.match(RuleSubject{c, Locality::Public, 9}).empty());
    EXPECT_EQ(engine.match(RuleSubject{c, Locality::Public, 10}).size(), 1u);
}

TEST_F(RuleEngineTest, InvalidRulesBecomeWarnings) {
    engine.load_text(
        "id=v2\nrule_version=2\nfield=state\nvalue=LISTEN\n"
        "id=empty\nseverity=low\n"
        "id=badfield\nfield=colour\nvalue=red\n"
        "id=badop\nfield=state\nop=startswith\nvalue=L\n"
        "id=badnum\nfield=remote_port\nvalue=http\n"
        "id=badsev\nseverity=apocalyptic\nfield=state\nvalue=LISTEN\n"
        "id=badregex\nfield=process\nop=regex\nvalue=([a-z\n"
        "id=badstate\nfield=state\nvalue=DANCING\n"
        "id=rangeontext\nfield=process\nop=gte\nvalue=5\n"
        "id=ok\nfield=state\nvalue=LISTEN\n"
        "id=ok\nfield=state\nvalue=CLOSE\n",
        "inline");
    ASSERT_EQ(engine.rules().size(), 1u);
    EXPECT_EQ(engine.rules()[0].id, "ok");
    EXPECT_THAT(warning_codes(), ::testing::ElementsAre(
        "unsupported_version", "no_conditions", "unknown_field", "unknown_op", "bad_value",
        "bad_severity", "bad_regex", "bad_value", "unknown_op", "duplicate_id"));
    EXPECT_EQ(engine.warnings()[0].rule_id, "v2");
}

TEST_F(RuleEngineTest, InfoSeverityIsRejected) {
    engine.load_text("id=chatty\nseverity=info\nfield=state\nvalue=LISTEN\n", "inline");
    EXPECT_TRUE(engine.rules().empty());
    ASSERT_EQ(engine.warnings().size(), 1u);
    EXPECT_EQ(engine.warnings()[0].rule_id, "chatty");
    EXPECT_EQ(engine.warnings()[0].code, "bad_severity");
    EXPECT_EQ(engine.warnings()[0].detail, "info");
}

TEST_F(RuleEngineTest, RegexLengthLimit) {
    std::string long_regex(RuleEngine::MAX_REGEX_LENGTH + 1, 'a');
    engine.load_text("id=long\nfield=process\nop=regex\nvalue=" + long_regex + "\n", "inline");
    EXPECT_TRUE(engine.rules().empty());
    EXPECT_THAT(warning_codes(), ::testing::ElementsAre("regex_too_long"));
}

TEST_F(RuleEngineTest, ConditionLimit) {
    std::string text = "id=many\n";
    for (size_t i = 1; i <= RuleEngine::MAX_CONDITIONS + 1; ++i) {
        text += "condition" + std::to_string(i) + ".field=remote_port\n";
        text += "condition" + std::to_string(i) + ".value=" + std::to_string(i) + "\n";
    }
    engine.load_text(text, "inline");
    EXPECT_TRUE(engine.rules().empty());
    EXPECT_THAT(warning_codes(), ::testing::ElementsAre("too_many_conditions"));
}

TEST_F(RuleEngineTest, RuleCountLimit) {
    std::string text;
    for (size_t i = 0; i < RuleEngine::MAX_RULES + 5; ++i) {
        text += "id=r" + std::to_string(i) + "\nfield=remote_port\nvalue=1\n";
    }
    engine.load_text(text, "inline");
    EXPECT_EQ(engine.rules().size(), RuleEngine::MAX_RULES);
    EXPECT_THAT(warning_codes(), ::testing::ElementsAre("max_rules_exceeded"));
}

TEST_F(RuleEngineTest, RulesWithoutIdAreSkipped) {
    engine.load_text("field=state\nvalue=LISTEN\n", "inline");
    EXPECT_TRUE(engine.rules().empty());
    EXPECT_TRUE(engine.warnings().empty());
}

TEST_F(RuleEngineTest, WarningsOutListsCodes) {
    create_rule_file("x.rule", "id=a\nrule_version=9\nfield=state\nvalue=LISTEN\nid=b\nfield=nope\nvalue=1\n");
    std::string warnings;
    engine.load_dir(temp_dir.string(), warnings);
    EXPECT_EQ(warnings, "unsupported_version,unknown_field");
}

TEST_F(RuleEngineTest, ClearDropsEverything) {
    engine.load_text("id=a\nfield=state\nvalue=LISTEN\nid=b\n", "inline");
    EXPECT_FALSE(engine.rules().empty());
    EXPECT_FALSE(engine.warnings().empty());
    engine.clear();
    EXPECT_TRUE(engine.rules().empty());
    EXPECT_TRUE(engine.warnings().empty());
}

TEST_F(RuleEngineTest, ShippedRuleSetLoadsCleanly) {
    std::string warnings;
    engine.load_dir(std::string(NETGRAVE_SOURCE_DIR) + "/rules", warnings);
    EXPECT_TRUE(warnings.empty()) << warnings;
    std::vector<std::string> ids;
    for (const auto& r : engine.rules()) ids.push_back(r.id);
    EXPECT_THAT(ids, ::testing::UnorderedElementsAre(
        "unexpected_listener", "privileged_port_binding", "excessive_close_wait",
        "excessive_time_wait", "failed_connection_attempts", "high_port_beaconing"));

    Connection c;
    c.local_addr = "0.0.0.0";
    c.local_port = 22;
    c.remote_addr = "0.0.0.0";
    c.state = ConnectionState::Listen;
    auto m = engine.match(RuleSubject{c, Locality::ListenOnly, 1});
    ASSERT_EQ(m.size(), 1u);
    EXPECT_EQ(m[0]->id, "privileged_port_binding");
}

} // namespace netgrave

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
