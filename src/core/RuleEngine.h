#pragma once
#include "Connection.h"
#include "Severity.h"
#include "Topology.h"
#include <string>
#include <vector>
#include <memory>
#include <regex>
#include <cstdint>

namespace netgrave {

enum class RuleField { State, Protocol, LocalPort, RemotePort, RemoteAddr, Locality, RepeatCount, Process };
enum class RuleOp { Equals, In, Gte, Lte, Contains, Regex };

bool parse_rule_field(const std::string& name, RuleField& out);
bool parse_rule_op(const std::string& name, RuleOp& out);
bool is_numeric_field(RuleField f);

// Tagged predicate tree: Compare leaves, All/Any/Not interior nodes.
struct PredicateNode {
    enum class Kind { Compare, All, Any, Not };
    Kind kind = Kind::All;
    RuleField field = RuleField::State;
    RuleOp op = RuleOp::Equals;
    std::vector<std::string> text; // normalised operands for text fields
    std::vector<uint64_t> numbers; // operands for numeric fields
    std::shared_ptr<const std::regex> pattern;
    std::vector<PredicateNode> children;
};

// Fixed-shape record a predicate is evaluated against.
struct RuleSubject {
    const Connection& conn;
    Locality locality;
    size_t repeat_count;
};

struct Rule {
    std::string id;
    std::string name;
    std::string description;
    Severity severity = Severity::Low;
    std::vector<std::string> tags;
    PredicateNode predicate;
};

struct RuleWarning {
    std::string rule_id;
    std::string code;
    std::string detail;
};

bool evaluate(const PredicateNode& node, const RuleSubject& subject);

class RuleEngine {
public:
    static constexpr size_t MAX_RULES = 1000;
    static constexpr size_t MAX_CONDITIONS = 25;
    static constexpr size_t MAX_REGEX_LENGTH = 512;

    // Loads every *.rule file of dir in lexical order. Problems never throw:
    // each becomes a RuleWarning and `warnings_out` receives the codes
    // joined with ','. An empty dir string loads nothing.
    void load_dir(const std::string& dir, std::string& warnings_out);
    // Parses rule text (one or more rules, each starting at an id= line).
    void load_text(const std::string& content, const std::string& source);
    void clear();

    const std::vector<Rule>& rules() const { return rules_; }
    const std::vector<RuleWarning>& warnings() const { return warnings_; }

    // Rules whose predicate holds for the subject, in load order.
    std::vector<const Rule*> match(const RuleSubject& subject) const;
private:
    void add_warning(const std::string& id, const std::string& code, const std::string& detail);
    void finalize_rule(const std::vector<std::pair<std::string,std::string>>& kv, const std::string& source);
    std::vector<Rule> rules_;
    std::vector<RuleWarning> warnings_;
};

}
