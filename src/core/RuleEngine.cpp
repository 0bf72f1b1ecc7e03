#include "RuleEngine.h"
#include "Logging.h"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <map>
#include <cctype>
#include <cstdlib>

namespace fs = std::filesystem;

namespace netgrave {

namespace {

std::string trim(const std::string& s){
    size_t b = s.find_first_not_of(" \t\r\n");
    if(b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::string lower(std::string s){
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

std::vector<std::string> split_csv(const std::string& s){
    std::vector<std::string> out;
    std::stringstream ss(s);
    std::string item;
    while(std::getline(ss, item, ',')){
        item = trim(item);
        if(!item.empty()) out.push_back(item);
    }
    return out;
}

bool parse_u64(const std::string& s, uint64_t& out){
    if(s.empty() || s.find_first_not_of("0123456789") != std::string::npos || s.size() > 19) return false;
    out = std::strtoull(s.c_str(), nullptr, 10);
    return true;
}

struct ConditionSpec { std::string field, op, value; bool negate = false; };

// Lower-cased canonical text of a subject field.
std::string subject_text(RuleField f, const RuleSubject& s){
    switch(f){
        case RuleField::State: return lower(state_name(s.conn.state));
        case RuleField::Protocol: return protocol_name(s.conn.protocol);
        case RuleField::Locality: return locality_name(s.locality);
        case RuleField::Process: return s.conn.process_name.value_or("");
        case RuleField::RemoteAddr: return s.conn.remote_addr;
        default: return "";
    }
}

uint64_t subject_number(RuleField f, const RuleSubject& s){
    switch(f){
        case RuleField::LocalPort: return s.conn.local_port;
        case RuleField::RemotePort: return s.conn.remote_port;
        case RuleField::RepeatCount: return s.repeat_count;
        default: return 0;
    }
}

bool compare(const PredicateNode& n, const RuleSubject& s){
    if(is_numeric_field(n.field)){
        uint64_t v = subject_number(n.field, s);
        switch(n.op){
            case RuleOp::Equals:
            case RuleOp::In: return std::find(n.numbers.begin(), n.numbers.end(), v) != n.numbers.end();
            case RuleOp::Gte: return !n.numbers.empty() && v >= n.numbers.front();
            case RuleOp::Lte: return !n.numbers.empty() && v <= n.numbers.front();
            default: return false;
        }
    }
    std::string v = subject_text(n.field, s);
    switch(n.op){
        case RuleOp::Equals:
        case RuleOp::In: {
            std::string lv = lower(v);
            return std::find(n.text.begin(), n.text.end(), lv) != n.text.end();
        }
        case RuleOp::Contains: return !n.text.empty() && v.find(n.text.front()) != std::string::npos;
        case RuleOp::Regex: return n.pattern && std::regex_search(v, *n.pattern);
        default: return false;
    }
}

}

bool parse_rule_field(const std::string& name, RuleField& out){
    static const std::map<std::string, RuleField> fields = {
        {"state", RuleField::State}, {"protocol", RuleField::Protocol},
        {"local_port", RuleField::LocalPort}, {"remote_port", RuleField::RemotePort},
        {"remote_addr", RuleField::RemoteAddr}, {"locality", RuleField::Locality},
        {"repeat_count", RuleField::RepeatCount}, {"process", RuleField::Process}
    };
    auto it = fields.find(lower(name));
    if(it == fields.end()) return false;
    out = it->second;
    return true;
}

bool parse_rule_op(const std::string& name, RuleOp& out){
    static const std::map<std::string, RuleOp> ops = {
        {"equals", RuleOp::Equals}, {"in", RuleOp::In}, {"gte", RuleOp::Gte},
        {"lte", RuleOp::Lte}, {"contains", RuleOp::Contains}, {"regex", RuleOp::Regex}
    };
    auto it = ops.find(lower(name));
    if(it == ops.end()) return false;
    out = it->second;
    return true;
}

bool is_numeric_field(RuleField f){
    return f == RuleField::LocalPort || f == RuleField::RemotePort || f == RuleField::RepeatCount;
}

bool evaluate(const PredicateNode& node, const RuleSubject& subject){
    switch(node.kind){
        case PredicateNode::Kind::Compare: return compare(node, subject);
        case PredicateNode::Kind::Not: return !node.children.empty() && !evaluate(node.children.front(), subject);
        case PredicateNode::Kind::All:
            return std::all_of(node.children.begin(), node.children.end(), [&](const PredicateNode& c){ return evaluate(c, subject); });
        case PredicateNode::Kind::Any:
            return std::any_of(node.children.begin(), node.children.end(), [&](const PredicateNode& c){ return evaluate(c, subject); });
    }
    return false;
}

void RuleEngine::add_warning(const std::string& id, const std::string& code, const std::string& detail){
    warnings_.push_back(RuleWarning{id, code, detail});
    Logger::instance().debug("rule " + (id.empty() ? std::string("<none>") : id) + ": " + code + (detail.empty() ? "" : " (" + detail + ")"));
}

void RuleEngine::clear(){
    rules_.clear();
    warnings_.clear();
}

void RuleEngine::finalize_rule(const std::vector<std::pair<std::string,std::string>>& kv, const std::string& source){
    Rule rule;
    std::string logic = "all";
    std::string version = "1";
    std::string severity = "low";
    std::map<long, ConditionSpec> conds;

    for(const auto& [key, value] : kv){
        if(key == "id") rule.id = value;
        else if(key == "name") rule.name = value;
        else if(key == "description") rule.description = value;
        else if(key == "severity") severity = value;
        else if(key == "tags") rule.tags = split_csv(value);
        else if(key == "logic") logic = lower(value);
        else if(key == "rule_version") version = value;
        else if(key == "field" || key == "op" || key == "value" || key == "negate"){
            auto& c = conds[-1]; // bare keys form a leading condition
            if(key == "field") c.field = value; else if(key == "op") c.op = value;
            else if(key == "value") c.value = value; else c.negate = lower(value) == "true";
        }
        else if(key.rfind("condition", 0) == 0){
            auto dot = key.find('.');
            if(dot == std::string::npos) continue;
            std::string idx = key.substr(9, dot - 9);
            uint64_t n = 0;
            if(!parse_u64(idx, n)) continue;
            auto& c = conds[static_cast<long>(n)];
            std::string attr = key.substr(dot + 1);
            if(attr == "field") c.field = value; else if(attr == "op") c.op = value;
            else if(attr == "value") c.value = value; else if(attr == "negate") c.negate = lower(value) == "true";
        }
        // other keys (mitre, references, ...) are informational
    }

    if(rule.id.empty()) return; // rules without an id are skipped
    if(rule.name.empty()) rule.name = rule.id;

    if(version != "1"){ add_warning(rule.id, "unsupported_version", version); return; }
    if(!parse_severity(severity, rule.severity)){ add_warning(rule.id, "bad_severity", severity); return; }
    if(logic != "all" && logic != "any"){ add_warning(rule.id, "bad_value", "logic=" + logic); return; }
    if(conds.empty()){ add_warning(rule.id, "no_conditions", source); return; }
    if(conds.size() > MAX_CONDITIONS){ add_warning(rule.id, "too_many_conditions", std::to_string(conds.size())); return; }
    if(std::any_of(rules_.begin(), rules_.end(), [&](const Rule& r){ return r.id == rule.id; })){
        add_warning(rule.id, "duplicate_id", source); return;
    }
    if(rules_.size() >= MAX_RULES){
        bool reported = std::any_of(warnings_.begin(), warnings_.end(), [](const RuleWarning& w){ return w.code == "max_rules_exceeded"; });
        if(!reported) add_warning(rule.id, "max_rules_exceeded", std::to_string(MAX_RULES));
        return;
    }

    rule.predicate.kind = logic == "any" ? PredicateNode::Kind::Any : PredicateNode::Kind::All;
    for(const auto& [idx, spec] : conds){
        PredicateNode leaf;
        leaf.kind = PredicateNode::Kind::Compare;
        if(!parse_rule_field(spec.field, leaf.field)){ add_warning(rule.id, "unknown_field", spec.field); return; }
        std::string op = spec.op.empty() ? "equals" : spec.op;
        if(!parse_rule_op(op, leaf.op)){ add_warning(rule.id, "unknown_op", op); return; }

        bool numeric = is_numeric_field(leaf.field);
        bool text_op = leaf.op == RuleOp::Contains || leaf.op == RuleOp::Regex;
        bool range_op = leaf.op == RuleOp::Gte || leaf.op == RuleOp::Lte;
        if((numeric && text_op) || (!numeric && range_op)){
            add_warning(rule.id, "unknown_op", op + " not valid for " + spec.field); return;
        }

        std::vector<std::string> operands;
        if(leaf.op == RuleOp::In) operands = split_csv(spec.value);
        else operands.push_back(spec.value);
        if(operands.empty() || (operands.size() == 1 && operands.front().empty() && leaf.op != RuleOp::Equals)){
            add_warning(rule.id, "bad_value", spec.field + " has no operand"); return;
        }

        if(numeric){
            for(const auto& o : operands){
                uint64_t n = 0;
                if(!parse_u64(o, n)){ add_warning(rule.id, "bad_value", spec.field + "=" + o); return; }
                leaf.numbers.push_back(n);
            }
        } else if(leaf.op == RuleOp::Regex){
            if(spec.value.size() > MAX_REGEX_LENGTH){ add_warning(rule.id, "regex_too_long", std::to_string(spec.value.size())); return; }
            try {
                leaf.pattern = std::make_shared<const std::regex>(spec.value, std::regex::ECMAScript);
            } catch(const std::regex_error& e){
                add_warning(rule.id, "bad_regex", e.what()); return;
            }
        } else if(leaf.op == RuleOp::Contains){
            leaf.text.push_back(spec.value);
        } else {
            for(const auto& o : operands){
                std::string canon;
                if(leaf.field == RuleField::State){
                    ConnectionState st;
                    if(!parse_state(o, st)){ add_warning(rule.id, "bad_value", "state=" + o); return; }
                    canon = lower(state_name(st));
                } else if(leaf.field == RuleField::Protocol){
                    Protocol p;
                    if(!parse_protocol(o, p)){ add_warning(rule.id, "bad_value", "protocol=" + o); return; }
                    canon = protocol_name(p);
                } else if(leaf.field == RuleField::Locality){
                    Locality l;
                    if(!parse_locality(o, l)){ add_warning(rule.id, "bad_value", "locality=" + o); return; }
                    canon = locality_name(l);
                } else {
                    canon = lower(o);
                }
                leaf.text.push_back(canon);
            }
        }

        if(spec.negate){
            PredicateNode neg;
            neg.kind = PredicateNode::Kind::Not;
            neg.children.push_back(std::move(leaf));
            rule.predicate.children.push_back(std::move(neg));
        } else {
            rule.predicate.children.push_back(std::move(leaf));
        }
    }

    rules_.push_back(std::move(rule));
}

void RuleEngine::load_text(const std::string& content, const std::string& source){
    std::istringstream in(content);
    std::string line;
    std::vector<std::pair<std::string,std::string>> current;
    bool in_rule = false;
    while(std::getline(in, line)){
        line = trim(line);
        if(line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if(eq == std::string::npos) continue;
        std::string key = lower(trim(line.substr(0, eq)));
        std::string value = trim(line.substr(eq + 1));
        if(key == "id"){
            if(in_rule) finalize_rule(current, source);
            current.clear();
            in_rule = true;
        }
        current.emplace_back(key, value);
    }
    if(!current.empty()) finalize_rule(current, source);
}

void RuleEngine::load_dir(const std::string& dir, std::string& warnings_out){
    warnings_out.clear();
    if(dir.empty()) return;
    size_t first_new = warnings_.size();

    std::error_code ec;
    if(!fs::is_directory(dir, ec)){
        add_warning("", "rules_dir_missing", dir);
    } else {
        std::vector<fs::path> files;
        for(const auto& entry : fs::directory_iterator(dir, fs::directory_options::skip_permission_denied, ec)){
            if(entry.is_regular_file() && entry.path().extension() == ".rule") files.push_back(entry.path());
        }
        std::sort(files.begin(), files.end());
        for(const auto& p : files){
            std::ifstream f(p);
            if(!f) { Logger::instance().warn("cannot read rule file " + p.string()); continue; }
            std::stringstream buf;
            buf << f.rdbuf();
            load_text(buf.str(), p.filename().string());
        }
        Logger::instance().debug("loaded " + std::to_string(rules_.size()) + " rules from " + dir);
    }

    for(size_t i = first_new; i < warnings_.size(); ++i){
        if(!warnings_out.empty()) warnings_out += ",";
        warnings_out += warnings_[i].code;
    }
}

std::vector<const Rule*> RuleEngine::match(const RuleSubject& subject) const {
    std::vector<const Rule*> out;
    for(const auto& r : rules_){
        if(evaluate(r.predicate, subject)) out.push_back(&r);
    }
    return out;
}

}
