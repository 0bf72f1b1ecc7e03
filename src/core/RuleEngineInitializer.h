#pragma once
#include "Config.h"
#include "RuleEngine.h"
#include <string>

namespace netgrave {

// Validates the configured rules directory and loads it into an engine.
// On any rejection the engine is left empty: classification continues with
// zero rules.
// skip_permission_checks is for fixtures in scratch directories and disables
// the ownership and group/other-writable checks.
class RuleEngineInitializer {
public:
    explicit RuleEngineInitializer(RuleEngine& engine, bool skip_permission_checks = false)
        : engine_(engine), skip_permission_checks_(skip_permission_checks) {}
    bool initialize(const Config& cfg);
    const std::string& last_error() const { return last_error_; }
private:
    bool validate_rules_directory(const std::string& path);
    bool validate_rule_file(const std::string& path);
    RuleEngine& engine_;
    bool skip_permission_checks_;
    std::string last_error_;
};

}
