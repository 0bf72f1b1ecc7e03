#include "RuleEngineInitializer.h"
#include "Logging.h"
#include <sys/stat.h>
#include <unistd.h>
#include <limits.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace netgrave {

namespace {
const size_t MAX_RULE_FILES = 50;
const size_t MAX_RULE_LINE = 1000;
const size_t MAX_RULES_PER_FILE = 100;
}

bool RuleEngineInitializer::initialize(const Config& cfg) {
    engine_.clear();
    last_error_.clear();
    if(cfg.rules_dir.empty()) {
        return true; // no rules configured
    }

    char rbuf[PATH_MAX];
    std::string canon_rules = cfg.rules_dir;
    if(realpath(cfg.rules_dir.c_str(), rbuf)) {
        canon_rules = rbuf;
    }

    if(!validate_rules_directory(canon_rules)) {
        Logger::instance().warn("rules disabled: " + last_error_);
        return false;
    }

    std::string warn;
    engine_.load_dir(canon_rules, warn);
    if(!warn.empty()) {
        Logger::instance().warn(std::string("rules: ") + warn);
    }
    Logger::instance().info("loaded " + std::to_string(engine_.rules().size()) + " suspicion rules from " + canon_rules);
    return true;
}

bool RuleEngineInitializer::validate_rules_directory(const std::string& path) {
    struct stat rs{};
    if(stat(path.c_str(), &rs) != 0 || !S_ISDIR(rs.st_mode)) {
        last_error_ = "rules directory not accessible: " + path;
        return false;
    }

    if(!skip_permission_checks_) {
        if(rs.st_uid != 0 && rs.st_uid != geteuid()) {
            last_error_ = "refusing rules directory not owned by root or the current user: " + path;
            return false;
        }
        if(rs.st_mode & (S_IWGRP | S_IWOTH)) {
            last_error_ = "refusing group/other-writable rules directory: " + path;
            return false;
        }
    }

    size_t count = 0;
    std::error_code ec;
    for(const auto& entry : std::filesystem::directory_iterator(path, std::filesystem::directory_options::skip_permission_denied, ec)) {
        if(!entry.is_regular_file() || entry.path().extension() != ".rule") continue;
        if(++count > MAX_RULE_FILES) {
            last_error_ = "too many rule files in " + path;
            return false;
        }
        if(!validate_rule_file(entry.path().string())) return false;
    }
    return true;
}

bool RuleEngineInitializer::validate_rule_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if(!file) {
        last_error_ = "cannot open rule file: " + path;
        return false;
    }
    std::string line;
    size_t rules = 0;
    while(std::getline(file, line)) {
        if(line.find('\0') != std::string::npos) {
            last_error_ = "rule file contains binary data: " + path;
            return false;
        }
        if(line.size() > MAX_RULE_LINE) {
            last_error_ = "rule file contains very long line: " + path;
            return false;
        }
        if(line.rfind("id=", 0) == 0) ++rules;
    }
    if(rules > MAX_RULES_PER_FILE) {
        last_error_ = "too many rules in single file: " + path;
        return false;
    }
    return true;
}

}
