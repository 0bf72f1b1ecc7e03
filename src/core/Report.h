#pragma once
#include <string>
#include <vector>
#include <mutex>
#include <chrono>

namespace netgrave {

// Non-error side channel for collection problems. None of these abort a scan;
// they tell the caller why a result may be empty or partial.
enum class WarnCode {
    NetTableUnreadable,     // a /proc/net table could not be opened (privilege or missing family)
    MalformedRecord,        // one or more table lines failed to parse
    SocketLimitReached,     // max_sockets truncated the scan
    ProcessTableUnreadable, // no process file-descriptor table was readable
    RulesUnavailable        // rule set missing or rejected; running with zero rules
};

const char* warn_code_name(WarnCode code);

struct ReportWarning {
    std::string source;
    WarnCode code;
    std::string detail;
};

struct StageTiming {
    std::string stage;
    std::chrono::steady_clock::time_point start_time;
    std::chrono::steady_clock::time_point end_time;
};

// Collection diagnostics for one pipeline pass.
class Report {
public:
    void start_stage(const std::string& name);
    void end_stage(const std::string& name);
    void add_warning(const std::string& source, WarnCode code, const std::string& detail);
    void add_error(const std::string& source, const std::string& message);
    void clear();

    bool has_warning(WarnCode code) const;
    std::vector<ReportWarning> warnings() const;
    std::vector<std::pair<std::string,std::string>> errors() const;
    std::vector<StageTiming> timings() const;
private:
    std::vector<ReportWarning> warnings_;
    std::vector<std::pair<std::string,std::string>> errors_; // (stage, message)
    std::vector<StageTiming> timings_;
    mutable std::mutex mutex_;
};

}
