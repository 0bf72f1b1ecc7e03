#include "Report.h"
#include <algorithm>

namespace netgrave {

const char* warn_code_name(WarnCode code){
    switch(code){
        case WarnCode::NetTableUnreadable: return "net_table_unreadable";
        case WarnCode::MalformedRecord: return "malformed_record";
        case WarnCode::SocketLimitReached: return "socket_limit_reached";
        case WarnCode::ProcessTableUnreadable: return "process_table_unreadable";
        case WarnCode::RulesUnavailable: return "rules_unavailable";
    }
    return "unknown";
}

void Report::start_stage(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    StageTiming t;
    t.stage = name;
    t.start_time = std::chrono::steady_clock::now();
    t.end_time = t.start_time;
    timings_.push_back(std::move(t));
}

void Report::end_stage(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(timings_.rbegin(), timings_.rend(), [&](auto& t){ return t.stage == name; });
    if(it != timings_.rend()) {
        it->end_time = std::chrono::steady_clock::now();
    }
}

void Report::add_warning(const std::string& source, WarnCode code, const std::string& detail){
    std::lock_guard<std::mutex> lock(mutex_);
    warnings_.push_back(ReportWarning{source, code, detail});
}

void Report::add_error(const std::string& source, const std::string& message){
    std::lock_guard<std::mutex> lock(mutex_);
    errors_.emplace_back(source, message);
}

void Report::clear(){
    std::lock_guard<std::mutex> lock(mutex_);
    warnings_.clear(); errors_.clear(); timings_.clear();
}

bool Report::has_warning(WarnCode code) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(warnings_.begin(), warnings_.end(), [&](const ReportWarning& w){ return w.code == code; });
}

std::vector<ReportWarning> Report::warnings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return warnings_;
}

std::vector<std::pair<std::string,std::string>> Report::errors() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return errors_;
}

std::vector<StageTiming> Report::timings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timings_;
}

}
