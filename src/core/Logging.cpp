#include "Logging.h"
#include <iostream>
#include <algorithm>
#include <cctype>

namespace netgrave {

Logger& Logger::instance(){
    static Logger inst;
    return inst;
}

void Logger::log(LogLevel lvl, const std::string& msg){
    if(static_cast<int>(lvl) > static_cast<int>(level_.load())) return;
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr << "[" << log_level_name(lvl) << "] " << msg << "\n";
}

const char* log_level_name(LogLevel lvl){
    switch(lvl){
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Info: return "INFO";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Trace: return "TRACE";
    }
    return "INFO";
}

bool parse_log_level(const std::string& name, LogLevel& out){
    std::string s = name; std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    if(s=="error") { out = LogLevel::Error; return true; }
    if(s=="warn" || s=="warning") { out = LogLevel::Warn; return true; }
    if(s=="info") { out = LogLevel::Info; return true; }
    if(s=="debug") { out = LogLevel::Debug; return true; }
    if(s=="trace") { out = LogLevel::Trace; return true; }
    return false;
}

}
