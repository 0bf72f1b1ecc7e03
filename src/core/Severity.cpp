#include "Severity.h"
#include <algorithm>
#include <cctype>

namespace netgrave {

const char* severity_to_string(Severity s){
    switch(s){
        case Severity::Low: return "low";
        case Severity::Medium: return "medium";
        case Severity::High: return "high";
        case Severity::Critical: return "critical";
    }
    return "low";
}

bool parse_severity(const std::string& name, Severity& out){
    std::string s=name; std::transform(s.begin(),s.end(),s.begin(),[](unsigned char c){ return std::tolower(c); });
    if(s=="low") { out=Severity::Low; return true; }
    if(s=="medium") { out=Severity::Medium; return true; }
    if(s=="high") { out=Severity::High; return true; }
    if(s=="critical") { out=Severity::Critical; return true; }
    return false;
}

int severity_rank(Severity s){ return static_cast<int>(s); }

}
