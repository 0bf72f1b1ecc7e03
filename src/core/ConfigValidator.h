#pragma once
#include "Config.h"
#include <string>

namespace netgrave {

// Normalises a Config parsed from the command line and rejects inconsistent
// combinations. Messages go to stderr; the caller exits with status 2 on false.
class ConfigValidator {
public:
    bool validate(Config& cfg);
private:
    bool validate_protocol(const std::string& proto) const;
    void clamp_refresh(Config& cfg) const;
};

}
