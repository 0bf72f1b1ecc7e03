#pragma once
#include "Config.h"
#include "Report.h"
#include "Connection.h"
#include <vector>

namespace netgrave {

// Per-pass state handed to every pipeline stage. Stages read the config,
// append to or annotate the connection list, and log problems to the report.
struct ScanContext {
    ScanContext(const Config& cfg, Report& rep) : config(cfg), report(rep) {}
    const Config& config;
    Report& report;
    std::vector<Connection> connections;
};

}
