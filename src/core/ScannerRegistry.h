#pragma once
#include "Scanner.h"
#include <vector>

namespace netgrave {

class ScannerRegistry {
public:
    void register_scanner(ScannerPtr scanner);
    // Socket table scanner followed by the process correlator.
    void register_all_default();
    // Runs every stage in order. A stage that throws is recorded as a report
    // error and the remaining stages still run.
    void run_all(ScanContext& context);
    size_t size() const { return scanners_.size(); }
private:
    std::vector<ScannerPtr> scanners_;
};

}
