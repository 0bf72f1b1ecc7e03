#include "ScannerRegistry.h"
#include "ScanContext.h"
#include "Logging.h"
#include "../scanners/SocketScanner.h"
#include "../scanners/ProcessCorrelator.h"

namespace netgrave {

void ScannerRegistry::register_scanner(ScannerPtr scanner) {
    scanners_.push_back(std::move(scanner));
}

void ScannerRegistry::register_all_default() {
    register_scanner(std::make_unique<SocketScanner>());
    register_scanner(std::make_unique<ProcessCorrelator>());
}

void ScannerRegistry::run_all(ScanContext& context) {
    for(auto& s : scanners_) {
        Logger::instance().trace("Starting stage: " + s->name());
        context.report.start_stage(s->name());
        try {
            s->scan(context);
        } catch(const std::exception& ex) {
            Logger::instance().warn("stage " + s->name() + " failed: " + ex.what());
            context.report.add_error(s->name(), ex.what());
        }
        context.report.end_stage(s->name());
        Logger::instance().trace("Finished stage: " + s->name() + " (" + std::to_string(context.connections.size()) + " connections)");
    }
}

}
