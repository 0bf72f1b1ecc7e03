#include "core/Config.h"
#include "core/ConfigValidator.h"
#include "core/GraphWriter.h"
#include "core/Logging.h"
#include "core/Monitor.h"
#include "core/Privilege.h"
#include "core/RuleEngine.h"
#include "core/RuleEngineInitializer.h"
#include "core/ScannerRegistry.h"
#include "BuildInfo.h" // configured header (CMake adds generated dir to include path)
#include <algorithm>
#include <chrono>
#include <csignal>
#include <fstream>
#include <functional>
#include <iostream>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace netgrave;

namespace {

Monitor* g_monitor = nullptr;

void handle_stop_signal(int){
    if(g_monitor) g_monitor->request_stop();
}

void print_help(){
    std::cout << "netgrave options:\n";
    struct Line { std::string name; std::string help; };
    static const std::vector<Line> lines = {
        {"--proc-root DIR", "Read socket and process tables under DIR (default /proc)"},
        {"--protocol tcp|udp", "Only scan one protocol family"},
        {"--no-ipv6", "Skip tcp6/udp6 tables"},
        {"--max-sockets N", "Stop reading after N sockets (0 = unlimited)"},
        {"--refresh-ms N", "UI tick interval in ms (50..10000)"},
        {"--data-multiplier N", "Scan every N ticks (1..60)"},
        {"--latency-low-ms N", "Upper bound of the low latency ring"},
        {"--latency-high-ms N", "Upper bound of the medium latency ring"},
        {"--max-endpoints N", "Endpoints drawn in the map view"},
        {"--list-view", "Use the larger list-view endpoint ceiling"},
        {"--rules-dir DIR", "Directory with .rule suspicion rules"},
        {"--focus-pid PID", "Start focused on one process"},
        {"--canvas WxH", "Layout canvas size (default 100x100)"},
        {"--once", "Run a single scan and exit"},
        {"--iterations N", "Stop after N ticks"},
        {"--output FILE", "Write JSON snapshots to FILE (default stdout)"},
        {"--pretty", "Pretty-print JSON"},
        {"--drop-priv", "Drop Linux capabilities early"},
        {"--keep-cap-dac", "Retain /proc read capabilities when dropping"},
        {"--seccomp", "Apply seccomp profile"},
        {"--seccomp-strict", "Fail if seccomp apply fails"},
        {"--log-level LVL", "error|warn|info|debug|trace"},
        {"--version", "Print version & exit"},
        {"--help", "Show this help"}
    };
    for(const auto& l : lines){ std::cout << "  " << l.name; if(l.name.size() < 30) for(size_t i=l.name.size(); i<30; ++i) std::cout << ' '; else std::cout<<' '; std::cout << l.help << "\n"; }
}

bool parse_canvas(const std::string& v, int& w, int& h){
    auto x = v.find('x');
    if(x == std::string::npos) return false;
    try {
        size_t used = 0;
        w = std::stoi(v.substr(0, x), &used);
        if(used != x) return false;
        std::string rest = v.substr(x + 1);
        h = std::stoi(rest, &used);
        return used == rest.size();
    } catch(const std::exception&) {
        return false;
    }
}

bool emit(const std::string& json, const std::string& output_file){
    if(output_file.empty()) {
        std::cout << json << std::flush;
        return static_cast<bool>(std::cout);
    }
    std::ofstream ofs(output_file, std::ios::trunc);
    if(!ofs) return false;
    ofs << json;
    return static_cast<bool>(ofs);
}

}

int main(int argc, char** argv) {
    Logger::instance().set_level(LogLevel::Info);
    Config cfg;
    enum class ArgKind { None, String, Int };
    struct FlagSpec { const char* name; ArgKind kind; std::function<void(const std::string&)> apply; };
    auto need_int = [](const std::string& v, const char* flag){
        try { return std::stoll(v); }
        catch(const std::exception&) { std::cerr<<"Invalid integer for "<<flag<<"\n"; std::exit(2); }
    };
    auto need_unsigned = [&](const std::string& v, const char* flag){
        long long n = need_int(v, flag);
        if(n < 0){ std::cerr<<"Negative value for "<<flag<<"\n"; std::exit(2); }
        return static_cast<uint64_t>(n);
    };
    std::vector<FlagSpec> specs = {
        {"--proc-root", ArgKind::String, [&](const std::string& v){ cfg.proc_root = v; }},
        {"--protocol", ArgKind::String, [&](const std::string& v){ cfg.protocol = v; }},
        {"--no-ipv6", ArgKind::None, [&](const std::string&){ cfg.include_ipv6 = false; }},
        {"--max-sockets", ArgKind::Int, [&](const std::string& v){ cfg.max_sockets = static_cast<int>(need_int(v, "--max-sockets")); }},
        {"--refresh-ms", ArgKind::Int, [&](const std::string& v){ cfg.refresh_ms = need_unsigned(v, "--refresh-ms"); }},
        {"--data-multiplier", ArgKind::Int, [&](const std::string& v){ cfg.data_multiplier = need_unsigned(v, "--data-multiplier"); }},
        {"--latency-low-ms", ArgKind::Int, [&](const std::string& v){ cfg.latency_low_ms = need_unsigned(v, "--latency-low-ms"); }},
        {"--latency-high-ms", ArgKind::Int, [&](const std::string& v){ cfg.latency_high_ms = need_unsigned(v, "--latency-high-ms"); }},
        {"--max-endpoints", ArgKind::Int, [&](const std::string& v){ cfg.max_visible_endpoints = need_unsigned(v, "--max-endpoints"); }},
        {"--list-view", ArgKind::None, [&](const std::string&){ cfg.list_view = true; }},
        {"--rules-dir", ArgKind::String, [&](const std::string& v){ cfg.rules_dir = v; }},
        {"--focus-pid", ArgKind::Int, [&](const std::string& v){ cfg.focus_pid = static_cast<int>(need_int(v, "--focus-pid")); }},
        {"--canvas", ArgKind::String, [&](const std::string& v){ if(!parse_canvas(v, cfg.canvas_width, cfg.canvas_height)){ std::cerr<<"Invalid --canvas value: "<<v<<"\n"; std::exit(2); } }},
        {"--once", ArgKind::None, [&](const std::string&){ cfg.once = true; }},
        {"--iterations", ArgKind::Int, [&](const std::string& v){ cfg.iterations = static_cast<int>(need_int(v, "--iterations")); }},
        {"--output", ArgKind::String, [&](const std::string& v){ cfg.output_file = v; }},
        {"--pretty", ArgKind::None, [&](const std::string&){ cfg.pretty = true; }},
        {"--drop-priv", ArgKind::None, [&](const std::string&){ cfg.drop_priv = true; }},
        {"--keep-cap-dac", ArgKind::None, [&](const std::string&){ cfg.keep_cap_dac = true; }},
        {"--seccomp", ArgKind::None, [&](const std::string&){ cfg.seccomp = true; }},
        {"--seccomp-strict", ArgKind::None, [&](const std::string&){ cfg.seccomp_strict = true; }},
        {"--log-level", ArgKind::String, [&](const std::string& v){ cfg.log_level = v; }}
    };
    auto find_spec = [&](const std::string& flag)->FlagSpec*{ for(auto& s: specs) if(flag==s.name) return &s; return nullptr; };
    for(int i=1;i<argc;++i){
        std::string a = argv[i];
        if(a=="--help"){ print_help(); return 0; }
        if(a=="--version"){ std::cout << "netgrave " << netgrave::buildinfo::APP_VERSION << " (compiler=" << netgrave::buildinfo::COMPILER_ID << " " << netgrave::buildinfo::COMPILER_VERSION << ", cxx_std=" << netgrave::buildinfo::CXX_STANDARD << ")\n"; return 0; }
        auto* spec = find_spec(a);
        if(!spec){ std::cerr << "Unknown arg: "<<a<<"\n"; print_help(); return 2; }
        std::string val;
        if(spec->kind != ArgKind::None){
            if(i+1>=argc){ std::cerr << "Missing value for "<<a<<"\n"; return 2; }
            val = argv[++i];
        }
        spec->apply(val);
    }

    char host_buf[256] = {};
    if(gethostname(host_buf, sizeof(host_buf) - 1) == 0) cfg.host_name = host_buf;
    else Logger::instance().debug("gethostname failed; centre node shows HOST only");

    ConfigValidator validator;
    if(!validator.validate(cfg)) return 2;

    LogLevel lvl = LogLevel::Info;
    if(parse_log_level(cfg.log_level, lvl)) Logger::instance().set_level(lvl);

    if(cfg.drop_priv){
        if(!drop_capabilities(cfg.keep_cap_dac)) Logger::instance().warn("capability drop not applied");
    }
    // Seccomp goes on after the capability drop and before the first scan.
    if(cfg.seccomp){
        if(!apply_seccomp_profile()){
            std::cerr << "Failed to apply seccomp profile";
            if(cfg.seccomp_strict){ std::cerr << "\n"; return 4; }
            std::cerr << " (continuing)\n";
        }
    }

    RuleEngine rules;
    RuleEngineInitializer rules_init(rules);
    bool rules_ok = rules_init.initialize(cfg);

    ScannerRegistry registry;
    registry.register_all_default();

    Monitor monitor(cfg, registry, rules);
    if(!rules_ok) monitor.set_rules_unavailable(rules_init.last_error());
    g_monitor = &monitor;
    std::signal(SIGINT, handle_stop_signal);
    std::signal(SIGTERM, handle_stop_signal);

    GraphWriter writer;
    uint64_t written_generation = 0;
    int ticks = 0;
    int rc = 0;
    while(!monitor.stop_requested()){
        auto started = Clock::now();
        monitor.tick(started, cfg.canvas_width, cfg.canvas_height);
        ++ticks;
        if(monitor.graph_generation() != written_generation){
            if(!emit(writer.write(monitor, cfg.pretty), cfg.output_file)){
                Logger::instance().error("failed to write snapshot to " + (cfg.output_file.empty() ? std::string("stdout") : cfg.output_file));
                rc = 1;
                break;
            }
            written_generation = monitor.graph_generation();
        }
        monitor.record_frame(Clock::now());
        if(cfg.iterations > 0 && ticks >= cfg.iterations) break;
        auto next = started + monitor.state().ui_interval();
        // Sleep in short slices so a stop signal is honoured promptly.
        while(!monitor.stop_requested() && Clock::now() < next){
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(next - Clock::now());
            std::this_thread::sleep_for(std::min(remaining, std::chrono::milliseconds(50)));
        }
    }
    g_monitor = nullptr;
    Logger::instance().debug("stopped after " + std::to_string(ticks) + " ticks");
    return rc;
}
