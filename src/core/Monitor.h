#pragma once
#include "Config.h"
#include "Connection.h"
#include "Topology.h"
#include "LayoutEngine.h"
#include "Report.h"
#include "RuleEngine.h"
#include "ScannerRegistry.h"
#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace netgrave {

using Clock = std::chrono::steady_clock;

constexpr double PULSE_STEP = 0.05;
constexpr std::chrono::milliseconds BLINK_INTERVAL{500};
constexpr std::chrono::milliseconds CHANGE_HIGHLIGHT_DURATION{500};
constexpr std::chrono::milliseconds FRAME_TIME_THRESHOLD{100};
constexpr unsigned SLOW_FRAME_COUNT_THRESHOLD = 5;
constexpr size_t ACTIVITY_HISTORY_LEN = 60;

enum class MonitorPhase { Idle, Scanning, LayingOut, Rendered };
enum class ViewMode { Host, Process };

const char* monitor_phase_name(MonitorPhase p);
const char* view_mode_name(ViewMode m);

struct RefreshState {
    uint64_t refresh_ms = DEFAULT_REFRESH_MS;
    uint64_t data_multiplier = DEFAULT_DATA_MULTIPLIER;
    std::optional<Clock::time_point> last_scan;
    std::optional<Clock::time_point> last_tick;
    std::optional<Clock::time_point> last_blink;
    std::optional<Clock::time_point> interval_changed_at;
    uint64_t tick_counter = 0;
    double pulse_phase = 0.0; // [0, 1)
    bool blink = true;
    std::optional<size_t> selected; // index into the displayed connection list
    ViewMode mode = ViewMode::Host;
    std::optional<int> focused_pid;

    std::chrono::milliseconds ui_interval() const { return std::chrono::milliseconds(refresh_ms); }
    std::chrono::milliseconds data_interval() const { return std::chrono::milliseconds(refresh_ms * data_multiplier); }
};

// Drives the scan -> correlate -> classify -> aggregate -> layout pipeline on
// a cooperative tick schedule and owns the published Graph. Single-threaded:
// only request_stop() may be called from another context (signal handler).
class Monitor {
public:
    Monitor(const Config& cfg, ScannerRegistry& registry, const RuleEngine& rules);

    // One UI tick. Rescans when the data interval elapsed (or a rescan was
    // requested), re-lays out when the canvas size changed.
    void tick(Clock::time_point now, int canvas_width, int canvas_height);

    // Commands from the input layer
    void select_next();
    void select_previous();
    bool toggle_focus(); // false when focus could not be entered
    void increase_refresh_rate(Clock::time_point now);
    void decrease_refresh_rate(Clock::time_point now);
    void increase_data_interval(Clock::time_point now);
    void decrease_data_interval(Clock::time_point now);
    void set_list_view(bool enabled);
    void request_rescan() { rescan_requested_ = true; }
    void request_stop() noexcept { stop_.store(true); }
    bool stop_requested() const noexcept { return stop_.load(); }

    // Frame pacing: sustained slow frames reduce animation detail.
    void record_frame(Clock::time_point now);
    void reset_animation_reduction();
    bool animation_reduced() const { return animation_reduced_; }

    bool interval_recently_changed(Clock::time_point now) const;
    void set_latency_samples(std::unordered_map<std::string, uint64_t> samples);
    // Reported with every scan while the rule set is disabled.
    void set_rules_unavailable(const std::string& reason) { rules_unavailable_ = reason; }

    MonitorPhase phase() const { return phase_; }
    const RefreshState& state() const { return state_; }
    std::shared_ptr<const Graph> graph() const { return graph_; }
    const LayoutConfig& layout() const { return layout_; }
    const std::vector<Connection>& connections() const { return displayed_; } // filtered by focus
    const std::vector<Connection>& all_connections() const { return raw_; }
    const Connection* selected_connection() const;
    const Report& report() const { return report_; }
    const std::deque<uint64_t>& activity_history() const { return activity_; }
    uint64_t graph_generation() const { return generation_; }
private:
    void run_scan();
    void rebuild_graph(int canvas_width, int canvas_height);
    void relayout(int canvas_width, int canvas_height);
    void clamp_selection();
    void update_activity();
    std::vector<Connection> filter_for_view() const;

    Config cfg_;
    ScannerRegistry& registry_;
    const RuleEngine& rules_;
    RefreshState state_;
    MonitorPhase phase_ = MonitorPhase::Idle;
    std::shared_ptr<const Graph> graph_;
    LayoutConfig layout_;
    std::optional<std::pair<int,int>> laid_out_for_;
    std::vector<Connection> raw_;
    std::vector<Connection> displayed_;
    Report report_;
    std::string last_warning_summary_;
    std::string rules_unavailable_;
    std::deque<uint64_t> activity_;
    std::unordered_map<std::string, uint64_t> latency_samples_;
    std::optional<Clock::time_point> last_frame_;
    unsigned slow_frames_ = 0;
    bool animation_reduced_ = false;
    bool rescan_requested_ = false;
    bool regroup_pending_ = false;
    bool in_flight_ = false;
    uint64_t generation_ = 0;
    std::atomic<bool> stop_{false};
};

}
