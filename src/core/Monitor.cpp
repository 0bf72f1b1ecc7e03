#include "Monitor.h"
#include "ScanContext.h"
#include "EndpointClassifier.h"
#include "TopologyAggregator.h"
#include "Logging.h"
#include <algorithm>
#include <cmath>
#include <iterator>

namespace netgrave {

namespace {

const uint64_t PULSE_STEPS = static_cast<uint64_t>(1.0 / PULSE_STEP + 0.5);

// Clears the in-flight flag even if a stage throws.
struct InFlightGuard {
    explicit InFlightGuard(bool& f) : flag(f) { flag = true; }
    ~InFlightGuard() { flag = false; }
    bool& flag;
};

bool is_active_state(ConnectionState s){
    switch(s){
        case ConnectionState::SynSent:
        case ConnectionState::SynRecv:
        case ConnectionState::FinWait1:
        case ConnectionState::FinWait2:
        case ConnectionState::Closing:
            return true;
        default:
            return false;
    }
}

}

const char* monitor_phase_name(MonitorPhase p){
    switch(p){
        case MonitorPhase::Idle: return "idle";
        case MonitorPhase::Scanning: return "scanning";
        case MonitorPhase::LayingOut: return "laying_out";
        case MonitorPhase::Rendered: return "rendered";
    }
    return "idle";
}

const char* view_mode_name(ViewMode m){
    return m == ViewMode::Host ? "host" : "process";
}

Monitor::Monitor(const Config& cfg, ScannerRegistry& registry, const RuleEngine& rules)
    : cfg_(cfg), registry_(registry), rules_(rules), graph_(std::make_shared<const Graph>()),
      activity_(ACTIVITY_HISTORY_LEN, 0) {
    state_.refresh_ms = std::clamp(cfg.refresh_ms, MIN_REFRESH_MS, MAX_REFRESH_MS);
    state_.data_multiplier = std::clamp(cfg.data_multiplier, MIN_DATA_MULTIPLIER, MAX_DATA_MULTIPLIER);
    if(cfg.focus_pid) {
        state_.mode = ViewMode::Process;
        state_.focused_pid = cfg.focus_pid;
    }
}

void Monitor::tick(Clock::time_point now, int canvas_width, int canvas_height) {
    if(in_flight_) {
        Logger::instance().warn("tick ignored: previous pass still in flight");
        return;
    }
    InFlightGuard guard(in_flight_);
    phase_ = MonitorPhase::Idle;

    state_.tick_counter++;
    state_.pulse_phase = static_cast<double>(state_.tick_counter % PULSE_STEPS) * PULSE_STEP;

    if(!state_.last_blink) {
        state_.last_blink = now;
    } else if(now - *state_.last_blink >= BLINK_INTERVAL) {
        state_.blink = !state_.blink;
        state_.last_blink = now;
    }

    bool scan_due = !state_.last_scan || rescan_requested_ || now - *state_.last_scan >= state_.data_interval();
    if(scan_due) {
        phase_ = MonitorPhase::Scanning;
        run_scan();
        state_.last_scan = now;
        rescan_requested_ = false;
    }

    std::pair<int,int> canvas{canvas_width, canvas_height};
    if(scan_due || regroup_pending_) {
        rebuild_graph(canvas_width, canvas_height);
        phase_ = MonitorPhase::Rendered;
    } else if(!laid_out_for_ || *laid_out_for_ != canvas) {
        relayout(canvas_width, canvas_height);
        phase_ = MonitorPhase::Rendered;
    }

    update_activity();
    state_.last_tick = now;
}

void Monitor::run_scan() {
    report_.clear();
    ScanContext ctx(cfg_, report_);
    registry_.run_all(ctx);
    raw_ = std::move(ctx.connections);
    if(!rules_unavailable_.empty()) report_.add_warning("rules", WarnCode::RulesUnavailable, rules_unavailable_);

    std::string summary;
    for(const auto& w : report_.warnings()) {
        std::string code = warn_code_name(w.code);
        if(summary.find(code) != std::string::npos) continue;
        if(!summary.empty()) summary += ",";
        summary += code;
    }
    if(summary != last_warning_summary_ && !summary.empty()) {
        Logger::instance().warn("partial visibility: " + summary);
    }
    last_warning_summary_ = summary;
    Logger::instance().debug("scan: " + std::to_string(raw_.size()) + " sockets");
}

std::vector<Connection> Monitor::filter_for_view() const {
    if(state_.mode != ViewMode::Process || !state_.focused_pid) return raw_;
    std::vector<Connection> out;
    std::copy_if(raw_.begin(), raw_.end(), std::back_inserter(out),
                 [&](const Connection& c){ return c.pid == state_.focused_pid; });
    return out;
}

void Monitor::rebuild_graph(int canvas_width, int canvas_height) {
    phase_ = MonitorPhase::Scanning;
    std::vector<Connection> view = filter_for_view();

    EndpointClassifier classifier(rules_);
    std::vector<Classification> cls = classifier.classify_all(view);

    AggregateOptions opts;
    opts.max_visible = cfg_.list_view ? cfg_.max_list_endpoints : cfg_.max_visible_endpoints;
    opts.latency = LatencyThresholds{cfg_.latency_low_ms, cfg_.latency_high_ms};
    opts.latency_samples = latency_samples_;
    opts.host_label = host_label(cfg_.host_name);
    if(state_.mode == ViewMode::Process) opts.focus_pid = state_.focused_pid;
    Graph g = aggregate(view, cls, opts);

    phase_ = MonitorPhase::LayingOut;
    layout_ = compute_layout(canvas_width, canvas_height);
    layout_graph(g, layout_);
    laid_out_for_ = std::make_pair(canvas_width, canvas_height);

    // publish only a complete pass
    graph_ = std::make_shared<const Graph>(std::move(g));
    displayed_ = std::move(view);
    regroup_pending_ = false;
    generation_++;
    clamp_selection();
}

void Monitor::relayout(int canvas_width, int canvas_height) {
    phase_ = MonitorPhase::LayingOut;
    Graph g = *graph_;
    layout_ = compute_layout(canvas_width, canvas_height);
    layout_graph(g, layout_);
    laid_out_for_ = std::make_pair(canvas_width, canvas_height);
    graph_ = std::make_shared<const Graph>(std::move(g));
    generation_++;
    Logger::instance().trace("relayout for " + std::to_string(canvas_width) + "x" + std::to_string(canvas_height));
}

void Monitor::clamp_selection() {
    if(displayed_.empty()) { state_.selected.reset(); return; }
    if(state_.selected && *state_.selected >= displayed_.size()) state_.selected = displayed_.size() - 1;
}

void Monitor::select_next() {
    if(displayed_.empty()) { state_.selected.reset(); return; }
    if(!state_.selected) { state_.selected = 0; return; }
    if(*state_.selected + 1 < displayed_.size()) state_.selected = *state_.selected + 1;
}

void Monitor::select_previous() {
    if(displayed_.empty()) { state_.selected.reset(); return; }
    if(!state_.selected) { state_.selected = displayed_.size() - 1; return; }
    if(*state_.selected > 0) state_.selected = *state_.selected - 1;
}

const Connection* Monitor::selected_connection() const {
    if(!state_.selected || *state_.selected >= displayed_.size()) return nullptr;
    return &displayed_[*state_.selected];
}

bool Monitor::toggle_focus() {
    if(state_.mode == ViewMode::Process) {
        state_.mode = ViewMode::Host;
        state_.focused_pid.reset();
        regroup_pending_ = true;
        return true;
    }
    const Connection* sel = selected_connection();
    if(!sel || !sel->pid) return false;
    state_.mode = ViewMode::Process;
    state_.focused_pid = sel->pid;
    regroup_pending_ = true;
    Logger::instance().debug("focus on pid " + std::to_string(*sel->pid));
    return true;
}

void Monitor::increase_refresh_rate(Clock::time_point now) {
    uint64_t next = state_.refresh_ms > REFRESH_STEP_MS ? state_.refresh_ms - REFRESH_STEP_MS : 0;
    state_.refresh_ms = std::max(next, MIN_REFRESH_MS);
    state_.interval_changed_at = now;
}

void Monitor::decrease_refresh_rate(Clock::time_point now) {
    state_.refresh_ms = std::min(state_.refresh_ms + REFRESH_STEP_MS, MAX_REFRESH_MS);
    state_.interval_changed_at = now;
}

void Monitor::increase_data_interval(Clock::time_point now) {
    state_.data_multiplier = std::min(state_.data_multiplier + DATA_MULTIPLIER_STEP, MAX_DATA_MULTIPLIER);
    state_.interval_changed_at = now;
}

void Monitor::decrease_data_interval(Clock::time_point now) {
    uint64_t next = state_.data_multiplier > DATA_MULTIPLIER_STEP ? state_.data_multiplier - DATA_MULTIPLIER_STEP : 0;
    state_.data_multiplier = std::max(next, MIN_DATA_MULTIPLIER);
    state_.interval_changed_at = now;
}

void Monitor::set_list_view(bool enabled) {
    if(cfg_.list_view == enabled) return;
    cfg_.list_view = enabled;
    regroup_pending_ = true;
}

bool Monitor::interval_recently_changed(Clock::time_point now) const {
    return state_.interval_changed_at && now - *state_.interval_changed_at < CHANGE_HIGHLIGHT_DURATION;
}

void Monitor::set_latency_samples(std::unordered_map<std::string, uint64_t> samples) {
    latency_samples_ = std::move(samples);
    regroup_pending_ = true;
}

void Monitor::record_frame(Clock::time_point now) {
    if(last_frame_) {
        auto frame = now - *last_frame_;
        if(frame > FRAME_TIME_THRESHOLD) {
            slow_frames_++;
            if(slow_frames_ >= SLOW_FRAME_COUNT_THRESHOLD && !animation_reduced_) {
                animation_reduced_ = true;
                Logger::instance().info("reducing animation detail after " + std::to_string(slow_frames_) + " slow frames");
            }
        } else if(!animation_reduced_) {
            slow_frames_ = 0;
        }
    }
    last_frame_ = now;
}

void Monitor::reset_animation_reduction() {
    animation_reduced_ = false;
    slow_frames_ = 0;
}

void Monitor::update_activity() {
    size_t established = 0, listen = 0, active = 0;
    for(const auto& c : displayed_) {
        if(c.state == ConnectionState::Established) established++;
        else if(c.state == ConnectionState::Listen) listen++;
        else if(is_active_state(c.state)) active++;
    }
    int64_t base = displayed_.empty() ? 5 : 10;
    int64_t score = base
        + static_cast<int64_t>(std::min<size_t>(established * 5, 50))
        + static_cast<int64_t>(std::min<size_t>(listen * 2, 20))
        + static_cast<int64_t>(std::min<size_t>(active * 10, 30));
    double t = static_cast<double>(state_.tick_counter) * 0.15;
    int64_t variation = static_cast<int64_t>(std::sin(t) * 8.0 + std::cos(t * 1.7) * 4.0);
    activity_.pop_front();
    activity_.push_back(static_cast<uint64_t>(std::clamp<int64_t>(score + variation, 5, 100)));
}

}
