#include "LayoutEngine.h"
#include <algorithm>
#include <cmath>
#include <map>

namespace netgrave {

namespace {

const double kPi = 3.14159265358979323846;
const double kReferenceAngle = -kPi / 2.0; // top of the ring

double clamp_axis(double v, double padding, double size){
    double lo = padding;
    double hi = size - padding;
    if(hi < lo){
        // canvas narrower than twice the padding: collapse to the centre line
        double mid = std::max(size, 0.0) / 2.0;
        return mid;
    }
    return std::clamp(v, lo, hi);
}

}

LayoutConfig compute_layout(double canvas_width, double canvas_height){
    LayoutConfig cfg;
    cfg.width = canvas_width;
    cfg.height = canvas_height;
    cfg.center = Point{std::max(canvas_width, 0.0) / 2.0, std::max(canvas_height, 0.0) / 2.0};
    cfg.edge_padding = MIN_EDGE_PADDING;

    if(canvas_width <= 0.0 || canvas_height <= 0.0) return cfg;

    double available = std::min(canvas_width, canvas_height) / 2.0 - cfg.edge_padding;
    if(available < ADAPTIVE_THRESHOLD) return cfg;

    cfg.ring_low = available * RING_RATIOS[0];
    cfg.ring_medium = available * RING_RATIOS[1];
    cfg.ring_high = available * RING_RATIOS[2];
    cfg.is_adaptive = true;
    return cfg;
}

double ring_radius(LatencyBucket bucket, const LayoutConfig& layout){
    switch(bucket){
        case LatencyBucket::Low: return layout.ring_low;
        case LatencyBucket::High: return layout.ring_high;
        case LatencyBucket::Medium:
        case LatencyBucket::Unknown: return layout.ring_medium;
    }
    return layout.ring_medium;
}

Point place(size_t endpoint_index, size_t total_in_bucket, LatencyBucket bucket, const LayoutConfig& layout){
    double radius = ring_radius(bucket, layout);
    double total = static_cast<double>(std::max<size_t>(total_in_bucket, 1));
    double angle = kReferenceAngle + (static_cast<double>(endpoint_index) / total) * 2.0 * kPi;

    // Jitter stays under a quarter of the narrowest ring gap so rings never cross
    double gap = std::min(layout.ring_medium - layout.ring_low, layout.ring_high - layout.ring_medium);
    double amplitude = std::min(MAX_RADIUS_JITTER, std::max(gap, 0.0) / 4.0);
    double jitter = (static_cast<double>(endpoint_index % 3) - 1.0) * amplitude;
    double r = radius + jitter;

    Point p;
    p.x = clamp_axis(layout.center.x + r * std::cos(angle), layout.edge_padding, layout.width);
    p.y = clamp_axis(layout.center.y + r * std::sin(angle), layout.edge_padding, layout.height);
    return p;
}

void layout_graph(Graph& graph, const LayoutConfig& layout){
    std::map<LatencyBucket, size_t> totals;
    for(const auto& ep : graph.endpoints) totals[ep.latency]++;
    std::map<LatencyBucket, size_t> next;
    for(auto& ep : graph.endpoints){
        size_t idx = next[ep.latency]++;
        ep.position = place(idx, totals[ep.latency], ep.latency, layout);
    }
}

bool has_latency_data(const Graph& graph){
    return std::any_of(graph.endpoints.begin(), graph.endpoints.end(),
                       [](const Endpoint& ep){ return ep.latency != LatencyBucket::Unknown; });
}

Point particle_position(const Point& start, const Point& end, double pulse_phase, double offset){
    double t = std::fmod(pulse_phase + offset, 1.0);
    if(t < 0.0) t += 1.0;
    return Point{start.x + (end.x - start.x) * t, start.y + (end.y - start.y) * t};
}

std::vector<double> particle_offsets(size_t edge_count, bool animation_reduced){
    if(animation_reduced || edge_count > PARTICLE_REDUCTION_THRESHOLD) return {0.33};
    return {0.0, 0.33, 0.66};
}

}
