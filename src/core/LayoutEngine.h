#pragma once
#include "Topology.h"
#include <array>
#include <vector>

namespace netgrave {

constexpr double MIN_EDGE_PADDING = 5.0;
// Below this many canvas units of usable radius the fixed radii are used.
constexpr double ADAPTIVE_THRESHOLD = 30.0;
constexpr std::array<double, 3> DEFAULT_RING_RADII = {25.0, 35.0, 45.0};
constexpr std::array<double, 3> RING_RATIOS = {0.30, 0.50, 0.70};
constexpr double MAX_RADIUS_JITTER = 2.0;
constexpr size_t PARTICLE_REDUCTION_THRESHOLD = 50;

struct LayoutConfig {
    double ring_low = DEFAULT_RING_RADII[0];
    double ring_medium = DEFAULT_RING_RADII[1];
    double ring_high = DEFAULT_RING_RADII[2];
    double edge_padding = MIN_EDGE_PADDING;
    bool is_adaptive = false;
    double width = 0.0;
    double height = 0.0;
    Point center;
};

// Ring radii and bounds for a canvas. Non-positive dimensions or a usable
// radius below ADAPTIVE_THRESHOLD select DEFAULT_RING_RADII.
LayoutConfig compute_layout(double canvas_width, double canvas_height);

double ring_radius(LatencyBucket bucket, const LayoutConfig& layout);

// Position of the index-th of total_in_bucket endpoints on its ring.
// Always clamped to [padding, size - padding] on both axes.
Point place(size_t endpoint_index, size_t total_in_bucket, LatencyBucket bucket, const LayoutConfig& layout);

// Assigns positions to every endpoint, per bucket in rank order.
void layout_graph(Graph& graph, const LayoutConfig& layout);

bool has_latency_data(const Graph& graph);

// Point at (phase + offset) mod 1 along the segment start -> end.
Point particle_position(const Point& start, const Point& end, double pulse_phase, double offset);
// {0, 0.33, 0.66}, or {0.33} for dense graphs / reduced animation.
std::vector<double> particle_offsets(size_t edge_count, bool animation_reduced);

}
