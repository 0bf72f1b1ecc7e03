#pragma once
#include "Topology.h"
#include "LayoutEngine.h"
#include <string>

namespace netgrave {

class Monitor;
struct RefreshState;
class Report;

// Serialises a published graph snapshot as JSON for consumers outside the
// process (renderers, scripts).
class GraphWriter {
public:
    std::string write(const Graph& graph, const LayoutConfig& layout,
                      const RefreshState* state, const Report* report, bool pretty) const;
    std::string write(const Monitor& monitor, bool pretty) const;
};

}
