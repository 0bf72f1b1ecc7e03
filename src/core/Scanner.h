#pragma once
#include <string>
#include <memory>

namespace netgrave {

struct ScanContext; // fwd

// One stage of the collection pipeline (socket table reader, process
// correlator). Stages run in registration order.
class Scanner {
public:
    virtual ~Scanner() = default;
    virtual std::string name() const = 0;
    virtual std::string description() const = 0;
    virtual void scan(ScanContext& context) = 0;
};

using ScannerPtr = std::unique_ptr<Scanner>;

}
