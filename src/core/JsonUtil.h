#pragma once
#include <string>

namespace netgrave {
namespace jsonutil {

// JSON string-literal escaping (without the surrounding quotes). Control
// characters below 0x20 become \uXXXX; bytes >= 0x20 pass through.
std::string escape(const std::string& s);
// Re-indents compact JSON with two spaces per level.
std::string pretty(const std::string& compact_json);
std::string format_double(double v);

}
}
