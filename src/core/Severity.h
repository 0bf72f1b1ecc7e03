#pragma once
#include <string>

namespace netgrave {

// Ordered: comparisons between Severity values follow rank.
enum class Severity { Low=0, Medium=1, High=2, Critical=3 };

const char* severity_to_string(Severity s);
// Case-insensitive; returns false for names outside low|medium|high|critical.
bool parse_severity(const std::string& name, Severity& out);
int severity_rank(Severity s);

}
