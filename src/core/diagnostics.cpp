#include "tessera/core/diagnostics.hpp"

#include <cstdio>
#include <iostream>

namespace tessera::core {

void fail_invariant(const char* component, const std::string& message) {
    std::ostringstream oss;
    oss << "[tessera][" << component << "] invariant failed: " << message;
    const std::string s = oss.str();
    std::fprintf(stderr, "%s\n", s.c_str());
    std::fflush(stderr);
    throw invariant_violation(s);
}

void trace(const char* component, const std::string& message) {
    std::cerr << "[tessera][" << component << "] " << message << "\n";
}

} // namespace tessera::core
