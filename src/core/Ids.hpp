#pragma once

#include <string>

namespace axiom {

// Random RFC 4122 version 4 identifier, e.g. "3f2b8c1e-9a4d-4c2e-8b7f-1d2e3f4a5b6c".
// Safe to call from multiple threads.
std::string generate_id();

} // namespace axiom
