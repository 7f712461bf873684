#pragma once

#include <string>

namespace matprod::debug_trace {

// Test-only hook used to verify which multiply path ran.
// Stored as a thread_local string so concurrent calls don't clobber each other.
void set_last(const char* value);
void clear();
std::string get_last();

} // namespace matprod::debug_trace
