#pragma once
#include <chrono>
#include <string>

namespace cstfs::timeutil {

using clock = std::chrono::steady_clock;

// Format a duration as seconds with two decimals, e.g. "1.25s"
auto format_elapsed(clock::duration elapsed) -> std::string;

// Elapsed time since `start`, formatted as above
auto elapsed_since(clock::time_point start) -> std::string;

} // namespace cstfs::timeutil
