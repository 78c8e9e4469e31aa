#pragma once
#include <string>
#include <string_view>

namespace cstfs {

// Validate 16-char lowercase hex digest
auto looks_hex16(std::string_view str) -> bool;

// String helpers
namespace strutil {
  // Strip leading/trailing spaces, tabs, CR and LF
  auto trim(std::string_view str) -> std::string;
  // ASCII lowercase copy
  auto to_lower(std::string_view str) -> std::string;
}

}
