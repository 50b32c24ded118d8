#pragma once

namespace strata_mcp {

inline constexpr const char* kServerName = "strata-mcp";
inline constexpr const char* kServerVersion = "0.1.0";

} // namespace strata_mcp
