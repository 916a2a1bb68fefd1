#pragma once

namespace treetags {

inline constexpr const char *kProgramName = "treetags";
inline constexpr const char *kProgramVersion = "0.4.0";

} // namespace treetags
