#pragma once

namespace surveyor {

inline constexpr const char *kToolVersion = "0.1.0";

} // namespace surveyor
