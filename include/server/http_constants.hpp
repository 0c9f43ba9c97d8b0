#pragma once

namespace sqlgate::http {

inline constexpr const char* kJsonContentType = "application/json";
inline constexpr const char* kHealthPath = "/health";

} // namespace sqlgate::http
