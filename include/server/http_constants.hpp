#pragma once

#include <string>
#include <string_view>

namespace promptshield::http {

inline constexpr std::string_view kBearerPrefix = "Bearer ";
// std::string because cpp-httplib APIs require const std::string&
inline const std::string kAuthorizationHeader = "Authorization";
inline constexpr const char* kJsonContentType = "application/json";

// Routes
inline constexpr const char* kShieldPromptRoute = "/shield_prompt";
inline constexpr const char* kPolicyRoute = "/api/policy";
inline constexpr const char* kPolicyReloadRoute = "/api/policy/reload";
inline constexpr const char* kLogsRoute = "/api/logs";
inline constexpr const char* kHealthRoute = "/health";

} // namespace promptshield::http
