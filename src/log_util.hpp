#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>

namespace gateway {

std::string TruncateForLog(std::string s, size_t max_chars);

// Drops credential-looking keys (tokens, secrets, authorization) at any depth.
std::string SanitizeJsonForLog(const nlohmann::json& body);

std::string Iso8601UtcNow();

}  // namespace gateway
