#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace gateway {

struct ContentPart {
  std::string type;
  std::optional<std::string> text;
  nlohmann::json raw;
};

enum class ToolReplyKind {
  kPartList,
  kSinglePart,
  kBareString,
  kOpaque,
};

// The shapes a tools/call result is seen to take.
struct ToolReply {
  ToolReplyKind kind = ToolReplyKind::kOpaque;
  std::vector<ContentPart> parts;  // kPartList, or exactly one for kSinglePart
  std::string text;                // kBareString
  nlohmann::json raw;              // kOpaque
  bool is_error = false;
};

ToolReply ParseToolReply(const nlohmann::json& result);

// List: part texts joined with '\n' (parts without text are serialized). Single part:
// its text. String: verbatim. Anything else: compact JSON.
std::string RenderToolReplyText(const ToolReply& reply);

}  // namespace gateway
