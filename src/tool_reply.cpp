#include "tool_reply.hpp"

namespace gateway {
namespace {

static ContentPart ParsePart(const nlohmann::json& item) {
  ContentPart p;
  p.raw = item;
  if (item.is_string()) {
    p.type = "text";
    p.text = item.get<std::string>();
    return p;
  }
  if (item.is_object()) {
    if (item.contains("type") && item["type"].is_string()) p.type = item["type"].get<std::string>();
    if (item.contains("text") && item["text"].is_string()) p.text = item["text"].get<std::string>();
  }
  return p;
}

static std::string PartText(const ContentPart& p) {
  if (p.text) return *p.text;
  return p.raw.dump();
}

}  // namespace

ToolReply ParseToolReply(const nlohmann::json& result) {
  ToolReply r;
  if (result.is_object() && result.contains("isError") && result["isError"].is_boolean()) {
    r.is_error = result["isError"].get<bool>();
  }

  if (result.is_object() && result.contains("content") && !result["content"].is_null()) {
    const auto& content = result["content"];
    if (content.is_array()) {
      r.kind = ToolReplyKind::kPartList;
      for (const auto& item : content) r.parts.push_back(ParsePart(item));
      return r;
    }
    if (content.is_object() && content.contains("text") && content["text"].is_string()) {
      r.kind = ToolReplyKind::kSinglePart;
      r.parts.push_back(ParsePart(content));
      return r;
    }
    if (content.is_string()) {
      r.kind = ToolReplyKind::kBareString;
      r.text = content.get<std::string>();
      return r;
    }
    r.kind = ToolReplyKind::kOpaque;
    r.raw = content;
    return r;
  }

  if (result.is_string()) {
    r.kind = ToolReplyKind::kBareString;
    r.text = result.get<std::string>();
    return r;
  }

  r.kind = ToolReplyKind::kOpaque;
  r.raw = result;
  return r;
}

std::string RenderToolReplyText(const ToolReply& reply) {
  switch (reply.kind) {
    case ToolReplyKind::kPartList: {
      std::string out;
      for (size_t i = 0; i < reply.parts.size(); i++) {
        if (i > 0) out += "\n";
        out += PartText(reply.parts[i]);
      }
      return out;
    }
    case ToolReplyKind::kSinglePart:
      return reply.parts.empty() ? std::string() : PartText(reply.parts.front());
    case ToolReplyKind::kBareString:
      return reply.text;
    case ToolReplyKind::kOpaque:
      return reply.raw.dump();
  }
  return {};
}

}  // namespace gateway
