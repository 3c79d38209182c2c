#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace gateway {

struct ToolDescriptor {
  std::string name;
  std::string description;
  nlohmann::json input_schema;
};

enum class CatalogSource {
  kBuiltin,
  kWorker,
};

const char* CatalogSourceName(CatalogSource source);

// {"type": "object", "properties": {}, "required": []}
nlohmann::json DefaultParameterSchema();

// Hand-maintained descriptors for every tool the workspace worker is known to expose.
// Used whenever the worker's own list cannot be fetched.
const std::vector<ToolDescriptor>& BuiltinToolDescriptors();

std::optional<ToolDescriptor> ParseToolDescriptor(const nlohmann::json& tool);

// Appends the tools of one tools/list page. Returns false when the result has no tools array.
bool ParseToolListPage(const nlohmann::json& result, std::vector<ToolDescriptor>* out, std::string* next_cursor);

// OpenAI function-tool shape: {"type": "function", "function": {name, description, parameters}}.
nlohmann::json ToFunctionToolJson(const ToolDescriptor& tool);

// Ordered snapshot of invocable tools. Duplicate names are kept in the listing; lookup
// resolves to the last entry carrying the name.
class ToolCatalog {
 public:
  ToolCatalog();

  void Replace(std::vector<ToolDescriptor> tools, CatalogSource source);
  void ResetToBuiltin();

  std::vector<ToolDescriptor> List() const;
  std::vector<std::string> Names() const;
  std::optional<ToolDescriptor> Find(const std::string& name) const;
  size_t size() const;
  CatalogSource source() const;

 private:
  mutable std::shared_mutex mu_;
  std::vector<ToolDescriptor> tools_;
  std::unordered_map<std::string, size_t> index_;
  CatalogSource source_ = CatalogSource::kBuiltin;
};

}  // namespace gateway
