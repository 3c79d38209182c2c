#include "tool_catalog.hpp"

#include <iostream>
#include <mutex>
#include <utility>

namespace gateway {
namespace {

constexpr const char* kBuiltinToolsJson = R"JSON([
  {"name": "drive_search",
   "description": "Search for files in Google Drive by name, content, or metadata",
   "inputSchema": {"type": "object",
     "properties": {
       "query": {"type": "string", "description": "Search query for files"},
       "file_type": {"type": "string", "description": "Filter by file type (optional)"},
       "folder_id": {"type": "string", "description": "Search within specific folder (optional)"}},
     "required": ["query"]}},
  {"name": "drive_list_files",
   "description": "List files in Google Drive with optional filtering",
   "inputSchema": {"type": "object",
     "properties": {
       "folder_id": {"type": "string", "description": "Folder ID to list files from (optional)"},
       "max_results": {"type": "number", "description": "Maximum number of files to return"}},
     "required": []}},
  {"name": "drive_read_file",
   "description": "Read the content of a file from Google Drive",
   "inputSchema": {"type": "object",
     "properties": {"file_id": {"type": "string", "description": "Google Drive file ID"}},
     "required": ["file_id"]}},
  {"name": "drive_create_file",
   "description": "Create a new file in Google Drive",
   "inputSchema": {"type": "object",
     "properties": {
       "name": {"type": "string", "description": "Name of the file to create"},
       "content": {"type": "string", "description": "Content of the file"},
       "mime_type": {"type": "string", "description": "MIME type of the file"},
       "folder_id": {"type": "string", "description": "Parent folder ID (optional)"}},
     "required": ["name", "content"]}},
  {"name": "drive_update_file",
   "description": "Update an existing file in Google Drive",
   "inputSchema": {"type": "object",
     "properties": {
       "file_id": {"type": "string", "description": "Google Drive file ID"},
       "content": {"type": "string", "description": "New content for the file"},
       "name": {"type": "string", "description": "New name for the file (optional)"}},
     "required": ["file_id", "content"]}},
  {"name": "drive_delete_file",
   "description": "Delete a file from Google Drive",
   "inputSchema": {"type": "object",
     "properties": {"file_id": {"type": "string", "description": "Google Drive file ID to delete"}},
     "required": ["file_id"]}},
  {"name": "drive_share_file",
   "description": "Share a Google Drive file with specific users or make it public",
   "inputSchema": {"type": "object",
     "properties": {
       "file_id": {"type": "string", "description": "Google Drive file ID"},
       "email": {"type": "string", "description": "Email address to share with"},
       "role": {"type": "string", "description": "Permission role (reader, writer, owner)"},
       "type": {"type": "string", "description": "Permission type (user, anyone)"}},
     "required": ["file_id", "email", "role"]}},
  {"name": "drive_upload_file",
   "description": "Upload a local file to Google Drive",
   "inputSchema": {"type": "object",
     "properties": {
       "file_path": {"type": "string", "description": "Local path to the file to upload"},
       "name": {"type": "string", "description": "Name for the file in Drive (optional)"},
       "folder_id": {"type": "string", "description": "Parent folder ID (optional)"}},
     "required": ["file_path"]}},
  {"name": "drive_create_folder",
   "description": "Create a new folder in Google Drive",
   "inputSchema": {"type": "object",
     "properties": {
       "name": {"type": "string", "description": "Name of the folder to create"},
       "parent_folder_id": {"type": "string", "description": "Parent folder ID (optional)"}},
     "required": ["name"]}},
  {"name": "gmail_send_message",
   "description": "Send an email message via Gmail",
   "inputSchema": {"type": "object",
     "properties": {
       "to": {"type": "string", "description": "Recipient email address"},
       "subject": {"type": "string", "description": "Email subject"},
       "body": {"type": "string", "description": "Email body content"},
       "cc": {"type": "string", "description": "CC email addresses (optional)"},
       "bcc": {"type": "string", "description": "BCC email addresses (optional)"}},
     "required": ["to", "subject", "body"]}},
  {"name": "gmail_read_message_without_attachments",
   "description": "Read email content in clean, AI-friendly format with optional attachment info",
   "inputSchema": {"type": "object",
     "properties": {
       "message_id": {"type": "string", "description": "Gmail message ID to read"},
       "include_attachments_info": {"type": "boolean",
         "description": "Whether to include attachment information in the response", "default": true}},
     "required": ["message_id"]}},
  {"name": "gmail_find_messages_with_attachments",
   "description": "Find Gmail messages with attachments based on search criteria",
   "inputSchema": {"type": "object",
     "properties": {
       "max_results": {"type": "integer", "description": "Maximum number of messages to return",
         "minimum": 1, "maximum": 100},
       "query": {"type": "string", "description": "Custom Gmail search query (optional)"},
       "sender": {"type": "string", "description": "Filter by sender email/name (optional)"},
       "subject_contains": {"type": "string", "description": "Filter by subject containing text (optional)"},
       "date_after": {"type": "string", "description": "Messages after date in YYYY/MM/DD format (optional)"},
       "date_before": {"type": "string", "description": "Messages before date in YYYY/MM/DD format (optional)"},
       "attachment_type": {"type": "string",
         "description": "Filter by attachment extension (pdf, xlsx, docx, etc.) (optional)",
         "enum": ["pdf", "doc", "docx", "rtf", "odt", "xls", "xlsx", "ods", "csv", "ppt", "pptx", "odp",
                  "txt", "md", "json", "xml", "html", "css", "js", "jpg", "jpeg", "png", "gif", "bmp",
                  "tiff", "tif", "svg", "webp", "zip", "rar", "7z", "tar", "gz", "mp3", "wav", "flac",
                  "aac", "ogg", "mp4", "avi", "mov", "wmv", "flv", "mkv", "gdoc", "gsheet", "gslides",
                  "gdraw", "gform", "gsite"]},
       "mime_type": {"type": "string",
         "description": "Filter by exact MIME type (e.g., 'application/pdf') (optional)"}},
     "required": ["max_results"]}},
  {"name": "gmail_read_attachment_content",
   "description": "Reads and extracts text content from a PDF, DOCX, or TXT attachment in a Gmail message. Maximum token limit: 30000 tokens",
   "inputSchema": {"type": "object",
     "properties": {
       "message_id": {"type": "string", "description": "Gmail message ID containing the attachment"},
       "attachment_id": {"type": "string",
         "description": "Specific attachment ID to read. If not provided, automatically uses the first supported attachment found (optional)"}},
     "required": ["message_id"]}},
  {"name": "gmail_search_and_summarize",
   "description": "Search emails with clean, summarized results",
   "inputSchema": {"type": "object",
     "properties": {
       "query": {"type": "string", "description": "General search query (optional)"},
       "sender": {"type": "string", "description": "Filter by sender email/name (optional)"},
       "recipient": {"type": "string", "description": "Filter by recipient email/name (optional)"},
       "subject_contains": {"type": "string", "description": "Filter by subject containing text (optional)"},
       "max_results": {"type": "integer", "description": "Maximum number of messages to return",
         "default": 10, "minimum": 1, "maximum": 50}},
     "required": []}},
  {"name": "gmail_list_messages",
   "description": "List recent Gmail messages",
   "inputSchema": {"type": "object",
     "properties": {
       "max_results": {"type": "number", "description": "Maximum number of messages to return"},
       "label_ids": {"type": "array", "items": {"type": "string"}, "description": "Filter by label IDs"}},
     "required": []}},
  {"name": "gmail_list_labels",
   "description": "List all Gmail labels",
   "inputSchema": {"type": "object", "properties": {}, "required": []}},
  {"name": "gmail_list_messages",
   "description": "List recent emails with clean, AI-friendly format",
   "inputSchema": {"type": "object",
     "properties": {
       "max_results": {"type": "integer", "description": "Maximum number of messages to return",
         "default": 10, "minimum": 1, "maximum": 100},
       "query": {"type": "string", "description": "Gmail search query to filter messages (optional)"}},
     "required": []}},
  {"name": "gmail_modify_labels",
   "description": "Add or remove labels from an email message",
   "inputSchema": {"type": "object",
     "properties": {
       "message_id": {"type": "string", "description": "Gmail message ID to modify"},
       "add_labels": {"type": "array", "items": {"type": "string"},
         "description": "Array of label IDs to add to the message (optional)"},
       "remove_labels": {"type": "array", "items": {"type": "string"},
         "description": "Array of label IDs to remove from the message (optional)"}},
     "required": ["message_id"]}},
  {"name": "gmail_delete_message",
   "description": "Delete an email message permanently",
   "inputSchema": {"type": "object",
     "properties": {"message_id": {"type": "string", "description": "Gmail message ID to delete"}},
     "required": ["message_id"]}},
  {"name": "calendar_create_event_with_invitations",
   "description": "Create a calendar event and automatically send invitations to attendees",
   "inputSchema": {"type": "object",
     "properties": {
       "summary": {"type": "string", "description": "Event title"},
       "startTime": {"type": "string", "description": "RFC3339 start time (e.g., '2024-01-15T10:00:00Z')"},
       "endTime": {"type": "string", "description": "RFC3339 end time (e.g., '2024-01-15T11:00:00Z')"},
       "attendees": {"type": "array", "items": {"type": "string"},
         "description": "List of attendee emails (optional)"},
       "location": {"type": "string", "description": "Event location (optional)"},
       "description": {"type": "string", "description": "Event description (optional)"},
       "send_invitations": {"type": "boolean",
         "description": "Whether to send email invitations (default: true)", "default": true}},
     "required": ["summary", "startTime", "endTime"]}},
  {"name": "calendar_list_events",
   "description": "List upcoming events from Google Calendar",
   "inputSchema": {"type": "object",
     "properties": {
       "max_results": {"type": "number", "description": "Maximum number of events to return"},
       "time_min": {"type": "string", "description": "Start time filter (ISO format)"},
       "time_max": {"type": "string", "description": "End time filter (ISO format)"}},
     "required": []}},
  {"name": "calendar_update_event",
   "description": "Update an existing calendar event",
   "inputSchema": {"type": "object",
     "properties": {
       "event_id": {"type": "string", "description": "Calendar event ID"},
       "summary": {"type": "string", "description": "New event title (optional)"},
       "start_time": {"type": "string", "description": "New start time (optional)"},
       "end_time": {"type": "string", "description": "New end time (optional)"},
       "description": {"type": "string", "description": "New description (optional)"}},
     "required": ["event_id"]}},
  {"name": "calendar_delete_event",
   "description": "Delete a calendar event",
   "inputSchema": {"type": "object",
     "properties": {"event_id": {"type": "string", "description": "Calendar event ID to delete"}},
     "required": ["event_id"]}}
])JSON";

static std::vector<ToolDescriptor> LoadBuiltinTools() {
  std::vector<ToolDescriptor> out;
  auto j = nlohmann::json::parse(kBuiltinToolsJson, nullptr, false);
  if (!j.is_array()) {
    std::cout << "[catalog] builtin tool table failed to parse\n";
    return out;
  }
  for (const auto& t : j) {
    if (auto d = ParseToolDescriptor(t)) out.push_back(std::move(*d));
  }
  return out;
}

}  // namespace

const char* CatalogSourceName(CatalogSource source) {
  return source == CatalogSource::kWorker ? "worker" : "builtin";
}

nlohmann::json DefaultParameterSchema() {
  return {{"type", "object"}, {"properties", nlohmann::json::object()}, {"required", nlohmann::json::array()}};
}

const std::vector<ToolDescriptor>& BuiltinToolDescriptors() {
  static const std::vector<ToolDescriptor> tools = LoadBuiltinTools();
  return tools;
}

std::optional<ToolDescriptor> ParseToolDescriptor(const nlohmann::json& tool) {
  if (!tool.is_object()) return std::nullopt;
  ToolDescriptor d;
  if (tool.contains("name") && tool["name"].is_string()) d.name = tool["name"].get<std::string>();
  if (d.name.empty()) return std::nullopt;
  if (tool.contains("description") && tool["description"].is_string()) {
    d.description = tool["description"].get<std::string>();
  } else if (tool.contains("title") && tool["title"].is_string()) {
    d.description = tool["title"].get<std::string>();
  }
  if (tool.contains("inputSchema") && tool["inputSchema"].is_object()) {
    d.input_schema = tool["inputSchema"];
  } else {
    d.input_schema = DefaultParameterSchema();
  }
  return d;
}

bool ParseToolListPage(const nlohmann::json& result, std::vector<ToolDescriptor>* out, std::string* next_cursor) {
  if (next_cursor) next_cursor->clear();
  if (!result.is_object() || !result.contains("tools") || !result["tools"].is_array()) return false;
  for (const auto& t : result["tools"]) {
    if (auto d = ParseToolDescriptor(t)) out->push_back(std::move(*d));
  }
  if (next_cursor && result.contains("nextCursor") && result["nextCursor"].is_string()) {
    *next_cursor = result["nextCursor"].get<std::string>();
  }
  return true;
}

nlohmann::json ToFunctionToolJson(const ToolDescriptor& tool) {
  nlohmann::json fn;
  fn["name"] = tool.name;
  fn["description"] = tool.description;
  fn["parameters"] = tool.input_schema.is_object() ? tool.input_schema : DefaultParameterSchema();
  return {{"type", "function"}, {"function", std::move(fn)}};
}

ToolCatalog::ToolCatalog() {
  ResetToBuiltin();
}

void ToolCatalog::Replace(std::vector<ToolDescriptor> tools, CatalogSource source) {
  std::unordered_map<std::string, size_t> index;
  for (size_t i = 0; i < tools.size(); i++) index[tools[i].name] = i;
  std::unique_lock<std::shared_mutex> lock(mu_);
  tools_ = std::move(tools);
  index_ = std::move(index);
  source_ = source;
}

void ToolCatalog::ResetToBuiltin() {
  Replace(BuiltinToolDescriptors(), CatalogSource::kBuiltin);
}

std::vector<ToolDescriptor> ToolCatalog::List() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return tools_;
}

std::vector<std::string> ToolCatalog::Names() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  std::vector<std::string> out;
  out.reserve(tools_.size());
  for (const auto& t : tools_) out.push_back(t.name);
  return out;
}

std::optional<ToolDescriptor> ToolCatalog::Find(const std::string& name) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  auto it = index_.find(name);
  if (it == index_.end()) return std::nullopt;
  return tools_[it->second];
}

size_t ToolCatalog::size() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return tools_.size();
}

CatalogSource ToolCatalog::source() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return source_;
}

}  // namespace gateway
