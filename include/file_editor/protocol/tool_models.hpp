#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace file_editor {

// ---------------------------------------------------------------------------
// Tool definitions as advertised by tools/list.
// ---------------------------------------------------------------------------
struct ToolAnnotations {
    bool read_only_hint = false;
    bool destructive_hint = false;
};

struct ToolDefinition {
    std::string name;
    std::string description;
    nlohmann::json arguments_schema;
    nlohmann::json response_schema;
    ToolAnnotations annotations;

    [[nodiscard]] nlohmann::json ToJson() const;
};

// ---------------------------------------------------------------------------
// Tool argument shapes. Line numbers use 0 for "not specified".
// ---------------------------------------------------------------------------
struct ListFilesRequest {};

struct ReadFileRequest {
    std::string name;
    int start_line = 0;
    int end_line = 0;
};

struct EditOperation {
    int line = 0;
    std::string content;
    std::string operation;  // "replace", "insert" or "delete"
};

struct EditFileRequest {
    std::string name;
    std::vector<EditOperation> edits;
    std::string append;
    bool create_if_missing = false;
};

// params of a tools/call request.
struct ToolCallParams {
    std::string name;
    nlohmann::json arguments;
    bool has_arguments = false;
};

} // namespace file_editor
