#include <file_editor/protocol/tool_models.hpp>

namespace file_editor {

nlohmann::json ToolDefinition::ToJson() const {
    return {
        {"name", name},
        {"description", description},
        {"arguments_schema", arguments_schema},
        {"response_schema", response_schema},
        {"annotations", {
            {"readOnlyHint", annotations.read_only_hint},
            {"destructiveHint", annotations.destructive_hint},
        }},
    };
}

} // namespace file_editor
