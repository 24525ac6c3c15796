#ifndef STRATA_TOOLS_HPP
#define STRATA_TOOLS_HPP

#include <cstddef>
#include <optional>
#include <strata/types.hpp>
#include <string>
#include <vector>

namespace strata
{
namespace tools
{

/**
 * Tool-result interpreters.
 *
 * Every function here is a pure projection of (tool name, raw payload). Tool
 * names are an open set: kinds without a dedicated interpreter keep the raw
 * payload and still get a generic summary, so a newer backend never breaks
 * decoding.
 */

/// How a tool invocation affects the session's task table.
enum class TaskEffect
{
    None,
    Upsert,    // single task create/update/get; status "deleted" removes it
    ReplaceAll // full list from the backend, not a diff
};

ToolActivityInput parse_tool_input(const std::string& tool_name, const json& input);

ToolActivityResult parse_tool_result(const std::string& tool_name, const json& result);

/// Build a ToolActivity (with a fresh id) from a tool_activity payload.
ToolActivity interpret(const std::string& tool_name, const json& input, const json& result);

/// Line-by-line removal/addition listing for an old/new string replacement.
std::vector<DiffLine> diff_from_edit(const std::string& old_string, const std::string& new_string);

/// One-line description used as the tool message text.
std::string summary_text(const ToolActivity& activity);

/// Secondary line such as "2 added, 1 removed" or "Interrupted".
std::optional<std::string> detail_summary(const ToolActivity& activity);

TaskEffect task_effect(const std::string& tool_name);

/// Parse a task record ({id|taskId, subject|title, status, ...}); nullopt without an id.
std::optional<Task> parse_task(const json& data);

/// Parse a TodoWrite item ({content, activeForm, status}); ids are 1-based positions.
Task parse_todo_item(const json& data, std::size_t index);

} // namespace tools
} // namespace strata

#endif // STRATA_TOOLS_HPP
