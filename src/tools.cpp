#include "internal/json_fields.hpp"

#include <filesystem>
#include <functional>
#include <map>
#include <strata/tools.hpp>

namespace strata
{
namespace tools
{

namespace
{

std::optional<std::string> string_field(const json& j, const char* key)
{
    if (j.is_object())
    {
        auto it = j.find(key);
        if (it != j.end() && it->is_string())
            return it->get<std::string>();
    }
    return std::nullopt;
}

std::optional<std::vector<std::string>> string_list_field(const json& j, const char* key)
{
    if (!j.is_object())
        return std::nullopt;
    auto it = j.find(key);
    if (it == j.end() || !it->is_array())
        return std::nullopt;

    std::vector<std::string> out;
    for (const auto& item : *it)
        if (item.is_string())
            out.push_back(item.get<std::string>());
    return out;
}

std::vector<Task> parse_task_array(const json& array)
{
    std::vector<Task> tasks;
    for (const auto& item : array)
        if (auto task = parse_task(item))
            tasks.push_back(std::move(*task));
    return tasks;
}

std::vector<Task> parse_todo_array(const json& array)
{
    std::vector<Task> tasks;
    std::size_t index = 0;
    for (const auto& item : array)
    {
        if (item.is_object())
            tasks.push_back(parse_todo_item(item, index));
        ++index;
    }
    return tasks;
}

std::string file_name(const std::optional<std::string>& path)
{
    if (!path || path->empty())
        return "file";
    std::string name = std::filesystem::path(*path).filename().string();
    return name.empty() ? *path : name;
}

std::string plural(int count, const char* singular, const char* plural_form)
{
    return std::to_string(count) + " " + (count == 1 ? singular : plural_form);
}

// ============================================================================
// Per-kind result projections (object payloads only)
// ============================================================================

using ResultInterpreter = std::function<void(const json& data, ToolActivityResult& result)>;

void interpret_bash(const json& data, ToolActivityResult& result)
{
    result.stdout_text = string_field(data, "stdout");
    result.stderr_text = string_field(data, "stderr");
    auto it = data.find("interrupted");
    result.interrupted = it != data.end() && it->is_boolean() && it->get<bool>();
}

void interpret_edit(const json& data, ToolActivityResult& result)
{
    std::string old_str = string_field(data, "oldString").value_or("");
    std::string new_str = string_field(data, "newString").value_or("");
    if (!old_str.empty() || !new_str.empty())
        result.diff_lines = diff_from_edit(old_str, new_str);
}

// Each entry of "edits" contributes its own removal/addition block
void interpret_multi_edit(const json& data, ToolActivityResult& result)
{
    auto edits = data.find("edits");
    if (edits == data.end() || !edits->is_array())
        return;

    std::vector<DiffLine> lines;
    for (const auto& edit : *edits)
    {
        std::string old_str =
            string_field(edit, "old_string").value_or(string_field(edit, "oldString").value_or(""));
        std::string new_str =
            string_field(edit, "new_string").value_or(string_field(edit, "newString").value_or(""));
        if (old_str.empty() && new_str.empty())
            continue;
        auto block = diff_from_edit(old_str, new_str);
        lines.insert(lines.end(), block.begin(), block.end());
    }
    if (!lines.empty())
        result.diff_lines = std::move(lines);
}

void interpret_read(const json& data, ToolActivityResult& result)
{
    auto file = data.find("file");
    if (file != data.end() && file->is_object())
        result.file_content = string_field(*file, "content");
    else
        result.file_content = string_field(data, "content");
}

void interpret_write(const json&, ToolActivityResult&)
{
    // Write results carry nothing worth projecting
}

void interpret_search(const json& data, ToolActivityResult& result)
{
    result.filenames = string_list_field(data, "filenames");
    result.file_count = internal::int_field(data, "numFiles");
}

void interpret_single_task(const json& data, ToolActivityResult& result)
{
    auto nested = data.find("task");
    if (nested != data.end() && nested->is_object())
        result.task = parse_task(*nested);
    else
        result.task = parse_task(data);
}

void interpret_todo_write(const json& data, ToolActivityResult& result)
{
    auto todos = data.find("newTodos");
    if (todos != data.end() && todos->is_array())
        result.task_list = parse_todo_array(*todos);
}

void interpret_task_listing(const json& data, ToolActivityResult& result)
{
    if (auto tasks = data.find("tasks"); tasks != data.end() && tasks->is_array())
        result.task_list = parse_task_array(*tasks);
    else if (auto todos = data.find("newTodos"); todos != data.end() && todos->is_array())
        result.task_list = parse_todo_array(*todos);
    else if (auto listed = data.find("todos"); listed != data.end() && listed->is_array())
        result.task_list = parse_todo_array(*listed);
}

const std::map<std::string, ResultInterpreter>& interpreters()
{
    static const std::map<std::string, ResultInterpreter> table = {
        {"Bash", interpret_bash},
        {"Edit", interpret_edit},
        {"MultiEdit", interpret_multi_edit},
        {"Read", interpret_read},
        {"Write", interpret_write},
        {"Glob", interpret_search},
        {"Grep", interpret_search},
        {"TaskCreate", interpret_single_task},
        {"TaskUpdate", interpret_single_task},
        {"TaskGet", interpret_single_task},
        {"TodoWrite", interpret_todo_write},
        {"TodoUpdate", interpret_todo_write},
        {"TaskList", interpret_task_listing},
        {"TodoRead", interpret_task_listing},
    };
    return table;
}

} // namespace

ToolActivityInput parse_tool_input(const std::string&, const json& input)
{
    ToolActivityInput parsed;
    if (!input.is_object())
        return parsed;

    parsed.file_path = string_field(input, "file_path");
    parsed.command = string_field(input, "command");
    parsed.description = string_field(input, "description");
    parsed.old_string = string_field(input, "old_string");
    parsed.new_string = string_field(input, "new_string");
    parsed.content = string_field(input, "content");
    parsed.pattern = string_field(input, "pattern");
    parsed.path = string_field(input, "path");

    parsed.subject = string_field(input, "subject");
    parsed.task_id = string_field(input, "taskId");
    parsed.task_status = string_field(input, "status");
    parsed.active_form = string_field(input, "activeForm");

    parsed.raw = input;
    return parsed;
}

ToolActivityResult parse_tool_result(const std::string& tool_name, const json& data)
{
    ToolActivityResult result;

    // Some tools return a plain string
    if (data.is_string())
    {
        result.stdout_text = data.get<std::string>();
        return result;
    }

    // Listing tools may return the array directly
    if (data.is_array() && (tool_name == "TaskList" || tool_name == "TodoRead"))
    {
        result.task_list = parse_task_array(data);
        return result;
    }

    const auto& table = interpreters();
    auto it = table.find(tool_name);
    if (!data.is_object() || it == table.end())
    {
        result.raw = data;
        return result;
    }

    it->second(data, result);
    return result;
}

ToolActivity interpret(const std::string& tool_name, const json& input, const json& result)
{
    ToolActivity activity;
    activity.id = generate_uuid();
    activity.tool_name = tool_name;
    activity.input = parse_tool_input(tool_name, input);
    activity.result = parse_tool_result(tool_name, result);
    return activity;
}

std::vector<DiffLine> diff_from_edit(const std::string& old_string, const std::string& new_string)
{
    std::vector<DiffLine> lines;

    auto append = [&lines](const std::string& text, DiffLineKind kind)
    {
        int number = 1;
        std::size_t start = 0;
        while (true)
        {
            std::size_t end = text.find('\n', start);
            lines.push_back(DiffLine{kind, text.substr(start, end - start), number++});
            if (end == std::string::npos)
                break;
            start = end + 1;
        }
    };

    append(old_string, DiffLineKind::Removal);
    append(new_string, DiffLineKind::Addition);
    return lines;
}

std::string summary_text(const ToolActivity& activity)
{
    const auto& name = activity.tool_name;
    const auto& input = activity.input;
    const auto& result = activity.result;

    if (name == "Bash")
    {
        std::string cmd = input.command.value_or("command");
        return cmd.size() > 80 ? cmd.substr(0, 77) + "..." : cmd;
    }
    if (name == "Edit" || name == "MultiEdit" || name == "Write" || name == "Read")
        return name + " " + file_name(input.file_path);
    if (name == "Glob")
        return "Search " + input.pattern.value_or("files") + " (" +
               plural(result.file_count.value_or(0), "file", "files") + ")";
    if (name == "Grep")
        return "Grep /" + input.pattern.value_or("pattern") + "/ (" +
               plural(result.file_count.value_or(0), "match", "matches") + ")";
    if (name == "TaskCreate")
    {
        std::string subject = input.subject.value_or(result.task ? result.task->subject : "task");
        return "Created task: " + subject;
    }
    if (name == "TaskUpdate")
    {
        std::string status = input.task_status.value_or(
            result.task ? task_status_name(result.task->status) : "updated");
        std::string id = input.task_id.value_or(result.task ? result.task->id : "?");
        return "Task #" + id + " -> " + status;
    }
    if (name == "TaskGet")
        return "Fetched task #" + input.task_id.value_or(result.task ? result.task->id : "?");

    int count = result.task_list ? static_cast<int>(result.task_list->size()) : 0;
    if (name == "TodoWrite")
    {
        if (result.task_list)
            for (const auto& task : *result.task_list)
                if (task.status == TaskStatus::InProgress)
                    return task.subject;
        return "Updated " + plural(count, "task", "tasks");
    }
    if (name == "TodoUpdate")
        return "Updated " + plural(count, "task", "tasks");
    if (name == "TaskList" || name == "TodoRead")
        return "Listed " + plural(count, "task", "tasks");

    return name;
}

std::optional<std::string> detail_summary(const ToolActivity& activity)
{
    if (activity.tool_name == "Bash")
        return activity.result.interrupted ? std::optional<std::string>("Interrupted")
                                           : std::nullopt;

    if ((activity.tool_name != "Edit" && activity.tool_name != "MultiEdit") ||
        !activity.result.diff_lines)
        return std::nullopt;

    int adds = 0;
    int removes = 0;
    for (const auto& line : *activity.result.diff_lines)
    {
        if (line.kind == DiffLineKind::Addition)
            ++adds;
        else if (line.kind == DiffLineKind::Removal)
            ++removes;
    }
    if (adds == 0 && removes == 0)
        return std::nullopt;

    std::string out;
    if (adds > 0)
        out = std::to_string(adds) + " added";
    if (removes > 0)
        out += (out.empty() ? "" : ", ") + std::to_string(removes) + " removed";
    return out;
}

TaskEffect task_effect(const std::string& tool_name)
{
    if (tool_name == "TaskCreate" || tool_name == "TaskUpdate" || tool_name == "TaskGet")
        return TaskEffect::Upsert;
    if (tool_name == "TodoWrite" || tool_name == "TodoUpdate" || tool_name == "TaskList" ||
        tool_name == "TodoRead")
        return TaskEffect::ReplaceAll;
    return TaskEffect::None;
}

std::optional<Task> parse_task(const json& data)
{
    if (!data.is_object())
        return std::nullopt;

    // ID is required, subject has a fallback
    std::string id;
    if (auto it = data.find("id"); it != data.end() && it->is_string())
        id = it->get<std::string>();
    else if (it != data.end() && it->is_number_integer())
        id = std::to_string(it->get<long long>());
    else if (auto task_id = string_field(data, "taskId"))
        id = *task_id;
    else
        return std::nullopt;

    Task task;
    task.id = id;
    task.subject = string_field(data, "subject")
                       .value_or(string_field(data, "title").value_or("Task #" + id));
    task.status = task_status_from_name(string_field(data, "status").value_or("pending"))
                      .value_or(TaskStatus::Pending);
    task.active_form = string_field(data, "activeForm");
    task.description = string_field(data, "description");
    task.blocked_by = string_list_field(data, "blockedBy");
    return task;
}

Task parse_todo_item(const json& data, std::size_t index)
{
    Task task;
    task.id = std::to_string(index + 1);
    task.subject = string_field(data, "content").value_or("Task " + std::to_string(index + 1));
    task.status = task_status_from_name(string_field(data, "status").value_or("pending"))
                      .value_or(TaskStatus::Pending);
    task.active_form = string_field(data, "activeForm");
    return task;
}

} // namespace tools
} // namespace strata
