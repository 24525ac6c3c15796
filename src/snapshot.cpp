#include <strata/errors.hpp>
#include <strata/snapshot.hpp>

namespace strata
{

namespace
{

template <class T> void put_optional(json& j, const char* key, const std::optional<T>& value)
{
    if (value)
        j[key] = *value;
}

template <class T> std::optional<T> get_optional(const json& j, const char* key)
{
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return std::nullopt;
    return it->get<T>();
}

template <class T> T get_required(const json& j, const char* key)
{
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        throw JSONDecodeError(std::string("Snapshot is missing '") + key + "'");
    return it->get<T>();
}

json input_to_json(const ToolActivityInput& input)
{
    json j = json::object();
    put_optional(j, "filePath", input.file_path);
    put_optional(j, "command", input.command);
    put_optional(j, "description", input.description);
    put_optional(j, "oldString", input.old_string);
    put_optional(j, "newString", input.new_string);
    put_optional(j, "content", input.content);
    put_optional(j, "pattern", input.pattern);
    put_optional(j, "path", input.path);
    put_optional(j, "subject", input.subject);
    put_optional(j, "taskId", input.task_id);
    put_optional(j, "status", input.task_status);
    put_optional(j, "activeForm", input.active_form);
    if (!input.raw.is_null() && !input.raw.empty())
        j["raw"] = input.raw;
    return j;
}

ToolActivityInput input_from_json(const json& j)
{
    ToolActivityInput input;
    input.file_path = get_optional<std::string>(j, "filePath");
    input.command = get_optional<std::string>(j, "command");
    input.description = get_optional<std::string>(j, "description");
    input.old_string = get_optional<std::string>(j, "oldString");
    input.new_string = get_optional<std::string>(j, "newString");
    input.content = get_optional<std::string>(j, "content");
    input.pattern = get_optional<std::string>(j, "pattern");
    input.path = get_optional<std::string>(j, "path");
    input.subject = get_optional<std::string>(j, "subject");
    input.task_id = get_optional<std::string>(j, "taskId");
    input.task_status = get_optional<std::string>(j, "status");
    input.active_form = get_optional<std::string>(j, "activeForm");
    if (auto raw = j.find("raw"); raw != j.end())
        input.raw = *raw;
    return input;
}

json result_to_json(const ToolActivityResult& result)
{
    json j = json::object();
    put_optional(j, "stdout", result.stdout_text);
    put_optional(j, "stderr", result.stderr_text);
    j["interrupted"] = result.interrupted;
    put_optional(j, "fileContent", result.file_content);
    put_optional(j, "filenames", result.filenames);
    put_optional(j, "fileCount", result.file_count);
    put_optional(j, "diffLines", result.diff_lines);
    put_optional(j, "task", result.task);
    put_optional(j, "taskList", result.task_list);
    if (!result.raw.is_null())
        j["raw"] = result.raw;
    return j;
}

ToolActivityResult result_from_json(const json& j)
{
    ToolActivityResult result;
    result.stdout_text = get_optional<std::string>(j, "stdout");
    result.stderr_text = get_optional<std::string>(j, "stderr");
    result.interrupted = j.value("interrupted", false);
    result.file_content = get_optional<std::string>(j, "fileContent");
    result.filenames = get_optional<std::vector<std::string>>(j, "filenames");
    result.file_count = get_optional<int>(j, "fileCount");
    result.diff_lines = get_optional<std::vector<DiffLine>>(j, "diffLines");
    result.task = get_optional<Task>(j, "task");
    result.task_list = get_optional<std::vector<Task>>(j, "taskList");
    if (auto raw = j.find("raw"); raw != j.end())
        result.raw = *raw;
    return result;
}

} // namespace

std::int64_t to_epoch_millis(Clock::time_point time)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

Clock::time_point from_epoch_millis(std::int64_t millis)
{
    return Clock::time_point(
        std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(millis)));
}

void to_json(json& j, const DiffLine& line)
{
    j = json{{"kind", diff_line_kind_name(line.kind)}, {"text", line.text}};
    put_optional(j, "lineNumber", line.line_number);
}

void from_json(const json& j, DiffLine& line)
{
    line.kind = diff_line_kind_from_name(j.value("kind", std::string()));
    line.text = j.value("text", std::string());
    line.line_number = get_optional<int>(j, "lineNumber");
}

void to_json(json& j, const Task& task)
{
    j = json{{"id", task.id}, {"subject", task.subject}, {"status", task_status_name(task.status)}};
    put_optional(j, "activeForm", task.active_form);
    put_optional(j, "description", task.description);
    put_optional(j, "blockedBy", task.blocked_by);
}

void from_json(const json& j, Task& task)
{
    task.id = get_required<std::string>(j, "id");
    task.subject = j.value("subject", std::string());
    task.status =
        task_status_from_name(j.value("status", std::string())).value_or(TaskStatus::Pending);
    task.active_form = get_optional<std::string>(j, "activeForm");
    task.description = get_optional<std::string>(j, "description");
    task.blocked_by = get_optional<std::vector<std::string>>(j, "blockedBy");
}

void to_json(json& j, const ToolActivity& activity)
{
    j = json{{"id", activity.id},
             {"toolName", activity.tool_name},
             {"input", input_to_json(activity.input)},
             {"result", result_to_json(activity.result)}};
}

void from_json(const json& j, ToolActivity& activity)
{
    activity.id = get_required<std::string>(j, "id");
    activity.tool_name = get_required<std::string>(j, "toolName");
    activity.input = input_from_json(j.value("input", json::object()));
    activity.result = result_from_json(j.value("result", json::object()));
}

void to_json(json& j, const UsageInfo& usage)
{
    j = json{{"inputTokens", usage.input_tokens},
             {"outputTokens", usage.output_tokens},
             {"cacheReadTokens", usage.cache_read_tokens},
             {"cacheCreationTokens", usage.cache_creation_tokens},
             {"costUSD", usage.cost_usd},
             {"durationMs", usage.duration_ms},
             {"contextTokens", usage.context_tokens}};
}

void from_json(const json& j, UsageInfo& usage)
{
    usage.input_tokens = j.value("inputTokens", 0);
    usage.output_tokens = j.value("outputTokens", 0);
    usage.cache_read_tokens = j.value("cacheReadTokens", 0);
    usage.cache_creation_tokens = j.value("cacheCreationTokens", 0);
    usage.cost_usd = j.value("costUSD", 0.0);
    usage.duration_ms = j.value("durationMs", 0);
    usage.context_tokens = j.value("contextTokens", 0);
}

void to_json(json& j, const SessionSettings& settings)
{
    j = json{{"workingDirectory", settings.working_directory},
             {"permissionMode", settings.permission_mode},
             {"model", settings.model},
             {"customSystemPrompt", settings.custom_system_prompt}};
}

void from_json(const json& j, SessionSettings& settings)
{
    SessionSettings defaults;
    settings.working_directory = j.value("workingDirectory", defaults.working_directory);
    settings.permission_mode = j.value("permissionMode", defaults.permission_mode);
    settings.model = j.value("model", defaults.model);
    settings.custom_system_prompt = j.value("customSystemPrompt", defaults.custom_system_prompt);
}

void to_json(json& j, const ChatMessage& message)
{
    j = json{{"id", message.id},
             {"role", role_name(message.role)},
             {"text", message.text},
             {"timestamp", to_epoch_millis(message.timestamp)}};
    put_optional(j, "toolActivity", message.tool_activity);
}

std::optional<ChatMessage> message_from_json(const json& j)
{
    auto role = role_from_name(j.value("role", std::string()));
    if (!role)
        return std::nullopt;

    ChatMessage message;
    message.id = get_required<std::string>(j, "id");
    message.role = *role;
    message.text = j.value("text", std::string());
    message.timestamp = from_epoch_millis(j.value("timestamp", std::int64_t{0}));
    message.tool_activity = get_optional<ToolActivity>(j, "toolActivity");
    return message;
}

void to_json(json& j, const SessionSnapshot& snapshot)
{
    j = json{{"version", snapshot.version},
             {"id", snapshot.id},
             {"name", snapshot.name},
             {"createdAt", to_epoch_millis(snapshot.created_at)},
             {"settings", snapshot.settings},
             {"messages", snapshot.messages},
             {"totalCost", snapshot.total_cost},
             {"tasks", snapshot.tasks}};
    put_optional(j, "sessionId", snapshot.session_id);
    put_optional(j, "lastUsage", snapshot.last_usage);
}

void from_json(const json& j, SessionSnapshot& snapshot)
{
    if (!j.is_object())
        throw JSONDecodeError("Snapshot must be a JSON object");

    try
    {
        snapshot.version = j.value("version", SessionSnapshot::kVersion);
        if (snapshot.version > SessionSnapshot::kVersion)
            throw JSONDecodeError("Unsupported snapshot version " +
                                  std::to_string(snapshot.version));

        snapshot.id = get_required<std::string>(j, "id");
        snapshot.name = j.value("name", std::string());
        snapshot.created_at = from_epoch_millis(j.value("createdAt", std::int64_t{0}));
        snapshot.settings = j.value("settings", json::object()).get<SessionSettings>();

        snapshot.messages.clear();
        if (auto messages = j.find("messages"); messages != j.end() && messages->is_array())
        {
            for (const auto& item : *messages)
                if (auto message = message_from_json(item))
                    snapshot.messages.push_back(std::move(*message));
        }

        snapshot.session_id = get_optional<std::string>(j, "sessionId");
        snapshot.total_cost = j.value("totalCost", 0.0);
        snapshot.last_usage = get_optional<UsageInfo>(j, "lastUsage");
        snapshot.tasks = j.value("tasks", std::vector<Task>{});
    }
    catch (const json::exception& e)
    {
        throw JSONDecodeError(std::string("Invalid snapshot: ") + e.what());
    }
}

} // namespace strata
