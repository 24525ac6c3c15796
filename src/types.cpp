#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <openssl/rand.h>
#include <strata/errors.hpp>
#include <strata/types.hpp>

namespace strata
{

const char* log_level_name(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Info:
        return "info";
    case LogLevel::Warning:
        return "warning";
    case LogLevel::Error:
        return "error";
    }
    return "unknown";
}

ChatMessage::ChatMessage(Role r, std::string t, std::optional<ToolActivity> activity)
    : id(generate_uuid()), role(r), text(std::move(t)), timestamp(Clock::now()),
      tool_activity(std::move(activity))
{
}

std::string PermissionRequest::display_description() const
{
    auto field = [this](const char* key, const std::string& fallback)
    {
        auto it = input_summary.find(key);
        return it != input_summary.end() ? it->second : fallback;
    };

    if (tool_name == "Bash")
        return field("command", "Run a command");
    if (tool_name == "Edit" || tool_name == "MultiEdit")
        return "Edit " + field("file_path", "a file");
    if (tool_name == "Write")
        return "Write to " + field("file_path", "a file") + " (" + field("contentLength", "?") +
               " chars)";
    if (tool_name == "Read")
        return "Read " + field("file_path", "a file");
    return tool_name;
}

bool PermissionRequest::is_outside_working_directory() const
{
    namespace fs = std::filesystem;

    if (!working_directory || working_directory->empty())
        return false;

    std::string target;
    if (auto it = input_summary.find("file_path"); it != input_summary.end())
        target = it->second;
    else if (auto it2 = input_summary.find("path"); it2 != input_summary.end())
        target = it2->second;
    if (target.empty())
        return false;

    fs::path cwd = fs::path(*working_directory).lexically_normal();
    fs::path file(target);
    if (file.is_relative())
        file = cwd / file;
    file = file.lexically_normal();

    std::string cwd_str = cwd.string();
    while (cwd_str.size() > 1 && cwd_str.back() == '/')
        cwd_str.pop_back();
    std::string file_str = file.string();
    while (file_str.size() > 1 && file_str.back() == '/')
        file_str.pop_back();

    if (file_str == cwd_str)
        return false;

    std::string prefix = cwd_str == "/" ? cwd_str : cwd_str + "/";
    return file_str.compare(0, prefix.size(), prefix) != 0;
}

const char* role_name(Role role)
{
    switch (role)
    {
    case Role::User:
        return "user";
    case Role::Assistant:
        return "assistant";
    case Role::System:
        return "system";
    case Role::Tool:
        return "tool";
    }
    return "user";
}

std::optional<Role> role_from_name(const std::string& name)
{
    if (name == "user")
        return Role::User;
    if (name == "assistant")
        return Role::Assistant;
    if (name == "system")
        return Role::System;
    if (name == "tool")
        return Role::Tool;
    return std::nullopt;
}

const char* task_status_name(TaskStatus status)
{
    switch (status)
    {
    case TaskStatus::Pending:
        return "pending";
    case TaskStatus::InProgress:
        return "in_progress";
    case TaskStatus::Completed:
        return "completed";
    case TaskStatus::Deleted:
        return "deleted";
    }
    return "pending";
}

std::optional<TaskStatus> task_status_from_name(const std::string& name)
{
    if (name == "pending")
        return TaskStatus::Pending;
    if (name == "in_progress")
        return TaskStatus::InProgress;
    if (name == "completed")
        return TaskStatus::Completed;
    if (name == "deleted")
        return TaskStatus::Deleted;
    return std::nullopt;
}

const char* diff_line_kind_name(DiffLineKind kind)
{
    switch (kind)
    {
    case DiffLineKind::Addition:
        return "addition";
    case DiffLineKind::Removal:
        return "removal";
    case DiffLineKind::Context:
        return "context";
    case DiffLineKind::Ellipsis:
        return "ellipsis";
    }
    return "ellipsis";
}

DiffLineKind diff_line_kind_from_name(const std::string& name)
{
    if (name == "addition")
        return DiffLineKind::Addition;
    if (name == "removal")
        return DiffLineKind::Removal;
    if (name == "context")
        return DiffLineKind::Context;
    return DiffLineKind::Ellipsis;
}

std::string generate_uuid()
{
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1)
        throw StrataError("RAND_bytes failed to produce random data");

    // Version 4, variant 10xx
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

    char out[37];
    std::snprintf(out, sizeof(out),
                  "%02X%02X%02X%02X-%02X%02X-%02X%02X-%02X%02X-%02X%02X%02X%02X%02X%02X",
                  bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5], bytes[6], bytes[7],
                  bytes[8], bytes[9], bytes[10], bytes[11], bytes[12], bytes[13], bytes[14],
                  bytes[15]);
    return std::string(out);
}

std::string home_directory()
{
    if (const char* home = std::getenv("HOME"); home != nullptr && home[0] != '\0')
        return home;
    return "/";
}

} // namespace strata
