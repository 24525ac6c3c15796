#ifndef STRATA_TYPES_HPP
#define STRATA_TYPES_HPP

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace strata
{

// JSON type alias - allows swapping implementation later if needed
using json = nlohmann::json;

using Clock = std::chrono::system_clock;

// ============================================================================
// Logging
// ============================================================================

enum class LogLevel
{
    Debug,
    Info,
    Warning,
    Error
};

/// Receives every log record produced by the bridge engine.
/// Note: may be invoked from the reader or stderr threads - keep it thread-safe.
using LogCallback = std::function<void(LogLevel level, const std::string& message)>;

/// Receives `debug` event payloads and bridge stderr lines.
using DebugCallback = std::function<void(const std::string& line)>;

const char* log_level_name(LogLevel level);

// ============================================================================
// Tool activity
// ============================================================================

enum class DiffLineKind
{
    Addition,
    Removal,
    Context,
    Ellipsis
};

struct DiffLine
{
    DiffLineKind kind = DiffLineKind::Context;
    std::string text;
    std::optional<int> line_number;
};

enum class TaskStatus
{
    Pending,
    InProgress,
    Completed,
    Deleted
};

struct Task
{
    std::string id; // e.g. "1", "2"
    std::string subject;
    TaskStatus status = TaskStatus::Pending;
    std::optional<std::string> active_form; // present-continuous label ("Running tests")
    std::optional<std::string> description;
    std::optional<std::vector<std::string>> blocked_by;
};

inline bool operator==(const Task& a, const Task& b)
{
    return a.id == b.id && a.subject == b.subject && a.status == b.status &&
           a.active_form == b.active_form && a.description == b.description &&
           a.blocked_by == b.blocked_by;
}

/// Ordered by id so listings are stable.
using TaskTable = std::map<std::string, Task>;

struct ToolActivityInput
{
    std::optional<std::string> file_path;
    std::optional<std::string> command;
    std::optional<std::string> description;
    std::optional<std::string> old_string;
    std::optional<std::string> new_string;
    std::optional<std::string> content;
    std::optional<std::string> pattern;
    std::optional<std::string> path;

    // Task tool fields
    std::optional<std::string> subject;
    std::optional<std::string> task_id;
    std::optional<std::string> task_status;
    std::optional<std::string> active_form;

    json raw = json::object();
};

struct ToolActivityResult
{
    std::optional<std::string> stdout_text;
    std::optional<std::string> stderr_text;
    bool interrupted = false;
    std::optional<std::string> file_content;
    std::optional<std::vector<std::string>> filenames;
    std::optional<int> file_count;
    std::optional<std::vector<DiffLine>> diff_lines;
    std::optional<Task> task;
    std::optional<std::vector<Task>> task_list;
    json raw; // null unless the tool kind has no dedicated projection
};

/// A single tool invocation with its input and result projections.
struct ToolActivity
{
    std::string id;
    std::string tool_name;
    ToolActivityInput input;
    ToolActivityResult result;
};

// ============================================================================
// Usage
// ============================================================================

struct UsageInfo
{
    int input_tokens = 0;
    int output_tokens = 0;
    int cache_read_tokens = 0;
    int cache_creation_tokens = 0;
    double cost_usd = 0.0;
    int duration_ms = 0;
    int context_tokens = 0;

    int total_input_tokens() const
    {
        return input_tokens + cache_read_tokens + cache_creation_tokens;
    }
};

// ============================================================================
// Permission requests
// ============================================================================

/// A request from the bridge asking the user to allow or deny a tool use.
struct PermissionRequest
{
    std::string id; // requestId, echoed in the permission_response
    std::string tool_name;
    std::map<std::string, std::string> input_summary;
    std::optional<std::string> reason;
    std::optional<std::string> working_directory;

    /// Human-readable description of what the tool wants to do.
    std::string display_description() const;

    /// True when the targeted file_path/path escapes the working directory.
    /// Paths are lexically normalised and compared with a trailing separator so
    /// that `/project` never matches `/projectEVIL`.
    bool is_outside_working_directory() const;
};

// ============================================================================
// Transcript
// ============================================================================

enum class Role
{
    User,
    Assistant,
    System,
    Tool
};

struct ChatMessage
{
    std::string id;
    Role role = Role::User;
    std::string text;
    Clock::time_point timestamp;
    std::optional<ToolActivity> tool_activity;

    ChatMessage() = default;
    ChatMessage(Role r, std::string t, std::optional<ToolActivity> activity = std::nullopt);
};

// ============================================================================
// Configuration
// ============================================================================

/// Per-session settings, injected at Session construction.
struct SessionSettings
{
    std::string working_directory;       // empty means $HOME
    std::string permission_mode = "default"; // "default", "acceptEdits", "plan", "bypassPermissions"
    std::string model = "claude-sonnet-4-5-20250929";
    std::string custom_system_prompt;
};

/// Process and transport configuration for the bridge.
struct BridgeOptions
{
    // Explicit interpreter (node) and bridge script paths. When empty the fixed
    // search order applies (STRATA_NODE_PATH / STRATA_BRIDGE_SCRIPT, known
    // install paths, PATH, bundled resources).
    std::string interpreter_path;
    std::string bridge_script_path;

    // Optional SHA-256 (hex) the bridge script must match
    std::optional<std::string> bridge_script_sha256;

    // Delay before the single deferred retry of a send issued while the bridge
    // was not running
    std::chrono::milliseconds start_retry_delay{500};

    /// Maximum size of a single buffered partial line (in bytes).
    /// Default: 8MB. Larger lines are discarded and framing resumes at the next newline.
    std::size_t max_buffer_size = 8 * 1024 * 1024;

    std::optional<LogCallback> log_callback;
    std::optional<DebugCallback> debug_callback;
};

// ============================================================================
// Helpers
// ============================================================================

const char* role_name(Role role);
std::optional<Role> role_from_name(const std::string& name);

const char* task_status_name(TaskStatus status);
std::optional<TaskStatus> task_status_from_name(const std::string& name);

const char* diff_line_kind_name(DiffLineKind kind);
DiffLineKind diff_line_kind_from_name(const std::string& name); // unknown -> Ellipsis

/// Random RFC 4122 version 4 UUID (uppercase), backed by OpenSSL RAND_bytes.
std::string generate_uuid();

/// $HOME, or "/" when unset.
std::string home_directory();

} // namespace strata

#endif // STRATA_TYPES_HPP
