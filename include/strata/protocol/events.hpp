#ifndef STRATA_PROTOCOL_EVENTS_HPP
#define STRATA_PROTOCOL_EVENTS_HPP

#include <optional>
#include <strata/types.hpp>
#include <string>
#include <variant>

namespace strata
{
namespace protocol
{

// ============================================================================
// Inbound events (bridge -> engine)
// ============================================================================

// Startup handshake, echoes the launch nonce
struct ReadyEvent
{
    std::string nonce;
};

// Incremental text delta
struct TokenEvent
{
    std::string text;
};

// Full-text replacement for the current turn
struct SetTextEvent
{
    std::string text;
};

struct PermissionRequestEvent
{
    PermissionRequest request;
};

// Turn completion
struct ResultEvent
{
    std::string text;
    std::optional<std::string> session_id; // continuation token, absent when empty
    std::optional<UsageInfo> usage;
    bool is_error = false;
    std::string subtype;
};

struct ErrorEvent
{
    std::string message;
};

// A tool finished; the next content starts a new assistant message
struct TurnCompleteEvent
{
};

struct ToolActivityEvent
{
    ToolActivity activity;
};

struct DebugEvent
{
    std::string message;
};

// tool_progress, tool_use_summary, and unknown tags
struct IgnoredEvent
{
    std::string type;
};

using Event = std::variant<ReadyEvent, TokenEvent, SetTextEvent, PermissionRequestEvent,
                           ResultEvent, ErrorEvent, TurnCompleteEvent, ToolActivityEvent,
                           DebugEvent, IgnoredEvent>;

// ============================================================================
// Outbound commands (engine -> bridge)
// ============================================================================

struct QueryCommand
{
    std::string prompt;
    std::string cwd;
    std::string permission_mode = "default";
    std::optional<std::string> session_id;
    std::optional<std::string> model;
    std::optional<std::string> system_prompt;
};

struct CompactCommand
{
    std::string session_id;
    std::string cwd;
    std::string permission_mode = "default";
    std::optional<std::string> model;
    std::optional<std::string> focus_instructions;
};

struct PermissionResponseCommand
{
    std::string request_id;
    bool allow = false;
    std::optional<std::string> message;
};

struct CancelCommand
{
};

using Command =
    std::variant<QueryCommand, CompactCommand, PermissionResponseCommand, CancelCommand>;

// ============================================================================
// Codec
// ============================================================================

/// Decode a tagged bridge message. Never throws on an unknown or missing
/// `type`: those decode to IgnoredEvent so newer bridges stay compatible.
/// `working_directory` is attached to permission requests.
Event decode_event(const json& message,
                   const std::optional<std::string>& working_directory = std::nullopt);

/// Encode a command as a JSON object.
json encode_command(const Command& command);

/// Encode a command as exactly one newline-terminated line.
std::string encode_command_line(const Command& command);

/// Protocol tag of an event ("ready", "token", ...).
std::string event_type_name(const Event& event);

// Helper functions for type checking
inline bool is_ready_event(const Event& event)
{
    return std::holds_alternative<ReadyEvent>(event);
}

inline bool is_result_event(const Event& event)
{
    return std::holds_alternative<ResultEvent>(event);
}

inline bool is_error_event(const Event& event)
{
    return std::holds_alternative<ErrorEvent>(event);
}

// result or error: both end the in-flight exchange
inline bool is_terminal_event(const Event& event)
{
    return is_result_event(event) || is_error_event(event);
}

} // namespace protocol
} // namespace strata

#endif // STRATA_PROTOCOL_EVENTS_HPP
