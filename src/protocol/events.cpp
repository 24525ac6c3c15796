#include "../internal/json_fields.hpp"

#include <strata/protocol/events.hpp>
#include <strata/tools.hpp>

namespace strata
{
namespace protocol
{

namespace
{

std::optional<std::string> optional_string(const json& j, const char* key)
{
    auto it = j.find(key);
    if (it != j.end() && it->is_string())
        return it->get<std::string>();
    return std::nullopt;
}

int int_or_zero(const json& j, const char* key)
{
    return internal::int_field(j, key).value_or(0);
}

// Flatten a tool input object into display strings. Strings are kept as-is,
// everything else is rendered as compact JSON.
std::map<std::string, std::string> flatten_input(const json& input)
{
    std::map<std::string, std::string> summary;
    if (!input.is_object())
        return summary;

    for (auto it = input.begin(); it != input.end(); ++it)
    {
        if (it.value().is_string())
            summary[it.key()] = it.value().get<std::string>();
        else
            summary[it.key()] = it.value().dump();
    }
    return summary;
}

Event decode_permission_request(const json& j, const std::optional<std::string>& cwd)
{
    auto request_id = optional_string(j, "requestId");
    auto tool_name = optional_string(j, "toolName");
    if (!request_id || !tool_name)
        return IgnoredEvent{"permission_request"};

    PermissionRequest request;
    request.id = *request_id;
    request.tool_name = *tool_name;
    if (auto input = j.find("input"); input != j.end())
        request.input_summary = flatten_input(*input);
    request.reason = optional_string(j, "reason");
    request.working_directory = cwd;
    return PermissionRequestEvent{std::move(request)};
}

Event decode_result(const json& j)
{
    ResultEvent event;
    event.text = optional_string(j, "text").value_or("");

    auto sid = optional_string(j, "sessionId");
    if (sid && !sid->empty())
        event.session_id = sid;

    if (auto usage = j.find("usage"); usage != j.end() && usage->is_object())
    {
        UsageInfo info;
        info.input_tokens = int_or_zero(*usage, "inputTokens");
        info.output_tokens = int_or_zero(*usage, "outputTokens");
        info.cache_read_tokens = int_or_zero(*usage, "cacheReadTokens");
        info.cache_creation_tokens = int_or_zero(*usage, "cacheCreationTokens");
        if (auto cost = j.find("costUSD"); cost != j.end() && cost->is_number())
            info.cost_usd = cost->get<double>();
        info.duration_ms = int_or_zero(j, "durationMs");
        info.context_tokens = int_or_zero(j, "contextTokens");
        event.usage = info;
    }

    if (auto is_error = j.find("isError"); is_error != j.end() && is_error->is_boolean())
        event.is_error = is_error->get<bool>();
    event.subtype = optional_string(j, "subtype").value_or("");
    return event;
}

Event decode_tool_activity(const json& j)
{
    std::string tool_name = optional_string(j, "toolName").value_or("Unknown");

    json input = json::object();
    if (auto it = j.find("input"); it != j.end() && it->is_object())
        input = *it;

    json result;
    if (auto it = j.find("result"); it != j.end())
        result = *it;

    return ToolActivityEvent{tools::interpret(tool_name, input, result)};
}

struct EventTypeVisitor
{
    std::string operator()(const ReadyEvent&) const
    {
        return "ready";
    }
    std::string operator()(const TokenEvent&) const
    {
        return "token";
    }
    std::string operator()(const SetTextEvent&) const
    {
        return "set_text";
    }
    std::string operator()(const PermissionRequestEvent&) const
    {
        return "permission_request";
    }
    std::string operator()(const ResultEvent&) const
    {
        return "result";
    }
    std::string operator()(const ErrorEvent&) const
    {
        return "error";
    }
    std::string operator()(const TurnCompleteEvent&) const
    {
        return "turn_complete";
    }
    std::string operator()(const ToolActivityEvent&) const
    {
        return "tool_activity";
    }
    std::string operator()(const DebugEvent&) const
    {
        return "debug";
    }
    std::string operator()(const IgnoredEvent& e) const
    {
        return e.type;
    }
};

struct CommandEncoder
{
    json operator()(const QueryCommand& c) const
    {
        json msg = {{"type", "query"},
                    {"prompt", c.prompt},
                    {"cwd", c.cwd},
                    {"permissionMode", c.permission_mode}};
        if (c.session_id)
            msg["sessionId"] = *c.session_id;
        if (c.model)
            msg["model"] = *c.model;
        if (c.system_prompt)
            msg["systemPrompt"] = *c.system_prompt;
        return msg;
    }

    json operator()(const CompactCommand& c) const
    {
        json msg = {{"type", "compact"},
                    {"sessionId", c.session_id},
                    {"cwd", c.cwd},
                    {"permissionMode", c.permission_mode}};
        if (c.model)
            msg["model"] = *c.model;
        if (c.focus_instructions && !c.focus_instructions->empty())
            msg["focusInstructions"] = *c.focus_instructions;
        return msg;
    }

    json operator()(const PermissionResponseCommand& c) const
    {
        json msg = {{"type", "permission_response"},
                    {"requestId", c.request_id},
                    {"behavior", c.allow ? "allow" : "deny"}};
        if (c.message)
            msg["message"] = *c.message;
        return msg;
    }

    json operator()(const CancelCommand&) const
    {
        return json{{"type", "cancel"}};
    }
};

} // namespace

Event decode_event(const json& message, const std::optional<std::string>& working_directory)
{
    if (!message.is_object())
        return IgnoredEvent{""};

    auto type = optional_string(message, "type");
    if (!type)
        return IgnoredEvent{""};

    if (*type == "ready")
        return ReadyEvent{optional_string(message, "nonce").value_or("")};

    if (*type == "token" || *type == "set_text")
    {
        auto text = optional_string(message, "text");
        if (!text)
            return IgnoredEvent{*type};
        if (*type == "token")
            return TokenEvent{*text};
        return SetTextEvent{*text};
    }

    if (*type == "permission_request")
        return decode_permission_request(message, working_directory);

    if (*type == "result")
        return decode_result(message);

    if (*type == "error")
        return ErrorEvent{optional_string(message, "message").value_or("Unknown error")};

    if (*type == "turn_complete")
        return TurnCompleteEvent{};

    if (*type == "tool_activity")
        return decode_tool_activity(message);

    if (*type == "debug")
    {
        auto text = optional_string(message, "message");
        if (!text)
            return IgnoredEvent{*type};
        return DebugEvent{*text};
    }

    // tool_progress, tool_use_summary, and anything newer
    return IgnoredEvent{*type};
}

json encode_command(const Command& command)
{
    return std::visit(CommandEncoder{}, command);
}

std::string encode_command_line(const Command& command)
{
    // Invalid UTF-8 in a prompt must not abort the write
    return encode_command(command).dump(-1, ' ', false, json::error_handler_t::replace) + "\n";
}

std::string event_type_name(const Event& event)
{
    return std::visit(EventTypeVisitor{}, event);
}

} // namespace protocol
} // namespace strata
