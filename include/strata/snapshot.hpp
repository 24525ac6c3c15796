#ifndef STRATA_SNAPSHOT_HPP
#define STRATA_SNAPSHOT_HPP

#include <cstdint>
#include <optional>
#include <strata/types.hpp>
#include <string>
#include <vector>

namespace strata
{

/**
 * Persistable state of one session.
 *
 * The engine only produces and consumes snapshots; writing them to disk
 * (debounced or not) is left to the embedding application.
 *
 * JSON shape (camelCase keys, times in milliseconds since the Unix epoch):
 *   {version, id, name, createdAt, settings, messages, sessionId?,
 *    totalCost, lastUsage?, tasks}
 */
struct SessionSnapshot
{
    static constexpr int kVersion = 1;

    int version = kVersion;
    std::string id;
    std::string name;
    Clock::time_point created_at;
    SessionSettings settings;
    std::vector<ChatMessage> messages;
    std::optional<std::string> session_id;
    double total_cost = 0.0;
    std::optional<UsageInfo> last_usage;
    std::vector<Task> tasks;
};

// nlohmann ADL hooks
void to_json(json& j, const DiffLine& line);
void from_json(const json& j, DiffLine& line);
void to_json(json& j, const Task& task);
void from_json(const json& j, Task& task);
void to_json(json& j, const ToolActivity& activity);
void from_json(const json& j, ToolActivity& activity);
void to_json(json& j, const UsageInfo& usage);
void from_json(const json& j, UsageInfo& usage);
void to_json(json& j, const SessionSettings& settings);
void from_json(const json& j, SessionSettings& settings);
void to_json(json& j, const ChatMessage& message);
void to_json(json& j, const SessionSnapshot& snapshot);

/// Messages with an unknown role are skipped. Throws JSONDecodeError when a
/// required field is missing or the version is newer than supported.
void from_json(const json& j, SessionSnapshot& snapshot);

/// Parse one transcript entry; nullopt for an unknown role
std::optional<ChatMessage> message_from_json(const json& j);

std::int64_t to_epoch_millis(Clock::time_point time);
Clock::time_point from_epoch_millis(std::int64_t millis);

} // namespace strata

#endif // STRATA_SNAPSHOT_HPP
