#ifndef STRATA_SESSION_HPP
#define STRATA_SESSION_HPP

#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <strata/client.hpp>
#include <strata/protocol/events.hpp>
#include <strata/snapshot.hpp>
#include <strata/types.hpp>
#include <string>
#include <vector>

namespace strata
{

namespace internal
{
class Logger;
}

/**
 * Conversation state machine for one bridge.
 *
 * A Session owns its BridgeClient and is driven by two inputs only: the
 * caller's commands (send, cancel, compact, respond_to_permission) and the
 * decoded events the client delivers on the dispatcher. All methods must be
 * called on the dispatcher's thread.
 *
 * Operational failures never escape as exceptions; they are appended to the
 * transcript as system messages ("Error: ...").
 */
class Session
{
  public:
    static constexpr const char* kCompactingText = "Compacting conversation…";
    static constexpr const char* kCompactedText = "Conversation compacted";
    static constexpr const char* kCancelledSuffix = "\n\n*[Cancelled]*";
    static constexpr const char* kDeniedMessage = "User denied permission";

    Session(Dispatcher& dispatcher, const BridgeOptions& options,
            SessionSettings settings = SessionSettings{}, std::string name = "New Session");
    Session(std::unique_ptr<BridgeClient> client, SessionSettings settings = SessionSettings{},
            std::string name = "New Session");
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /// Send a user prompt. Returns false, leaving the transcript untouched,
    /// when text is empty or a request is already in flight.
    bool send(const std::string& text);

    /// Ask the backend to summarise the conversation. Requires a continuation
    /// token and an idle session.
    bool compact(const std::optional<std::string>& focus_instructions = std::nullopt);

    /// Stop the in-flight request. No-op when idle.
    void cancel();

    /// Answer the pending permission request (front of the queue).
    void respond_to_permission(bool allow);

    // Apply one decoded bridge event
    void handle_event(const protocol::Event& event);

    // Apply an asynchronous supervisor failure
    void handle_failure(const BridgeFailure& failure);

    SessionSnapshot snapshot() const;

    /// Replace the session state with a snapshot. A working directory that
    /// no longer exists falls back to $HOME. Must be called while idle.
    void restore(const SessionSnapshot& snapshot);

    /// Invoked after every change worth persisting
    void set_change_callback(std::function<void()> callback);

    // Accessors
    const std::string& id() const
    {
        return id_;
    }
    const std::string& name() const
    {
        return name_;
    }
    void set_name(const std::string& name);
    Clock::time_point created_at() const
    {
        return created_at_;
    }
    const std::vector<ChatMessage>& messages() const
    {
        return messages_;
    }
    bool is_responding() const
    {
        return responding_;
    }
    bool is_compacting() const
    {
        return compacting_;
    }
    bool is_busy() const
    {
        return responding_ || compacting_;
    }
    const std::optional<std::string>& session_id() const
    {
        return session_id_;
    }
    double total_cost() const
    {
        return total_cost_;
    }
    const std::optional<UsageInfo>& last_usage() const
    {
        return last_usage_;
    }
    const TaskTable& tasks() const
    {
        return tasks_;
    }
    const SessionSettings& settings() const
    {
        return settings_;
    }
    void set_settings(const SessionSettings& settings);

    // Effective working directory ($HOME when unset)
    std::string working_directory() const;

    // Front of the permission queue
    std::optional<PermissionRequest> pending_permission() const;
    std::size_t queued_permission_count() const
    {
        return permissions_.size();
    }
    // Requests that arrived while another one was still unanswered
    std::size_t permission_sequencing_violations() const
    {
        return permission_violations_;
    }

    BridgeClient& client()
    {
        return *client_;
    }

  private:
    void attach_client();

    void on_token(const std::string& text);
    void on_set_text(const std::string& text);
    void on_tool_activity(const ToolActivity& activity);
    void on_permission_request(const PermissionRequest& request);
    void on_result(const protocol::ResultEvent& result);
    void on_error(const std::string& message);

    void begin_request(const std::string& user_text, const std::string& system_text);
    void ensure_assistant_message();
    void update_last_assistant_message(const std::string& text);
    void drop_trailing_empty_assistant();
    void rewrite_compaction_notice(const std::string& text);
    void append_error(const std::string& message);
    void reconcile_tasks(const ToolActivity& activity);
    void notify_changed();

    std::unique_ptr<BridgeClient> client_;
    std::unique_ptr<internal::Logger> logger_;

    std::string id_;
    std::string name_;
    Clock::time_point created_at_;
    SessionSettings settings_;

    std::vector<ChatMessage> messages_;
    bool responding_ = false;
    bool compacting_ = false;

    // Text of the current assistant turn
    std::string buffer_;
    // Next content starts a new assistant message (set after a tool ran)
    bool needs_new_assistant_ = false;

    std::optional<std::string> session_id_;
    double total_cost_ = 0.0;
    std::optional<UsageInfo> last_usage_;
    TaskTable tasks_;

    std::deque<PermissionRequest> permissions_;
    std::size_t permission_violations_ = 0;

    std::function<void()> change_callback_;
};

} // namespace strata

#endif // STRATA_SESSION_HPP
