#ifndef STRATA_CLIENT_HPP
#define STRATA_CLIENT_HPP

#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <strata/dispatcher.hpp>
#include <strata/protocol/events.hpp>
#include <strata/transport.hpp>
#include <strata/types.hpp>
#include <string>

namespace strata
{

// Asynchronous failure reported by the bridge supervisor
struct BridgeFailure
{
    enum class Kind
    {
        AuthenticationFailed, // first message was not a ready event with the launch nonce
        ProcessTerminated,    // process exited while a request was in flight
        SendFailed            // the deferred start-up write failed
    };

    Kind kind;
    std::string message;
    std::optional<int> exit_code;
    // AuthenticationFailed, ProcessTerminated, or the StrataError of the failed write
    std::exception_ptr error;
};

using EventHandler = std::function<void(const protocol::Event& event)>;
using FailureHandler = std::function<void(const BridgeFailure& failure)>;

/**
 * Supervisor for one bridge process.
 *
 * Launches the bridge with a sanitized environment and a fresh nonce, gates
 * the stream on the ready handshake, and delivers decoded events in order on
 * the dispatcher. Handlers always run on the dispatcher; events from a
 * previous launch are discarded after a restart or shutdown.
 *
 * All methods except is_running()/is_busy() are meant to be called from the
 * dispatcher's thread.
 */
class BridgeClient
{
  public:
    explicit BridgeClient(Dispatcher& dispatcher, const BridgeOptions& options = BridgeOptions{});
    // Test-only/advanced: inject a custom transport implementation.
    BridgeClient(Dispatcher& dispatcher, const BridgeOptions& options,
                 std::unique_ptr<Transport> transport);
    ~BridgeClient();

    BridgeClient(const BridgeClient&) = delete;
    BridgeClient& operator=(const BridgeClient&) = delete;

    void set_event_handler(EventHandler handler);
    void set_failure_handler(FailureHandler handler);

    // Launch the bridge if it is not running. Throws LaunchError.
    void start();

    /**
     * Send a command.
     *
     * query/compact throw BusyError while a request is in flight and mark the
     * client busy until result or error. A query's cwd is validated and
     * canonicalised (InvalidWorkingDirectoryError). If the bridge is not
     * running it is started and the write is retried once after
     * BridgeOptions::start_retry_delay.
     */
    void send(const protocol::Command& command);

    // Write a cancel command and clear the in-flight flag locally
    void cancel();

    // Fire-and-forget permission_response
    void respond_to_permission(const std::string& request_id, bool allow,
                               const std::optional<std::string>& message = std::nullopt);

    // Close stdin, stop the process, join the reader and reset all state
    void shutdown();

    bool is_running() const;
    bool is_busy() const;
    bool is_authenticated() const;
    long get_pid() const;

  private:
    class Impl;
    std::shared_ptr<Impl> impl_;
};

/// Validate a working directory and return its canonical form.
/// Throws InvalidWorkingDirectoryError.
std::string canonical_working_directory(const std::string& path);

} // namespace strata

#endif // STRATA_CLIENT_HPP
