#ifndef STRATA_TRANSPORT_HPP
#define STRATA_TRANSPORT_HPP

#include <map>
#include <memory>
#include <optional>
#include <strata/types.hpp>
#include <string>
#include <vector>

namespace strata
{

/**
 * Abstract transport to a bridge process.
 *
 * A transport moves newline-framed JSON between the engine and the bridge.
 * It knows nothing about the meaning of messages: authentication and event
 * decoding happen in BridgeClient on top of it.
 *
 * Implementations:
 * - SubprocessTransport: node + bridge script over stdin/stdout
 * - test doubles injected through BridgeClient's transport constructor
 */
class Transport
{
  public:
    virtual ~Transport() = default;

    /**
     * Start the bridge with exactly the given environment (nothing else is
     * inherited). Throws LaunchError when it cannot be located or spawned.
     */
    virtual void connect(const std::map<std::string, std::string>& environment) = 0;

    /**
     * Write one encoded command (a single line ending in '\n').
     * Throws TransportError if the bridge is gone.
     */
    virtual void write(const std::string& data) = 0;

    /**
     * Return the JSON objects read since the last call, in read order.
     * Waits briefly (up to ~100ms) when nothing is queued; an empty result
     * does not mean end of stream, check has_messages() for that.
     */
    virtual std::vector<json> read_messages() = 0;

    /**
     * False once the output stream has ended and every queued message has
     * been handed out.
     */
    virtual bool has_messages() const = 0;

    /**
     * Close stdin, stop the reader threads and make sure the process is gone.
     */
    virtual void close() = 0;

    virtual bool is_ready() const = 0;

    /**
     * Close the bridge's stdin.
     */
    virtual void end_input() = 0;

    virtual long get_pid() const
    {
        return 0;
    }

    virtual bool is_running() const = 0;

    // Exit status once the process has been reaped
    virtual std::optional<int> exit_code() const
    {
        return std::nullopt;
    }
};

// Transport that launches node with the located bridge script
std::unique_ptr<Transport> create_subprocess_transport(const BridgeOptions& options);

} // namespace strata

#endif // STRATA_TRANSPORT_HPP
