#ifndef STRATA_INTERNAL_SUBPROCESS_TRANSPORT_HPP
#define STRATA_INTERNAL_SUBPROCESS_TRANSPORT_HPP

#include "../line_parser.hpp"
#include "../log.hpp"
#include "../subprocess/process.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <strata/transport.hpp>
#include <thread>

namespace strata
{
namespace internal
{

/**
 * Transport running `node <bridge script>` as a child process.
 *
 * stdout is framed into JSON objects on a reader thread; stderr is drained on
 * its own thread into the debug log. The child's working directory is the
 * directory holding the bridge script.
 */
class SubprocessTransport : public Transport
{
  public:
    explicit SubprocessTransport(const BridgeOptions& options);
    ~SubprocessTransport() override;

    void connect(const std::map<std::string, std::string>& environment) override;
    void write(const std::string& data) override;
    std::vector<json> read_messages() override;
    bool has_messages() const override;
    void close() override;
    bool is_ready() const override;
    void end_input() override;
    long get_pid() const override;
    bool is_running() const override;
    std::optional<int> exit_code() const override;

  private:
    void reader_loop();
    void stderr_reader_loop();
    void stop_readers();

    BridgeOptions options_;
    Logger logger_;

    std::unique_ptr<subprocess::Process> process_;
    LineParser parser_;

    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<json> message_queue_;
    bool queue_stopped_ = false;

    // Serializes stdin writes against close/end_input
    mutable std::mutex write_mutex_;
    // Guards reaping and status queries on process_
    mutable std::mutex status_mutex_;

    std::thread reader_thread_;
    std::thread stderr_reader_thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> ready_{false};
    std::optional<int> exit_code_;
};

} // namespace internal
} // namespace strata

#endif // STRATA_INTERNAL_SUBPROCESS_TRANSPORT_HPP
