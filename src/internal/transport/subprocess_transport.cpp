#include "subprocess_transport.hpp"

#include "bridge_locator.hpp"

#include <chrono>
#include <filesystem>
#include <strata/errors.hpp>

namespace strata
{
namespace internal
{

namespace
{

constexpr auto kPollInterval = std::chrono::milliseconds(100);
constexpr auto kExitGracePeriod = std::chrono::milliseconds(500);
constexpr auto kTerminateTimeout = std::chrono::milliseconds(2000);

} // namespace

SubprocessTransport::SubprocessTransport(const BridgeOptions& options)
    : options_(options), logger_(options.log_callback),
      parser_(options.max_buffer_size, Logger(options.log_callback))
{
}

SubprocessTransport::~SubprocessTransport()
{
    close();
}

void SubprocessTransport::connect(const std::map<std::string, std::string>& environment)
{
    if (ready_ && is_running())
        return;
    if (process_)
        close();

    BridgeLocation location = locate_bridge(options_);
    logger_.debug("Launching " + location.interpreter + " " + location.script);

    subprocess::SpawnOptions proc_opts;
    proc_opts.working_directory =
        std::filesystem::path(location.script).parent_path().string();
    proc_opts.environment = environment;
    proc_opts.inherit_environment = false;
    proc_opts.capture_stderr = true;

    auto process = std::make_unique<subprocess::Process>();
    try
    {
        process->spawn(location.interpreter, {location.script}, proc_opts);
    }
    catch (const std::runtime_error& e)
    {
        throw LaunchError(e.what());
    }

    process_ = std::move(process);
    parser_.clear_buffer();
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        message_queue_.clear();
        queue_stopped_ = false;
        exit_code_.reset();
    }

    running_ = true;
    reader_thread_ = std::thread(&SubprocessTransport::reader_loop, this);
    stderr_reader_thread_ = std::thread(&SubprocessTransport::stderr_reader_loop, this);
    ready_ = true;

    logger_.info("Bridge started (pid " + std::to_string(process_->pid()) + ")");
}

void SubprocessTransport::write(const std::string& data)
{
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (!ready_ || !process_)
        throw TransportError("Transport is not ready for writing");

    auto& pipe = process_->input();
    if (!pipe.is_open())
        throw TransportError("Bridge stdin is closed");

    try
    {
        pipe.write_all(data);
    }
    catch (const std::runtime_error& e)
    {
        throw TransportError(std::string("Failed to write to bridge: ") + e.what());
    }
}

std::vector<json> SubprocessTransport::read_messages()
{
    std::unique_lock<std::mutex> lock(queue_mutex_);
    queue_cv_.wait_for(lock, kPollInterval,
                       [this] { return !message_queue_.empty() || queue_stopped_; });

    std::vector<json> messages(std::make_move_iterator(message_queue_.begin()),
                               std::make_move_iterator(message_queue_.end()));
    message_queue_.clear();
    return messages;
}

bool SubprocessTransport::has_messages() const
{
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return !message_queue_.empty() || !queue_stopped_;
}

void SubprocessTransport::close()
{
    ready_ = false;
    stop_readers();

    if (process_)
    {
        {
            std::lock_guard<std::mutex> lock(write_mutex_);
            process_->input().close();
        }

        std::lock_guard<std::mutex> lock(status_mutex_);
        try
        {
            auto deadline = std::chrono::steady_clock::now() + kExitGracePeriod;
            auto code = process_->try_wait();
            while (!code && std::chrono::steady_clock::now() < deadline)
            {
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
                code = process_->try_wait();
            }
            if (!code)
            {
                process_->terminate();
                deadline = std::chrono::steady_clock::now() + kTerminateTimeout;
                while (!code && std::chrono::steady_clock::now() < deadline)
                {
                    std::this_thread::sleep_for(std::chrono::milliseconds(20));
                    code = process_->try_wait();
                }
            }
            if (!code)
            {
                logger_.warning("Bridge ignored SIGTERM, killing it");
                process_->kill();
                code = process_->wait();
            }

            std::lock_guard<std::mutex> queue_lock(queue_mutex_);
            exit_code_ = code;
        }
        catch (const std::runtime_error& e)
        {
            logger_.warning(std::string("Failed to reap bridge process: ") + e.what());
        }
        process_.reset();
    }

    std::lock_guard<std::mutex> lock(queue_mutex_);
    message_queue_.clear();
    queue_stopped_ = true;
    queue_cv_.notify_all();
}

bool SubprocessTransport::is_ready() const
{
    return ready_ && is_running();
}

void SubprocessTransport::end_input()
{
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (process_ && process_->input().is_open())
        process_->input().close();
}

long SubprocessTransport::get_pid() const
{
    return process_ ? process_->pid() : 0;
}

bool SubprocessTransport::is_running() const
{
    std::lock_guard<std::mutex> lock(status_mutex_);
    return process_ && process_->is_running();
}

std::optional<int> SubprocessTransport::exit_code() const
{
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return exit_code_;
}

void SubprocessTransport::reader_loop()
{
    try
    {
        // Read until EOF, not until exit: the final lines are often written
        // just before the process ends.
        auto& pipe = process_->output();
        while (running_)
        {
            if (!pipe.wait_readable(kPollInterval))
                continue;

            char buffer[4096];
            size_t n = pipe.read_some(buffer, sizeof(buffer));
            if (n == 0)
                break;

            auto messages = parser_.add_data(std::string(buffer, n));
            if (!messages.empty())
            {
                std::lock_guard<std::mutex> lock(queue_mutex_);
                for (auto& msg : messages)
                    message_queue_.push_back(std::move(msg));
                queue_cv_.notify_all();
            }
        }
    }
    catch (const std::exception& e)
    {
        logger_.warning(std::string("Bridge stdout reader stopped: ") + e.what());
    }

    // EOF: give the process a moment to exit so its status can be reported
    std::optional<int> code;
    auto deadline = std::chrono::steady_clock::now() + kExitGracePeriod;
    while (running_ && !code && std::chrono::steady_clock::now() < deadline)
    {
        {
            std::lock_guard<std::mutex> lock(status_mutex_);
            try
            {
                code = process_->try_wait();
            }
            catch (const std::runtime_error&)
            {
                break;
            }
        }
        if (!code)
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    if (code)
        logger_.debug("Bridge exited with status " + std::to_string(*code));

    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (code)
        exit_code_ = code;
    queue_stopped_ = true;
    queue_cv_.notify_all();
}

void SubprocessTransport::stderr_reader_loop()
{
    LineParser lines(options_.max_buffer_size, logger_);
    try
    {
        auto& pipe = process_->errors();
        while (running_)
        {
            if (!pipe.wait_readable(kPollInterval))
                continue;

            char buffer[4096];
            size_t n = pipe.read_some(buffer, sizeof(buffer));
            if (n == 0)
                break;

            for (const auto& line : lines.add_data_lines(std::string(buffer, n)))
            {
                logger_.debug("[bridge stderr] " + line);
                if (options_.debug_callback)
                {
                    try
                    {
                        (*options_.debug_callback)(line);
                    }
                    catch (const std::exception& e)
                    {
                        logger_.warning(std::string("Debug callback threw: ") + e.what());
                    }
                }
            }
        }
    }
    catch (const std::exception& e)
    {
        logger_.debug(std::string("Bridge stderr reader stopped: ") + e.what());
    }
}

void SubprocessTransport::stop_readers()
{
    running_ = false;
    if (reader_thread_.joinable())
        reader_thread_.join();
    if (stderr_reader_thread_.joinable())
        stderr_reader_thread_.join();
}

} // namespace internal

std::unique_ptr<Transport> create_subprocess_transport(const BridgeOptions& options)
{
    return std::make_unique<internal::SubprocessTransport>(options);
}

} // namespace strata
