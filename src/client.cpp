#include "internal/log.hpp"
#include "internal/overloaded.hpp"
#include "internal/transport/environment.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <openssl/crypto.h>
#include <strata/client.hpp>
#include <strata/errors.hpp>
#include <thread>

namespace strata
{

namespace
{

bool nonce_matches(const std::string& received, const std::string& expected)
{
    return received.size() == expected.size() && !expected.empty() &&
           CRYPTO_memcmp(received.data(), expected.data(), expected.size()) == 0;
}

} // namespace

std::string canonical_working_directory(const std::string& path)
{
    namespace fs = std::filesystem;

    if (path.empty())
        throw InvalidWorkingDirectoryError("Working directory is empty", path);
    if (path.find('\0') != std::string::npos)
        throw InvalidWorkingDirectoryError("Working directory contains a NUL byte", path);

    std::error_code ec;
    fs::path canonical = fs::canonical(path, ec);
    if (ec)
        throw InvalidWorkingDirectoryError("Working directory does not exist: " + path, path);
    if (!fs::is_directory(canonical, ec))
        throw InvalidWorkingDirectoryError("Working directory is not a directory: " + path, path);
    return canonical.string();
}

// BridgeClient::Impl - supervisor state shared with posted closures (weakly)
class BridgeClient::Impl : public std::enable_shared_from_this<BridgeClient::Impl>
{
  public:
    Dispatcher& dispatcher_;
    BridgeOptions options_;
    internal::Logger logger_;
    std::unique_ptr<Transport> transport_;

    EventHandler event_handler_;
    FailureHandler failure_handler_;

    std::thread reader_thread_;
    std::atomic<bool> reading_{false};
    std::atomic<bool> started_{false};
    std::atomic<bool> busy_{false};
    std::atomic<bool> authenticated_{false};
    // Bumped on every launch and shutdown; closures from older launches are dropped
    std::atomic<std::uint64_t> generation_{0};

    std::string nonce_;

    // Working directory of the last query, attached to permission requests
    mutable std::mutex cwd_mutex_;
    std::optional<std::string> working_directory_;

    Impl(Dispatcher& dispatcher, const BridgeOptions& options, std::unique_ptr<Transport> transport)
        : dispatcher_(dispatcher), options_(options), logger_(options.log_callback),
          transport_(std::move(transport))
    {
    }

    ~Impl()
    {
        shutdown();
    }

    bool is_running() const
    {
        return started_ && transport_ && transport_->is_running();
    }

    std::optional<std::string> working_directory() const
    {
        std::lock_guard<std::mutex> lock(cwd_mutex_);
        return working_directory_;
    }

    void set_working_directory(const std::string& cwd)
    {
        std::lock_guard<std::mutex> lock(cwd_mutex_);
        working_directory_ = cwd;
    }

    void start()
    {
        if (is_running())
            return;
        if (started_)
        {
            logger_.debug("Bridge process is gone, relaunching");
            shutdown();
        }

        nonce_ = generate_uuid();
        authenticated_ = false;
        transport_->connect(internal::build_bridge_environment(nonce_));

        std::uint64_t generation = ++generation_;
        started_ = true;
        reading_ = true;
        reader_thread_ = std::thread(&Impl::reader_loop, this, generation);
    }

    void shutdown()
    {
        ++generation_;
        reading_ = false;
        if (started_ && transport_)
            transport_->end_input();
        if (reader_thread_.joinable())
            reader_thread_.join();
        if (started_ && transport_)
            transport_->close();

        started_ = false;
        busy_ = false;
        authenticated_ = false;
    }

    void write_command(const protocol::Command& command)
    {
        if (!is_running())
            throw TransportError("Bridge is not running");
        logger_.debug("-> " + protocol::encode_command(command).value("type", std::string()));
        transport_->write(protocol::encode_command_line(command));
    }

    void send_request(protocol::Command command)
    {
        if (busy_)
            throw BusyError("A request is already in flight");

        if (auto* query = std::get_if<protocol::QueryCommand>(&command))
        {
            query->cwd = canonical_working_directory(query->cwd);
            set_working_directory(query->cwd);
        }
        else if (auto* compact = std::get_if<protocol::CompactCommand>(&command))
        {
            compact->cwd = canonical_working_directory(compact->cwd);
            set_working_directory(compact->cwd);
        }

        if (!is_running())
        {
            start();
            busy_ = true;
            std::weak_ptr<Impl> weak = weak_from_this();
            std::uint64_t generation = generation_;
            dispatcher_.post_after(options_.start_retry_delay,
                                   [weak, generation, command]()
                                   {
                                       auto self = weak.lock();
                                       if (!self || self->generation_ != generation)
                                           return;
                                       self->deferred_write(command);
                                   });
            return;
        }

        write_command(command);
        busy_ = true;
    }

    void deferred_write(const protocol::Command& command)
    {
        try
        {
            write_command(command);
        }
        catch (const StrataError& e)
        {
            busy_ = false;
            logger_.error(std::string("Deferred send failed: ") + e.what());
            report_failure(BridgeFailure{BridgeFailure::Kind::SendFailed, e.what(), std::nullopt,
                                         std::current_exception()});
        }
    }

    void report_failure(const BridgeFailure& failure)
    {
        if (failure_handler_)
            failure_handler_(failure);
    }

    // ------------------------------------------------------------------
    // Reader thread
    // ------------------------------------------------------------------

    void reader_loop(std::uint64_t generation)
    {
        std::weak_ptr<Impl> weak = weak_from_this();
        try
        {
            while (reading_)
            {
                auto messages = transport_->read_messages();
                for (auto& message : messages)
                {
                    if (!authenticated_)
                    {
                        auto first = protocol::decode_event(message);
                        auto* ready = std::get_if<protocol::ReadyEvent>(&first);
                        if (ready && nonce_matches(ready->nonce, nonce_))
                        {
                            authenticated_ = true;
                            logger_.debug("Bridge authenticated");
                            continue;
                        }
                        post_authentication_failure(weak, generation,
                                                    protocol::event_type_name(first));
                        return;
                    }

                    post_event(weak, generation,
                               protocol::decode_event(message, working_directory()));
                }

                if (messages.empty() && !transport_->has_messages())
                {
                    post_exit(weak, generation);
                    return;
                }
            }
        }
        catch (const std::exception& e)
        {
            logger_.error(std::string("Bridge reader failed: ") + e.what());
            post_exit(weak, generation);
        }
    }

    void post_event(const std::weak_ptr<Impl>& weak, std::uint64_t generation,
                    protocol::Event event)
    {
        dispatcher_.post(
            [weak, generation, event = std::move(event)]()
            {
                auto self = weak.lock();
                if (!self || self->generation_ != generation)
                    return;
                self->deliver(event);
            });
    }

    void post_authentication_failure(const std::weak_ptr<Impl>& weak, std::uint64_t generation,
                                     const std::string& received)
    {
        dispatcher_.post(
            [weak, generation, received]()
            {
                auto self = weak.lock();
                if (!self || self->generation_ != generation)
                    return;

                std::string message = "Bridge authentication failed: first message was '" +
                                      (received.empty() ? std::string("invalid") : received) +
                                      "', not a ready handshake with the launch nonce";
                self->logger_.error(message);
                self->shutdown();
                self->report_failure(
                    BridgeFailure{BridgeFailure::Kind::AuthenticationFailed, message, std::nullopt,
                                  std::make_exception_ptr(AuthenticationFailed(message))});
            });
    }

    void post_exit(const std::weak_ptr<Impl>& weak, std::uint64_t generation)
    {
        dispatcher_.post(
            [weak, generation]()
            {
                auto self = weak.lock();
                if (!self || self->generation_ != generation)
                    return;
                self->handle_exit();
            });
    }

    // Runs on the dispatcher
    void deliver(const protocol::Event& event)
    {
        if (protocol::is_terminal_event(event))
            busy_ = false;

        if (auto* debug = std::get_if<protocol::DebugEvent>(&event))
        {
            logger_.debug("[bridge] " + debug->message);
            if (options_.debug_callback)
            {
                try
                {
                    (*options_.debug_callback)(debug->message);
                }
                catch (const std::exception& e)
                {
                    logger_.warning(std::string("Debug callback threw: ") + e.what());
                }
            }
        }

        if (event_handler_)
            event_handler_(event);
    }

    void handle_exit()
    {
        bool was_busy = busy_;
        // The reader has returned; close() reaps the process
        shutdown();
        std::optional<int> code = transport_ ? transport_->exit_code() : std::nullopt;

        if (!was_busy)
        {
            logger_.info("Bridge process exited" +
                         (code ? " with status " + std::to_string(*code) : std::string()));
            return;
        }

        std::string message = "Bridge process exited unexpectedly" +
                              (code ? " (status " + std::to_string(*code) + ")" : std::string());
        logger_.error(message);
        report_failure(BridgeFailure{BridgeFailure::Kind::ProcessTerminated, message, code,
                                     std::make_exception_ptr(
                                         ProcessTerminated(message, code.value_or(-1)))});
    }
};

// ============================================================================
// BridgeClient
// ============================================================================

BridgeClient::BridgeClient(Dispatcher& dispatcher, const BridgeOptions& options)
    : impl_(std::make_shared<Impl>(dispatcher, options, create_subprocess_transport(options)))
{
}

BridgeClient::BridgeClient(Dispatcher& dispatcher, const BridgeOptions& options,
                           std::unique_ptr<Transport> transport)
    : impl_(std::make_shared<Impl>(dispatcher, options, std::move(transport)))
{
}

BridgeClient::~BridgeClient()
{
    if (impl_)
        impl_->shutdown();
}

void BridgeClient::set_event_handler(EventHandler handler)
{
    impl_->event_handler_ = std::move(handler);
}

void BridgeClient::set_failure_handler(FailureHandler handler)
{
    impl_->failure_handler_ = std::move(handler);
}

void BridgeClient::start()
{
    impl_->start();
}

void BridgeClient::send(const protocol::Command& command)
{
    std::visit(
        internal::overloaded{
            [this](const protocol::QueryCommand& c) { impl_->send_request(c); },
            [this](const protocol::CompactCommand& c) { impl_->send_request(c); },
            [this](const protocol::PermissionResponseCommand& c) { impl_->write_command(c); },
            [this](const protocol::CancelCommand&) { cancel(); }},
        command);
}

void BridgeClient::cancel()
{
    if (impl_->is_running())
    {
        try
        {
            impl_->write_command(protocol::CancelCommand{});
        }
        catch (const TransportError& e)
        {
            impl_->logger_.warning(std::string("Cancel not delivered: ") + e.what());
        }
    }
    impl_->busy_ = false;
}

void BridgeClient::respond_to_permission(const std::string& request_id, bool allow,
                                         const std::optional<std::string>& message)
{
    impl_->write_command(protocol::PermissionResponseCommand{request_id, allow, message});
}

void BridgeClient::shutdown()
{
    impl_->shutdown();
}

bool BridgeClient::is_running() const
{
    return impl_->is_running();
}

bool BridgeClient::is_busy() const
{
    return impl_->busy_;
}

bool BridgeClient::is_authenticated() const
{
    return impl_->authenticated_;
}

long BridgeClient::get_pid() const
{
    return impl_->transport_ ? impl_->transport_->get_pid() : 0;
}

} // namespace strata
