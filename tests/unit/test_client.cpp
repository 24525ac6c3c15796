#include "../test_utils.hpp"

#include <gtest/gtest.h>
#include <strata/client.hpp>
#include <strata/errors.hpp>
#include <thread>

using namespace strata;
using namespace strata::protocol;
using namespace std::chrono_literals;
using strata::test::FakeTransport;
using strata::test::pump_until;
using strata::test::TempDir;

class BridgeClientTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        options_.start_retry_delay = 20ms;
        options_.log_callback = [this](LogLevel level, const std::string& message)
        {
            std::lock_guard<std::mutex> lock(log_mutex_);
            logs_.emplace_back(level, message);
        };

        auto transport = std::make_unique<FakeTransport>();
        state_ = transport->state();
        client_ = std::make_unique<BridgeClient>(queue_, options_, std::move(transport));
        client_->set_event_handler([this](const Event& e) { events_.push_back(e); });
        client_->set_failure_handler([this](const BridgeFailure& f) { failures_.push_back(f); });
    }

    void TearDown() override
    {
        client_.reset();
    }

    QueryCommand query(const std::string& prompt)
    {
        QueryCommand q;
        q.prompt = prompt;
        q.cwd = cwd_.str();
        return q;
    }

    // Start, handshake, and wait until the gate is open
    void start_authenticated()
    {
        client_->start();
        state_->authenticate();
        ASSERT_TRUE(wait_for([this] { return client_->is_authenticated(); }));
    }

    static bool wait_for(const std::function<bool()>& predicate,
                         std::chrono::milliseconds timeout = 2000ms)
    {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!predicate())
        {
            if (std::chrono::steady_clock::now() > deadline)
                return false;
            std::this_thread::sleep_for(2ms);
        }
        return true;
    }

    BridgeOptions options_;
    SerialQueue queue_;
    TempDir cwd_;
    std::shared_ptr<FakeTransport::State> state_;
    std::unique_ptr<BridgeClient> client_;
    std::vector<Event> events_;
    std::vector<BridgeFailure> failures_;
    std::mutex log_mutex_;
    std::vector<std::pair<LogLevel, std::string>> logs_;
};

TEST_F(BridgeClientTest, LaunchPassesSanitizedEnvironmentWithNonce)
{
    client_->start();
    EXPECT_TRUE(client_->is_running());
    EXPECT_EQ(state_->connect_count, 1);

    std::string nonce = state_->nonce();
    EXPECT_EQ(nonce.size(), 36u);
    EXPECT_EQ(state_->environment.at("TERM"), "dumb");
    EXPECT_EQ(state_->environment.at("NO_COLOR"), "1");

    // Starting again while running is a no-op
    client_->start();
    EXPECT_EQ(state_->connect_count, 1);
}

TEST_F(BridgeClientTest, EachLaunchGetsAFreshNonce)
{
    client_->start();
    std::string first = state_->nonce();
    client_->shutdown();
    client_->start();
    EXPECT_NE(state_->nonce(), first);
}

TEST_F(BridgeClientTest, HandshakeIsConsumedAndEventsFlow)
{
    start_authenticated();
    state_->push(json{{"type", "token"}, {"text", "x"}});

    ASSERT_TRUE(pump_until(queue_, [this] { return events_.size() == 1; }));
    EXPECT_TRUE(std::holds_alternative<TokenEvent>(events_[0]));
    EXPECT_TRUE(failures_.empty());
}

TEST_F(BridgeClientTest, WrongNonceFailsAuthenticationAndDeliversNothing)
{
    client_->start();
    state_->push(json{{"type", "ready"}, {"nonce", "forged"}});
    state_->push(json{{"type", "token"}, {"text", "should never arrive"}});

    ASSERT_TRUE(pump_until(queue_, [this] { return !failures_.empty(); }));
    queue_.run_for(50ms);

    EXPECT_TRUE(events_.empty());
    ASSERT_EQ(failures_.size(), 1u);
    EXPECT_EQ(failures_[0].kind, BridgeFailure::Kind::AuthenticationFailed);
    EXPECT_THROW(std::rethrow_exception(failures_[0].error), AuthenticationFailed);
    EXPECT_FALSE(client_->is_running());
    EXPECT_GE(state_->close_count, 1);
}

TEST_F(BridgeClientTest, NonReadyFirstMessageFailsAuthentication)
{
    client_->start();
    state_->push(json{{"type", "result"}, {"text", "spoofed"}, {"sessionId", "s"}});

    ASSERT_TRUE(pump_until(queue_, [this] { return !failures_.empty(); }));
    EXPECT_TRUE(events_.empty());
    EXPECT_EQ(failures_[0].kind, BridgeFailure::Kind::AuthenticationFailed);
    EXPECT_NE(failures_[0].message.find("'result'"), std::string::npos);
}

TEST_F(BridgeClientTest, QueryIsWrittenWithCanonicalCwd)
{
    start_authenticated();
    QueryCommand q = query("hello");
    q.cwd = cwd_.str() + "/./";
    client_->send(q);

    EXPECT_TRUE(client_->is_busy());
    auto commands = state_->written_commands();
    ASSERT_EQ(commands.size(), 1u);
    EXPECT_EQ(commands[0]["type"].get<std::string>(), "query");
    EXPECT_EQ(commands[0]["prompt"].get<std::string>(), "hello");
    EXPECT_EQ(commands[0]["cwd"].get<std::string>(),
              std::filesystem::canonical(cwd_.path()).string());
}

TEST_F(BridgeClientTest, SecondQueryWhileBusyThrows)
{
    start_authenticated();
    client_->send(query("one"));
    EXPECT_THROW(client_->send(query("two")), BusyError);
    EXPECT_EQ(state_->write_count(), 1u);
}

TEST_F(BridgeClientTest, ResultClearsBusyBeforeHandlerRuns)
{
    start_authenticated();
    client_->send(query("one"));

    bool busy_in_handler = true;
    client_->set_event_handler(
        [this, &busy_in_handler](const Event& e)
        {
            if (is_result_event(e))
                busy_in_handler = client_->is_busy();
            events_.push_back(e);
        });

    state_->push(json{{"type", "result"}, {"text", "done"}, {"sessionId", "s1"}});
    ASSERT_TRUE(pump_until(queue_, [this] { return !events_.empty(); }));
    EXPECT_FALSE(busy_in_handler);
    EXPECT_NO_THROW(client_->send(query("two")));
}

TEST_F(BridgeClientTest, ErrorEventEndsExchange)
{
    start_authenticated();
    client_->send(query("one"));
    state_->push(json{{"type", "error"}, {"message", "quota"}});
    ASSERT_TRUE(pump_until(queue_, [this] { return !events_.empty(); }));
    EXPECT_FALSE(client_->is_busy());
}

TEST_F(BridgeClientTest, InvalidWorkingDirectoryIsRejectedBeforeWriting)
{
    start_authenticated();
    QueryCommand q = query("hello");
    q.cwd = (cwd_.path() / "missing").string();
    EXPECT_THROW(client_->send(q), InvalidWorkingDirectoryError);

    std::string file = cwd_.write_file("plain.txt", "x");
    q.cwd = file;
    EXPECT_THROW(client_->send(q), InvalidWorkingDirectoryError);

    q.cwd = "";
    EXPECT_THROW(client_->send(q), InvalidWorkingDirectoryError);

    q.cwd = std::string("/tmp\0evil", 9);
    EXPECT_THROW(client_->send(q), InvalidWorkingDirectoryError);

    EXPECT_EQ(state_->write_count(), 0u);
    EXPECT_FALSE(client_->is_busy());
}

TEST_F(BridgeClientTest, SendWhileStoppedStartsAndRetriesOnce)
{
    client_->send(query("hello"));
    EXPECT_EQ(state_->connect_count, 1);
    EXPECT_TRUE(client_->is_busy());
    EXPECT_EQ(state_->write_count(), 0u);

    ASSERT_TRUE(pump_until(queue_, [this] { return state_->write_count() == 1; }));
    EXPECT_EQ(state_->written_commands()[0]["prompt"].get<std::string>(), "hello");
    EXPECT_TRUE(failures_.empty());
}

TEST_F(BridgeClientTest, DeferredWriteFailureIsReported)
{
    client_->send(query("hello"));
    // Process dies before the retry fires
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->running = false;
    }

    ASSERT_TRUE(pump_until(queue_, [this] { return !failures_.empty(); }));
    EXPECT_EQ(failures_[0].kind, BridgeFailure::Kind::SendFailed);
    EXPECT_FALSE(client_->is_busy());
}

TEST_F(BridgeClientTest, LaunchErrorPropagatesFromSend)
{
    state_->connect_error = "Node.js not found";
    EXPECT_THROW(client_->send(query("hello")), LaunchError);
    EXPECT_FALSE(client_->is_busy());
    EXPECT_FALSE(client_->is_running());
}

TEST_F(BridgeClientTest, ExitWhileBusyReportsProcessTerminated)
{
    start_authenticated();
    client_->send(query("hello"));
    state_->finish(3);

    ASSERT_TRUE(pump_until(queue_, [this] { return !failures_.empty(); }));
    EXPECT_EQ(failures_[0].kind, BridgeFailure::Kind::ProcessTerminated);
    EXPECT_EQ(failures_[0].exit_code.value_or(0), 3);
    EXPECT_NE(failures_[0].message.find("status 3"), std::string::npos);
    EXPECT_FALSE(client_->is_busy());
    EXPECT_FALSE(client_->is_running());
}

TEST_F(BridgeClientTest, ExitWhileIdleIsQuiet)
{
    start_authenticated();
    state_->finish(0);
    ASSERT_TRUE(pump_until(queue_, [this] { return !client_->is_running(); }));
    queue_.run_for(30ms);
    EXPECT_TRUE(failures_.empty());
}

TEST_F(BridgeClientTest, EventsFromPreviousLaunchAreDropped)
{
    start_authenticated();
    state_->push(json{{"type", "token"}, {"text", "stale"}});
    ASSERT_TRUE(wait_for([this] { return queue_.pending() > 0; }));

    client_->shutdown();
    client_->start();
    state_->authenticate();
    state_->push(json{{"type", "token"}, {"text", "fresh"}});

    ASSERT_TRUE(pump_until(queue_, [this] { return !events_.empty(); }));
    queue_.run_for(30ms);
    ASSERT_EQ(events_.size(), 1u);
    EXPECT_EQ(std::get<TokenEvent>(events_[0]).text, "fresh");
}

TEST_F(BridgeClientTest, PermissionResponseEncoding)
{
    start_authenticated();
    client_->respond_to_permission("req-1", false, std::string("User denied permission"));
    client_->respond_to_permission("req-2", true);

    auto commands = state_->written_commands();
    ASSERT_EQ(commands.size(), 2u);
    EXPECT_EQ(commands[0]["type"].get<std::string>(), "permission_response");
    EXPECT_EQ(commands[0]["requestId"].get<std::string>(), "req-1");
    EXPECT_EQ(commands[0]["behavior"].get<std::string>(), "deny");
    EXPECT_EQ(commands[0]["message"].get<std::string>(), "User denied permission");
    EXPECT_EQ(commands[1]["behavior"].get<std::string>(), "allow");
    EXPECT_FALSE(commands[1].contains("message"));
}

TEST_F(BridgeClientTest, PermissionRequestCarriesQueryCwd)
{
    start_authenticated();
    client_->send(query("edit"));
    state_->push(json{{"type", "permission_request"},
                      {"requestId", "r"},
                      {"toolName", "Edit"},
                      {"input", {{"file_path", "/elsewhere/a.txt"}}}});

    ASSERT_TRUE(pump_until(queue_, [this] { return !events_.empty(); }));
    const auto& request = std::get<PermissionRequestEvent>(events_[0]).request;
    EXPECT_EQ(request.working_directory.value_or(""),
              std::filesystem::canonical(cwd_.path()).string());
    EXPECT_TRUE(request.is_outside_working_directory());
}

TEST_F(BridgeClientTest, PermissionResponseWhileStoppedThrows)
{
    EXPECT_THROW(client_->respond_to_permission("r", true), TransportError);
}

TEST_F(BridgeClientTest, CancelWritesCommandAndClearsBusy)
{
    start_authenticated();
    client_->send(query("long"));
    client_->cancel();

    EXPECT_FALSE(client_->is_busy());
    auto commands = state_->written_commands();
    ASSERT_EQ(commands.size(), 2u);
    EXPECT_EQ(commands[1].dump(), R"({"type":"cancel"})");
}

TEST_F(BridgeClientTest, CancelWhileStoppedWritesNothing)
{
    client_->cancel();
    client_->send(CancelCommand{});
    EXPECT_EQ(state_->write_count(), 0u);
    EXPECT_FALSE(client_->is_busy());
}

TEST_F(BridgeClientTest, DebugEventReachesCallbackAndHandler)
{
    std::vector<std::string> debug_lines;
    auto transport = std::make_unique<FakeTransport>();
    auto state = transport->state();
    BridgeOptions options = options_;
    options.debug_callback = [&debug_lines](const std::string& line)
    { debug_lines.push_back(line); };

    BridgeClient client(queue_, options, std::move(transport));
    std::vector<Event> events;
    client.set_event_handler([&events](const Event& e) { events.push_back(e); });
    client.start();
    state->authenticate();
    state->push(json{{"type", "debug"}, {"message", "sdk loaded"}});

    ASSERT_TRUE(pump_until(queue_, [&events] { return !events.empty(); }));
    ASSERT_EQ(debug_lines.size(), 1u);
    EXPECT_EQ(debug_lines[0], "sdk loaded");
    EXPECT_TRUE(std::holds_alternative<DebugEvent>(events[0]));
}

TEST_F(BridgeClientTest, ShutdownResetsState)
{
    start_authenticated();
    client_->send(query("x"));
    client_->shutdown();

    EXPECT_FALSE(client_->is_running());
    EXPECT_FALSE(client_->is_busy());
    EXPECT_FALSE(client_->is_authenticated());
    // Idempotent
    client_->shutdown();
}

TEST(CanonicalWorkingDirectoryTest, ResolvesSymlinks)
{
    TempDir dir;
    std::filesystem::create_directories(dir.path() / "real");
    std::filesystem::create_directory_symlink(dir.path() / "real", dir.path() / "link");

    EXPECT_EQ(canonical_working_directory((dir.path() / "link").string()),
              std::filesystem::canonical(dir.path() / "real").string());
}
