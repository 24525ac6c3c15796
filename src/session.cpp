#include "internal/log.hpp"
#include "internal/overloaded.hpp"

#include <filesystem>
#include <strata/errors.hpp>
#include <strata/session.hpp>
#include <strata/tools.hpp>

namespace strata
{

Session::Session(Dispatcher& dispatcher, const BridgeOptions& options, SessionSettings settings,
                 std::string name)
    : client_(std::make_unique<BridgeClient>(dispatcher, options)),
      logger_(std::make_unique<internal::Logger>(options.log_callback)), id_(generate_uuid()),
      name_(std::move(name)), created_at_(Clock::now()), settings_(std::move(settings))
{
    attach_client();
}

Session::Session(std::unique_ptr<BridgeClient> client, SessionSettings settings, std::string name)
    : client_(std::move(client)), logger_(std::make_unique<internal::Logger>()),
      id_(generate_uuid()), name_(std::move(name)), created_at_(Clock::now()),
      settings_(std::move(settings))
{
    attach_client();
}

Session::~Session()
{
    // Stops delivery before the handlers capturing this go away
    client_->shutdown();
    client_->set_event_handler(nullptr);
    client_->set_failure_handler(nullptr);
}

void Session::attach_client()
{
    client_->set_event_handler([this](const protocol::Event& event) { handle_event(event); });
    client_->set_failure_handler([this](const BridgeFailure& failure) { handle_failure(failure); });
}

std::string Session::working_directory() const
{
    return settings_.working_directory.empty() ? home_directory() : settings_.working_directory;
}

void Session::set_name(const std::string& name)
{
    name_ = name;
    notify_changed();
}

void Session::set_settings(const SessionSettings& settings)
{
    settings_ = settings;
    notify_changed();
}

void Session::set_change_callback(std::function<void()> callback)
{
    change_callback_ = std::move(callback);
}

// ============================================================================
// Commands
// ============================================================================

bool Session::send(const std::string& text)
{
    if (text.empty() || is_busy() || client_->is_busy())
        return false;

    protocol::QueryCommand query;
    query.prompt = text;
    query.cwd = working_directory();
    query.permission_mode = settings_.permission_mode;
    query.session_id = session_id_;
    if (!settings_.model.empty())
        query.model = settings_.model;
    if (!settings_.custom_system_prompt.empty())
        query.system_prompt = settings_.custom_system_prompt;

    std::size_t mark = messages_.size();
    begin_request(text, "");
    responding_ = true;

    try
    {
        client_->send(query);
    }
    catch (const BusyError&)
    {
        messages_.resize(mark);
        responding_ = false;
        return false;
    }
    catch (const StrataError& e)
    {
        responding_ = false;
        drop_trailing_empty_assistant();
        append_error(e.what());
        notify_changed();
    }
    return true;
}

bool Session::compact(const std::optional<std::string>& focus_instructions)
{
    if (!session_id_ || is_busy() || client_->is_busy())
        return false;

    protocol::CompactCommand command;
    command.session_id = *session_id_;
    command.cwd = working_directory();
    command.permission_mode = settings_.permission_mode;
    if (!settings_.model.empty())
        command.model = settings_.model;
    command.focus_instructions = focus_instructions;

    std::size_t mark = messages_.size();
    begin_request("", kCompactingText);
    compacting_ = true;

    try
    {
        client_->send(command);
    }
    catch (const BusyError&)
    {
        messages_.resize(mark);
        compacting_ = false;
        return false;
    }
    catch (const StrataError& e)
    {
        compacting_ = false;
        drop_trailing_empty_assistant();
        append_error(e.what());
        notify_changed();
    }
    return true;
}

void Session::begin_request(const std::string& user_text, const std::string& system_text)
{
    // The bridge denies permissions orphaned by a new query on its own
    if (!permissions_.empty())
    {
        logger_->debug("Discarding " + std::to_string(permissions_.size()) +
                       " stale permission request(s)");
        permissions_.clear();
    }

    if (!user_text.empty())
        messages_.emplace_back(Role::User, user_text);
    if (!system_text.empty())
        messages_.emplace_back(Role::System, system_text);
    messages_.emplace_back(Role::Assistant, "");
    buffer_.clear();
    needs_new_assistant_ = false;
}

void Session::cancel()
{
    if (!is_busy())
        return;

    client_->cancel();
    bool was_compacting = compacting_;
    responding_ = false;
    compacting_ = false;
    needs_new_assistant_ = false;

    if (!buffer_.empty())
        update_last_assistant_message(buffer_ + kCancelledSuffix);
    else
        drop_trailing_empty_assistant();
    buffer_.clear();

    if (was_compacting)
        rewrite_compaction_notice("Compaction cancelled");
    notify_changed();
}

void Session::respond_to_permission(bool allow)
{
    if (permissions_.empty())
        return;

    PermissionRequest request = std::move(permissions_.front());
    permissions_.pop_front();

    try
    {
        client_->respond_to_permission(request.id, allow,
                                       allow ? std::nullopt
                                             : std::optional<std::string>(kDeniedMessage));
    }
    catch (const StrataError& e)
    {
        append_error(e.what());
        notify_changed();
    }
}

std::optional<PermissionRequest> Session::pending_permission() const
{
    if (permissions_.empty())
        return std::nullopt;
    return permissions_.front();
}

// ============================================================================
// Events
// ============================================================================

void Session::handle_event(const protocol::Event& event)
{
    std::visit(
        internal::overloaded{
            [this](const protocol::TokenEvent& e) { on_token(e.text); },
            [this](const protocol::SetTextEvent& e) { on_set_text(e.text); },
            [this](const protocol::TurnCompleteEvent&) { needs_new_assistant_ = true; },
            [this](const protocol::ToolActivityEvent& e) { on_tool_activity(e.activity); },
            [this](const protocol::PermissionRequestEvent& e) { on_permission_request(e.request); },
            [this](const protocol::ResultEvent& e) { on_result(e); },
            [this](const protocol::ErrorEvent& e) { on_error(e.message); },
            // Handshake and diagnostics are consumed by the client
            [](const protocol::ReadyEvent&) {},
            [](const protocol::DebugEvent&) {},
            [](const protocol::IgnoredEvent&) {}},
        event);
}

void Session::handle_failure(const BridgeFailure& failure)
{
    responding_ = false;
    if (compacting_)
    {
        compacting_ = false;
        rewrite_compaction_notice("Compaction failed");
    }
    needs_new_assistant_ = false;
    permissions_.clear();
    drop_trailing_empty_assistant();
    append_error(failure.message);
    notify_changed();
}

void Session::on_token(const std::string& text)
{
    // Text still in flight when the request was cancelled
    if (!is_busy())
        return;
    ensure_assistant_message();
    buffer_ += text;
    update_last_assistant_message(buffer_);
}

void Session::on_set_text(const std::string& text)
{
    if (!is_busy())
        return;
    ensure_assistant_message();
    buffer_ = text;
    update_last_assistant_message(buffer_);
}

void Session::on_tool_activity(const ToolActivity& activity)
{
    // A tool that runs before any text replaces the placeholder
    drop_trailing_empty_assistant();
    messages_.emplace_back(Role::Tool, tools::summary_text(activity), activity);
    reconcile_tasks(activity);
    needs_new_assistant_ = true;
    notify_changed();
}

void Session::on_permission_request(const PermissionRequest& request)
{
    if (!permissions_.empty())
    {
        ++permission_violations_;
        logger_->warning("Permission request " + request.id + " arrived while " +
                         permissions_.front().id + " is unanswered; queued");
    }
    permissions_.push_back(request);
}

void Session::on_result(const protocol::ResultEvent& result)
{
    bool was_compacting = compacting_;
    responding_ = false;
    compacting_ = false;

    if (result.session_id)
        session_id_ = result.session_id;
    if (result.usage)
    {
        last_usage_ = result.usage;
        total_cost_ = result.usage->cost_usd;
    }

    if (!buffer_.empty())
        update_last_assistant_message(buffer_);
    drop_trailing_empty_assistant();

    if (was_compacting)
        rewrite_compaction_notice(kCompactedText);

    buffer_.clear();
    needs_new_assistant_ = false;
    notify_changed();
}

void Session::on_error(const std::string& message)
{
    responding_ = false;
    if (compacting_)
    {
        compacting_ = false;
        rewrite_compaction_notice("Compaction failed");
    }
    drop_trailing_empty_assistant();
    append_error(message);
    notify_changed();
}

// ============================================================================
// Transcript helpers
// ============================================================================

void Session::ensure_assistant_message()
{
    if (!needs_new_assistant_)
        return;
    needs_new_assistant_ = false;
    // An untouched placeholder already stands for the next run of text
    if (buffer_.empty() && !messages_.empty() && messages_.back().role == Role::Assistant &&
        messages_.back().text.empty())
        return;
    messages_.emplace_back(Role::Assistant, "");
    buffer_.clear();
}

void Session::update_last_assistant_message(const std::string& text)
{
    // Tool and system messages may follow the assistant message being streamed
    for (auto it = messages_.rbegin(); it != messages_.rend(); ++it)
    {
        if (it->role == Role::Assistant)
        {
            it->text = text;
            return;
        }
    }
}

void Session::drop_trailing_empty_assistant()
{
    if (!messages_.empty() && messages_.back().role == Role::Assistant &&
        messages_.back().text.empty())
        messages_.pop_back();
}

void Session::rewrite_compaction_notice(const std::string& text)
{
    for (auto it = messages_.rbegin(); it != messages_.rend(); ++it)
    {
        if (it->role == Role::System && it->text == kCompactingText)
        {
            it->text = text;
            return;
        }
    }
}

void Session::append_error(const std::string& message)
{
    logger_->warning("Session error: " + message);
    messages_.emplace_back(Role::System, "Error: " + message);
}

void Session::reconcile_tasks(const ToolActivity& activity)
{
    switch (tools::task_effect(activity.tool_name))
    {
    case tools::TaskEffect::None:
        return;

    case tools::TaskEffect::Upsert:
    {
        if (const auto& task = activity.result.task)
        {
            if (task->status == TaskStatus::Deleted)
                tasks_.erase(task->id);
            else
                tasks_[task->id] = *task;
            return;
        }

        // TaskUpdate results often carry no task record; apply the input
        const auto& input = activity.input;
        if (activity.tool_name != "TaskUpdate" || !input.task_id)
            return;
        auto it = tasks_.find(*input.task_id);
        if (it == tasks_.end())
            return;
        if (input.task_status)
        {
            auto status = task_status_from_name(*input.task_status);
            if (status == TaskStatus::Deleted)
            {
                tasks_.erase(it);
                return;
            }
            if (status)
                it->second.status = *status;
        }
        if (input.subject)
            it->second.subject = *input.subject;
        if (input.active_form)
            it->second.active_form = input.active_form;
        return;
    }

    case tools::TaskEffect::ReplaceAll:
    {
        // No parsed list means nothing is known; keep the table as is
        if (!activity.result.task_list)
            return;
        tasks_.clear();
        for (const auto& task : *activity.result.task_list)
            if (task.status != TaskStatus::Deleted)
                tasks_[task.id] = task;
        return;
    }
    }
}

void Session::notify_changed()
{
    if (change_callback_)
        change_callback_();
}

// ============================================================================
// Persistence
// ============================================================================

SessionSnapshot Session::snapshot() const
{
    SessionSnapshot snapshot;
    snapshot.id = id_;
    snapshot.name = name_;
    snapshot.created_at = created_at_;
    snapshot.settings = settings_;
    snapshot.messages = messages_;
    snapshot.session_id = session_id_;
    snapshot.total_cost = total_cost_;
    snapshot.last_usage = last_usage_;
    for (const auto& [id, task] : tasks_)
        snapshot.tasks.push_back(task);
    return snapshot;
}

void Session::restore(const SessionSnapshot& snapshot)
{
    if (is_busy())
        client_->cancel();

    id_ = snapshot.id;
    name_ = snapshot.name;
    created_at_ = snapshot.created_at;
    settings_ = snapshot.settings;
    messages_ = snapshot.messages;
    session_id_ = snapshot.session_id;
    total_cost_ = snapshot.total_cost;
    last_usage_ = snapshot.last_usage;
    tasks_.clear();
    for (const auto& task : snapshot.tasks)
        tasks_[task.id] = task;

    std::error_code ec;
    if (!settings_.working_directory.empty() &&
        !std::filesystem::is_directory(settings_.working_directory, ec))
    {
        logger_->warning("Working directory " + settings_.working_directory +
                         " no longer exists, using $HOME");
        settings_.working_directory = home_directory();
    }

    responding_ = false;
    compacting_ = false;
    buffer_.clear();
    needs_new_assistant_ = false;
    permissions_.clear();
}

} // namespace strata
