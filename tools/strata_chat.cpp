/**
 * strata_chat.cpp - interactive terminal front end for a bridge session
 *
 * Reads prompts from stdin and streams the transcript to stdout. Lines
 * starting with '/' are commands:
 *
 *   /allow, /deny        answer the pending permission request
 *   /cancel              stop the current response
 *   /compact [focus]     summarise the conversation
 *   /tasks               show the task list
 *   /save <file>         write a session snapshot
 *   /load <file>         restore a session snapshot
 *   /cwd <dir>           change the working directory
 *   /quit
 *
 * Options: --cwd <dir>, --model <id>, --mode <permission mode>,
 *          --node <path>, --bridge <script>, --verbose
 */

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <strata/strata.hpp>
#include <string>

using namespace strata;

namespace
{

namespace Color
{
const char* RESET = "\033[0m";
const char* DIM = "\033[2m";
const char* RED = "\033[31m";
const char* GREEN = "\033[32m";
const char* YELLOW = "\033[33m";
const char* CYAN = "\033[36m";
const char* BOLD = "\033[1m";
} // namespace Color

// Prints transcript changes as they happen
class TranscriptPrinter
{
  public:
    explicit TranscriptPrinter(const Session& session) : session_(session) {}

    void refresh()
    {
        const auto& messages = session_.messages();
        if (messages.size() < next_)
        {
            // A trailing empty placeholder was dropped
            next_ = messages.size();
            streamed_ = 0;
        }

        // Continue the assistant message currently being streamed
        if (next_ > 0)
            stream(messages[next_ - 1]);

        for (; next_ < messages.size(); ++next_)
        {
            if (streamed_ > 0)
                std::cout << "\n";
            streamed_ = 0;

            const auto& msg = messages[next_];
            if (msg.role == Role::Assistant)
                stream(msg);
            else
                print_other(msg);
        }
    }

  private:
    void print_other(const ChatMessage& msg)
    {
        switch (msg.role)
        {
        case Role::User:
            break;
        case Role::System:
            std::cout << Color::YELLOW << "[" << msg.text << "]" << Color::RESET << "\n";
            break;
        case Role::Tool:
        {
            std::cout << Color::CYAN << "  ⚙ " << msg.text << Color::RESET;
            if (msg.tool_activity)
                if (auto detail = tools::detail_summary(*msg.tool_activity))
                    std::cout << Color::DIM << " (" << *detail << ")" << Color::RESET;
            std::cout << "\n";
            break;
        }
        case Role::Assistant:
            break;
        }
    }

    void stream(const ChatMessage& msg)
    {
        if (msg.role != Role::Assistant || msg.text.size() <= streamed_)
            return;
        if (streamed_ == 0)
            std::cout << Color::BOLD << "assistant> " << Color::RESET;
        std::cout << msg.text.substr(streamed_) << std::flush;
        streamed_ = msg.text.size();
    }

    const Session& session_;
    // Index of the first message not yet shown
    std::size_t next_ = 0;
    // Characters already shown of the assistant message at next_ - 1
    std::size_t streamed_ = 0;
};

void print_tasks(const Session& session)
{
    if (session.tasks().empty())
    {
        std::cout << "(no tasks)\n";
        return;
    }
    for (const auto& [id, task] : session.tasks())
    {
        const char* mark = task.status == TaskStatus::Completed    ? "[x]"
                           : task.status == TaskStatus::InProgress ? "[~]"
                                                                   : "[ ]";
        std::cout << "  " << mark << " #" << id << " " << task.subject << "\n";
    }
}

void print_usage(const Session& session)
{
    if (const auto& usage = session.last_usage())
    {
        std::cout << Color::DIM << "  " << usage->total_input_tokens() << " in / "
                  << usage->output_tokens << " out, $" << session.total_cost() << ", "
                  << usage->duration_ms << " ms" << Color::RESET << "\n";
    }
}

bool save_snapshot(const Session& session, const std::string& path)
{
    std::ofstream out(path);
    if (!out)
        return false;
    out << json(session.snapshot()).dump(2) << "\n";
    return static_cast<bool>(out);
}

void load_snapshot(Session& session, const std::string& path)
{
    std::ifstream in(path);
    if (!in)
        throw StrataError("Cannot open " + path);
    json j;
    try
    {
        in >> j;
    }
    catch (const json::parse_error& e)
    {
        throw JSONDecodeError(e.what());
    }
    session.restore(j.get<SessionSnapshot>());
}

} // namespace

int main(int argc, char** argv)
{
    BridgeOptions options;
    SessionSettings settings;
    bool verbose = false;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        auto next = [&]() -> std::string
        {
            if (i + 1 >= argc)
            {
                std::cerr << "Missing value for " << arg << "\n";
                std::exit(2);
            }
            return argv[++i];
        };

        if (arg == "--cwd")
            settings.working_directory = next();
        else if (arg == "--model")
            settings.model = next();
        else if (arg == "--mode")
            settings.permission_mode = next();
        else if (arg == "--node")
            options.interpreter_path = next();
        else if (arg == "--bridge")
            options.bridge_script_path = next();
        else if (arg == "--verbose")
            verbose = true;
        else if (arg == "--version")
        {
            std::cout << "strata-chat " << version_string() << "\n";
            return 0;
        }
        else
        {
            std::cerr << "Unknown option: " << arg << "\n";
            return 2;
        }
    }

    if (verbose)
    {
        options.log_callback = [](LogLevel level, const std::string& message)
        {
            std::cerr << Color::DIM << "[" << log_level_name(level) << "] " << message
                      << Color::RESET << "\n";
        };
    }

    SerialQueue queue;
    Session session(queue, options, settings);
    TranscriptPrinter printer(session);

    std::cout << Color::BOLD << "strata-chat " << version_string() << Color::RESET << " in "
              << session.working_directory() << "\n";

    std::string line;
    while (true)
    {
        std::cout << Color::GREEN << "you> " << Color::RESET << std::flush;
        if (!std::getline(std::cin, line))
            break;
        if (line.empty())
            continue;

        if (line[0] == '/')
        {
            std::istringstream cmd(line.substr(1));
            std::string name;
            cmd >> name;
            std::string rest;
            std::getline(cmd >> std::ws, rest);

            try
            {
                if (name == "quit" || name == "exit")
                    break;
                else if (name == "tasks")
                    print_tasks(session);
                else if (name == "save")
                    std::cout << (save_snapshot(session, rest) ? "saved\n" : "save failed\n");
                else if (name == "load")
                {
                    load_snapshot(session, rest);
                    std::cout << "restored " << session.messages().size() << " messages\n";
                }
                else if (name == "cwd")
                {
                    SessionSettings updated = session.settings();
                    updated.working_directory = rest;
                    session.set_settings(updated);
                }
                else if (name == "compact")
                {
                    if (!session.compact(rest.empty() ? std::nullopt
                                                      : std::optional<std::string>(rest)))
                        std::cout << "nothing to compact\n";
                }
                else
                    std::cout << "unknown command /" << name << "\n";
            }
            catch (const StrataError& e)
            {
                std::cerr << Color::RED << "Error: " << e.what() << Color::RESET << "\n";
            }

            if (name != "compact")
                continue;
        }
        else if (!session.send(line))
        {
            std::cout << "busy\n";
            continue;
        }

        // Pump events until the turn ends, answering permissions inline
        while (true)
        {
            queue.run_until([&] { return !session.is_busy() || session.pending_permission(); },
                            std::chrono::milliseconds(100));
            printer.refresh();

            if (auto request = session.pending_permission())
            {
                std::cout << "\n"
                          << Color::YELLOW << "Allow " << request->display_description();
                if (request->is_outside_working_directory())
                    std::cout << Color::RED << " (outside working directory)";
                std::cout << Color::YELLOW << "? [y/N] " << Color::RESET << std::flush;
                std::string answer;
                if (!std::getline(std::cin, answer))
                {
                    session.cancel();
                    break;
                }
                session.respond_to_permission(answer == "y" || answer == "Y" || answer == "yes");
                continue;
            }

            if (!session.is_busy())
                break;
        }
        queue.run_pending();
        printer.refresh();
        std::cout << "\n";
        print_usage(session);
    }

    return 0;
}
