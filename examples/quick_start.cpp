#include <chrono>
#include <iostream>
#include <strata/strata.hpp>
#include <vector>

// Sends a few prompts through one session, auto-approving tool permissions,
// and prints each answer with its cost.

int main()
{
    std::cout << "strata version: " << strata::version_string() << "\n\n";

    strata::SessionSettings settings;
    settings.permission_mode = "bypassPermissions";

    strata::SerialQueue queue;
    strata::Session session(queue, strata::BridgeOptions{}, settings);

    std::vector<std::string> prompts = {"What is 2+2? Be very brief.",
                                        "Now multiply that by 10. Just the number."};

    for (const auto& prompt : prompts)
    {
        std::cout << "> " << prompt << "\n";
        auto start = std::chrono::steady_clock::now();

        if (!session.send(prompt))
        {
            std::cerr << "Session is busy\n";
            return 1;
        }

        while (session.is_busy())
        {
            queue.run_until([&] { return !session.is_busy() || session.pending_permission(); },
                            std::chrono::seconds(120));
            if (session.pending_permission())
                session.respond_to_permission(true);
            else if (session.is_busy())
            {
                std::cerr << "Timed out waiting for a response\n";
                session.cancel();
                return 1;
            }
        }

        const auto& last = session.messages().back();
        if (last.role == strata::Role::System)
        {
            // Launch failures and backend errors land in the transcript
            std::cerr << last.text << "\n";
            return 1;
        }

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        std::cout << last.text << "\n";
        std::cout << "  (" << elapsed.count() << " ms, total $" << session.total_cost() << ")\n\n";
    }

    return 0;
}
