#include <strata/dispatcher.hpp>

namespace strata
{

void SerialQueue::post(Work work)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ready_.push_back(std::move(work));
    }
    cv_.notify_all();
}

void SerialQueue::post_after(std::chrono::milliseconds delay, Work work)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // Equal keys keep insertion order in a multimap
        delayed_.emplace(std::chrono::steady_clock::now() + delay, std::move(work));
    }
    cv_.notify_all();
}

void SerialQueue::promote_due(TimePoint now)
{
    auto end = delayed_.upper_bound(now);
    for (auto it = delayed_.begin(); it != end; ++it)
        ready_.push_back(std::move(it->second));
    delayed_.erase(delayed_.begin(), end);
}

bool SerialQueue::pop_ready(Work& work)
{
    std::lock_guard<std::mutex> lock(mutex_);
    promote_due(std::chrono::steady_clock::now());
    if (ready_.empty())
        return false;
    work = std::move(ready_.front());
    ready_.pop_front();
    return true;
}

std::size_t SerialQueue::run_pending()
{
    std::size_t count = 0;
    Work work;
    while (pop_ready(work))
    {
        work();
        ++count;
    }
    return count;
}

std::size_t SerialQueue::run_for(std::chrono::milliseconds timeout)
{
    std::size_t count = 0;
    drain([] { return false; }, timeout, count);
    return count;
}

bool SerialQueue::run_until(const std::function<bool()>& predicate,
                            std::chrono::milliseconds timeout)
{
    std::size_t count = 0;
    return drain(predicate, timeout, count);
}

bool SerialQueue::drain(const std::function<bool()>& predicate, std::chrono::milliseconds timeout,
                        std::size_t& count)
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true)
    {
        if (predicate())
            return true;

        Work work;
        if (pop_ready(work))
        {
            work();
            ++count;
            continue;
        }

        std::unique_lock<std::mutex> lock(mutex_);
        if (std::chrono::steady_clock::now() >= deadline)
            return false;

        auto wake = deadline;
        if (!delayed_.empty() && delayed_.begin()->first < wake)
            wake = delayed_.begin()->first;
        cv_.wait_until(lock, wake,
                       [this, wake]
                       {
                           return !ready_.empty() ||
                                  (!delayed_.empty() && delayed_.begin()->first < wake);
                       });
    }
}

std::size_t SerialQueue::pending() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return ready_.size() + delayed_.size();
}

} // namespace strata
