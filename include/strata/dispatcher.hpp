#ifndef STRATA_DISPATCHER_HPP
#define STRATA_DISPATCHER_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <map>
#include <mutex>

namespace strata
{

/**
 * Serial execution context.
 *
 * Everything that touches session state runs through one Dispatcher. Work
 * may be posted from any thread; it runs on the dispatcher's owning thread
 * in FIFO order.
 */
class Dispatcher
{
  public:
    using Work = std::function<void()>;

    virtual ~Dispatcher() = default;

    virtual void post(Work work) = 0;

    // Run work no earlier than delay from now
    virtual void post_after(std::chrono::milliseconds delay, Work work) = 0;
};

/**
 * Dispatcher drained explicitly by its owner (a UI loop, the chat tool, a
 * test). Exceptions thrown by work propagate out of the run_* call.
 */
class SerialQueue : public Dispatcher
{
  public:
    void post(Work work) override;
    void post_after(std::chrono::milliseconds delay, Work work) override;

    // Run everything that is due now; returns the number of items run
    std::size_t run_pending();

    // Keep running work as it becomes due until timeout elapses
    std::size_t run_for(std::chrono::milliseconds timeout);

    // Run work until predicate() holds or timeout elapses; returns predicate()
    bool run_until(const std::function<bool()>& predicate, std::chrono::milliseconds timeout);

    // Items queued, delayed ones included
    std::size_t pending() const;

  private:
    using TimePoint = std::chrono::steady_clock::time_point;

    // Move due delayed work to the ready queue; caller holds mutex_
    void promote_due(TimePoint now);
    bool pop_ready(Work& work);
    bool drain(const std::function<bool()>& predicate, std::chrono::milliseconds timeout,
               std::size_t& count);

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Work> ready_;
    std::multimap<TimePoint, Work> delayed_;
};

} // namespace strata

#endif // STRATA_DISPATCHER_HPP
