#ifndef COOPERATIVE_SCHEDULER_HPP
#define COOPERATIVE_SCHEDULER_HPP

#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>

namespace pcimport {

// Single-threaded cooperative task queue. Any thread may Post(); tasks only
// run on the thread calling RunPending(), typically from inside a long import
// through the callback returned by Yielder().
class CooperativeScheduler {
   public:
    using Task = std::function<void()>;

    static constexpr size_t kMaxTasksPerTick = 128;

    CooperativeScheduler() = default;

    CooperativeScheduler(const CooperativeScheduler&) = delete;
    CooperativeScheduler& operator=(const CooperativeScheduler&) = delete;

    void Post(std::string name, Task task);

    // Runs at most max_tasks of the tasks queued before the call.
    size_t RunPending(size_t max_tasks = kMaxTasksPerTick);

    std::function<void()> Yielder();

    size_t Pending() const;

    size_t YieldCount() const { return yield_count_; }

    size_t FailedCount() const { return failed_count_; }

   private:
    struct NamedTask {
        std::string name;
        Task task;
    };

    mutable std::mutex mutex_;
    std::deque<NamedTask> tasks_;

    bool running_ = false;
    size_t yield_count_ = 0;
    size_t failed_count_ = 0;
};

}  // namespace pcimport

#endif
