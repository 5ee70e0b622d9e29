#include "pcimport/utils/cooperative_scheduler.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <iterator>
#include <utility>
#include <vector>

namespace pcimport {

void CooperativeScheduler::Post(std::string name, Task task) {
    if (!task)
        return;
    std::lock_guard<std::mutex> lock(mutex_);
    tasks_.push_back({std::move(name), std::move(task)});
}

size_t CooperativeScheduler::RunPending(size_t max_tasks) {
    if (running_ || max_tasks == 0)
        return 0;

    std::vector<NamedTask> batch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t take = std::min(max_tasks, tasks_.size());
        batch.reserve(take);
        for (size_t i = 0; i < take; ++i) {
            batch.push_back(std::move(tasks_.front()));
            tasks_.pop_front();
        }
    }

    running_ = true;
    for (size_t i = 0; i < batch.size(); ++i) {
        auto& named = batch[i];
        try {
            named.task();
        } catch (const std::exception& e) {
            ++failed_count_;
            std::cerr << "task " << named.name << " failed: " << e.what() << std::endl;
        } catch (...) {
            running_ = false;
            // put the tasks that did not run back in front, in their order
            std::lock_guard<std::mutex> lock(mutex_);
            tasks_.insert(tasks_.begin(), std::make_move_iterator(batch.begin() + static_cast<std::ptrdiff_t>(i) + 1),
                          std::make_move_iterator(batch.end()));
            throw;
        }
    }
    running_ = false;
    return batch.size();
}

std::function<void()> CooperativeScheduler::Yielder() {
    return [this]() {
        ++yield_count_;
        // a task yielding from inside RunPending must not re-enter it
        if (running_)
            return;
        RunPending(kMaxTasksPerTick);
    };
}

size_t CooperativeScheduler::Pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

}  // namespace pcimport
