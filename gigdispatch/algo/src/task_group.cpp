#include <gigdispatch/algo/task_group.hpp>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace gigdispatch::algo {

namespace {

std::ptrdiff_t checked_slots(std::size_t max_parallel) {
    if (max_parallel == 0) {
        throw std::invalid_argument("TaskGroup needs at least one slot");
    }
    return static_cast<std::ptrdiff_t>(
        std::min(max_parallel, static_cast<std::size_t>(TaskGroup::MAX_PARALLEL)));
}

} // namespace

TaskGroup::TaskGroup(std::size_t max_parallel)
    : slots_(checked_slots(max_parallel)) {}

TaskGroup::~TaskGroup() {
    join_all();
}

void TaskGroup::spawn(std::function<void()> work) {
    slots_.acquire();
    try {
        if (!work) {
            throw std::invalid_argument("TaskGroup::spawn needs a callable");
        }
        threads_.emplace_back([this, work = std::move(work)] {
            try {
                work();
            } catch (...) {
                // Captured here, rethrown from wait()
                std::lock_guard lock(error_mutex_);
                if (!first_error_) {
                    first_error_ = std::current_exception();
                }
            }
            slots_.release();
        });
    } catch (...) {
        // Nothing was started; the slot goes back
        slots_.release();
        throw;
    }
    ++spawned_;
}

void TaskGroup::wait() {
    join_all();

    std::exception_ptr error;
    {
        std::lock_guard lock(error_mutex_);
        error = std::exchange(first_error_, nullptr);
    }
    if (error) {
        std::rethrow_exception(error);
    }
}

void TaskGroup::join_all() {
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
}

} // namespace gigdispatch::algo
