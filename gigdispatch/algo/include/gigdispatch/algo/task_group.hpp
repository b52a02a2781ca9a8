#pragma once

#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <semaphore>
#include <thread>
#include <vector>

namespace gigdispatch::algo {

/// @brief Bounded structured fan-out.
///
/// spawn() starts each unit of work on its own thread once one of the
/// @c max_parallel slots is free, blocking the caller otherwise. wait() joins
/// every spawned unit and rethrows the first exception any of them raised.
/// The destructor joins as well, so no unit ever outlives the group.
///
/// @code
/// TaskGroup group(4);
/// for (auto& item : items) {
///     group.spawn([&item] { process(item); });
/// }
/// group.wait();
/// @endcode
///
/// @ingroup algo
class TaskGroup {
public:
    static constexpr std::ptrdiff_t MAX_PARALLEL = 1024;

    /// @param max_parallel Number of units allowed to run at once (at least 1,
    ///                     at most MAX_PARALLEL).
    explicit TaskGroup(std::size_t max_parallel);
    ~TaskGroup();

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;
    TaskGroup(TaskGroup&&) = delete;
    TaskGroup& operator=(TaskGroup&&) = delete;

    /// @brief Run @p work on a new thread once a slot is available.
    /// @throws std::invalid_argument if @p work is empty.
    /// @throws std::system_error if no thread could be started. The slot is
    ///         given back and nothing was spawned.
    void spawn(std::function<void()> work);

    /// @brief Join all spawned units.
    /// @throws The first exception raised by a unit, if any.
    void wait();

    /// @brief Number of units spawned since construction.
    [[nodiscard]] std::size_t spawned() const noexcept { return spawned_; }

private:
    void join_all();

    std::counting_semaphore<MAX_PARALLEL> slots_;
    std::vector<std::jthread> threads_;
    std::mutex error_mutex_;
    std::exception_ptr first_error_;
    std::size_t spawned_{0};
};

} // namespace gigdispatch::algo
