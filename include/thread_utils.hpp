#ifndef THREAD_UTILS_HPP
#define THREAD_UTILS_HPP
#include <functional>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

/**
 * @brief RAII group of worker threads that are all joined on destruction.
 *
 * Used as a join point: callers spawn independent tasks and call join_all()
 * (or let the group go out of scope) before reading any task's result.
 */
class WorkerGroup {
    std::vector<std::thread> threads_;

  public:
    WorkerGroup() = default;
    WorkerGroup(const WorkerGroup&) = delete;
    WorkerGroup& operator=(const WorkerGroup&) = delete;
    WorkerGroup(WorkerGroup&&) = delete;
    WorkerGroup& operator=(WorkerGroup&&) = delete;
    ~WorkerGroup() { join_all(); }

    template <class Fn> void spawn(Fn&& fn) { threads_.emplace_back(std::forward<Fn>(fn)); }

    void join_all() {
        for (auto& t : threads_) {
            if (t.joinable())
                t.join();
        }
        threads_.clear();
    }

    std::size_t size() const noexcept { return threads_.size(); }
};

/**
 * @brief Spawn every task on @p group; once a thread cannot be created the
 * remaining tasks run on the calling thread.
 *
 * @return Number of tasks that ran on the calling thread.
 */
template <class Group>
std::size_t spawn_or_run(Group& group, const std::vector<std::function<void()>>& tasks) {
    std::size_t next = 0;
    try {
        for (; next < tasks.size(); ++next)
            group.spawn(tasks[next]);
        return 0;
    } catch (const std::system_error&) {
        std::size_t inline_count = tasks.size() - next;
        for (; next < tasks.size(); ++next)
            tasks[next]();
        return inline_count;
    }
}

#endif // THREAD_UTILS_HPP
