#pragma once

#include <vector>
#include <deque>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <atomic>
#include <memory>
#include <string>
#include <type_traits>
#include <stdexcept>

namespace tsg {

/**
 * @brief Fixed set of single-worker FIFO lanes selected by key hash
 *
 * All tasks submitted with the same key run on the same lane, one at a
 * time, in submission order. Different keys may run in parallel.
 * Used to keep per-identity detection ordered while spreading identities
 * across cores.
 */
class LaneExecutor {
public:
    explicit LaneExecutor(size_t num_lanes = std::thread::hardware_concurrency());
    ~LaneExecutor();

    LaneExecutor(const LaneExecutor&) = delete;
    LaneExecutor& operator=(const LaneExecutor&) = delete;

    /// Submit task on the lane owning @p key. Throws std::runtime_error after shutdown.
    template<class F>
    auto submit(const std::string& key, F&& f)
        -> std::future<std::invoke_result_t<F>>;

    /// Block until every lane is idle or @p timeout elapses. Returns true if idle.
    bool drain(std::chrono::milliseconds timeout);

    /// Stop accepting work, finish queued tasks, join workers.
    void shutdown();

    /// Stop accepting work and drop queued tasks (their futures get broken_promise).
    void abort();

    size_t lane_for(const std::string& key) const noexcept;
    size_t pending_tasks() const noexcept;
    size_t lane_count() const noexcept { return lanes_.size(); }
    bool is_running() const noexcept { return !stop_.load(); }

private:
    struct Lane {
        std::thread                       worker;
        std::deque<std::function<void()>> tasks;
        mutable std::mutex                mtx;
        std::condition_variable           cv;
        std::condition_variable           idle_cv;
        bool                              busy = false;
    };

    void run_lane(Lane& lane);
    void stop_and_join(bool discard);

    std::vector<std::unique_ptr<Lane>> lanes_;
    std::atomic<bool>                  stop_{false};
    std::mutex                         lifecycle_mtx_;
    bool                               joined_ = false;
};

template<class F>
auto LaneExecutor::submit(const std::string& key, F&& f)
    -> std::future<std::invoke_result_t<F>>
{
    using return_type = std::invoke_result_t<F>;

    auto task = std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(f));
    std::future<return_type> result = task->get_future();

    Lane& lane = *lanes_[lane_for(key)];
    {
        std::lock_guard<std::mutex> lock(lane.mtx);
        if (stop_) {
            throw std::runtime_error("submit on stopped LaneExecutor");
        }
        lane.tasks.emplace_back([task]() { (*task)(); });
    }
    lane.cv.notify_one();
    return result;
}

} // namespace tsg
