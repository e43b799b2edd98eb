#include "tsg_lane_executor.hpp"

#include <chrono>

namespace tsg {

LaneExecutor::LaneExecutor(size_t num_lanes) {
    if (num_lanes == 0) {
        num_lanes = 1;
    }

    lanes_.reserve(num_lanes);
    for (size_t i = 0; i < num_lanes; ++i) {
        lanes_.push_back(std::make_unique<Lane>());
    }
    for (auto& lane : lanes_) {
        Lane* l = lane.get();
        l->worker = std::thread([this, l] { run_lane(*l); });
    }
}

LaneExecutor::~LaneExecutor() {
    shutdown();
}

void LaneExecutor::run_lane(Lane& lane) {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(lane.mtx);
            lane.cv.wait(lock, [this, &lane] {
                return stop_ || !lane.tasks.empty();
            });
            if (lane.tasks.empty()) {
                lane.idle_cv.notify_all();
                if (stop_) return;
                continue;
            }
            task = std::move(lane.tasks.front());
            lane.tasks.pop_front();
            lane.busy = true;
        }
        // packaged_task stores any exception in the future
        task();
        {
            std::lock_guard<std::mutex> lock(lane.mtx);
            lane.busy = false;
            if (lane.tasks.empty()) lane.idle_cv.notify_all();
        }
    }
}

size_t LaneExecutor::lane_for(const std::string& key) const noexcept {
    return std::hash<std::string>{}(key) % lanes_.size();
}

size_t LaneExecutor::pending_tasks() const noexcept {
    size_t n = 0;
    for (const auto& lane : lanes_) {
        std::lock_guard<std::mutex> lock(lane->mtx);
        n += lane->tasks.size() + (lane->busy ? 1 : 0);
    }
    return n;
}

bool LaneExecutor::drain(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    for (auto& lane : lanes_) {
        std::unique_lock<std::mutex> lock(lane->mtx);
        if (!lane->idle_cv.wait_until(lock, deadline, [&lane] {
                return lane->tasks.empty() && !lane->busy;
            })) {
            return false;
        }
    }
    return true;
}

void LaneExecutor::stop_and_join(bool discard) {
    std::lock_guard<std::mutex> guard(lifecycle_mtx_);
    if (joined_) return;

    for (auto& lane : lanes_) {
        std::lock_guard<std::mutex> lock(lane->mtx);
        stop_ = true;
        if (discard) lane->tasks.clear();
    }
    for (auto& lane : lanes_) {
        lane->cv.notify_all();
    }
    for (auto& lane : lanes_) {
        if (lane->worker.joinable()) {
            lane->worker.join();
        }
    }
    joined_ = true;
}

void LaneExecutor::shutdown() {
    stop_and_join(false);
}

void LaneExecutor::abort() {
    stop_and_join(true);
}

} // namespace tsg
