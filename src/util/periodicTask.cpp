#include "util/periodicTask.hpp"

#include <iostream>

namespace csw {

PeriodicTask::PeriodicTask(std::string               name,
                           std::chrono::milliseconds interval,
                           std::function<void()>     body)
    :
    name_     (std::move(name)),
    interval_ (interval),
    body_     (std::move(body)) {}

PeriodicTask::~PeriodicTask() {
    stop();
}

void PeriodicTask::start(bool run_now) {
    if (running_.exchange(true))
        return;

    {
        std::lock_guard<std::mutex> lock(mtx_);
        stop_requested_ = false;
    }
    thread_ = std::thread(&PeriodicTask::loop, this, run_now);
}

void PeriodicTask::stop() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        stop_requested_ = true;
    }
    cv_.notify_all();

    if (thread_.joinable())
        thread_.join();
    running_ = false;
}

void PeriodicTask::loop(bool run_now) {
    if (run_now)
        body_();

    while (true) {
        std::unique_lock<std::mutex> lock(mtx_);
        if (cv_.wait_for(lock, interval_, [this] { return stop_requested_; }))
            break;
        lock.unlock();

        body_();
    }

    std::cout << "[" << name_ << "] Stopped." << std::endl;
}

} //csw
