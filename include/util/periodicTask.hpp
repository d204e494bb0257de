#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace csw {

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * PeriodicTask
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Runs a callable on its own thread every interval until stopped. stop()
 *    wakes the thread immediately instead of waiting out the interval, and
 *    joins it. The body always runs to completion, a tick is never cut short.
 *
 *    The destructor stops the task, so a PeriodicTask member is torn down
 *    before the state its body touches.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
class PeriodicTask {
public:
    PeriodicTask(std::string               name,
                 std::chrono::milliseconds interval,
                 std::function<void()>     body);
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&)            = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    /*
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * start
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * Description:
     * -> Spawns the thread. If run_now is set the body runs once right away,
     *    otherwise the first run is one interval out. Calling start on a
     *    running task does nothing.
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     */
    void start(bool run_now=false);

    //blocks until the thread has exited
    void stop();

    bool running() const { return running_.load(); }

private:
    void loop(bool run_now);

    std::string               name_;
    std::chrono::milliseconds interval_;
    std::function<void()>     body_;

    std::atomic<bool>         running_ = false;
    bool                      stop_requested_ = false;
    std::mutex                mtx_;
    std::condition_variable   cv_;
    std::thread               thread_;
};

} //csw
