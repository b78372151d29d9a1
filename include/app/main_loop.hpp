#ifndef MAIN_LOOP_HPP
#define MAIN_LOOP_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>

// The UI-bound execution context. Any thread may post() a task; tasks run one
// at a time, in posting order, on whichever thread drives run() or runOnce().
class MainLoop {
public:
    using Task = std::function<void()>;

    MainLoop() = default;
    ~MainLoop();

    MainLoop(const MainLoop&) = delete;
    MainLoop& operator=(const MainLoop&) = delete;

    void post(Task task);

    // Runs tasks until quit() is called. afterEach runs after every task.
    void run(const Task& afterEach = {});

    // Runs at most one task, waiting up to timeout for it. Returns false if
    // nothing ran.
    bool runOnce(std::chrono::milliseconds timeout);

    // Runs every task already queued, and any they post in turn.
    size_t drain();

    void quit();
    bool quitting() const { return quit_.load(); }

private:
    bool takeTask(Task& out, std::chrono::milliseconds timeout);
    void invoke(Task& task);

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> tasks_;
    std::atomic<bool> quit_{false};
};

#endif
