#include "app/main_loop.hpp"

#include <exception>
#include <iostream>
#include <utility>

// Destructor. Queued tasks that never ran are dropped
MainLoop::~MainLoop() { quit(); }

void MainLoop::post(Task task) {
    if (!task) return;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
}

void MainLoop::run(const Task& afterEach) {
    while (!quit_.load()) {
        Task task;
        if (!takeTask(task, std::chrono::milliseconds(250))) continue;
        invoke(task);
        if (afterEach) afterEach();
    }
}

bool MainLoop::runOnce(std::chrono::milliseconds timeout) {
    Task task;
    if (!takeTask(task, timeout)) return false;
    invoke(task);
    return true;
}

size_t MainLoop::drain() {
    size_t count = 0;
    while (runOnce(std::chrono::milliseconds(0))) ++count;
    return count;
}

void MainLoop::quit() {
    quit_.store(true);
    cv_.notify_all();
}

bool MainLoop::takeTask(Task& out, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [&] { return !tasks_.empty() || quit_.load(); });
    if (tasks_.empty() || quit_.load()) return false;

    out = std::move(tasks_.front());
    tasks_.pop_front();
    return true;
}

// A throwing task is logged and the loop keeps going
void MainLoop::invoke(Task& task) {
    try {
        task();
    } catch (const std::exception& e) {
        std::cerr << "[Main Loop] [ERROR] Task threw: " << e.what() << std::endl;
    }
}
