#include "TaskManager.hpp"
#include <iostream>

TaskManager::~TaskManager() {
    shutdown();
}

void TaskManager::initialize(size_t thread_count) {
    if (!workers_.empty()) {
        return; // 已经初始化
    }

    if (thread_count == 0) {
        thread_count = 1;
    }

    stop_ = false;
    active_threads_ = 0;

    // 创建工作线程
    for (size_t i = 0; i < thread_count; ++i) {
        workers_.emplace_back(&TaskManager::workerThread, this);
    }

    std::cout << "✅ 工作线程池已初始化，线程数: " << thread_count << std::endl;
}

bool TaskManager::addTask(Task task) {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        if (stop_ || workers_.empty()) {
            return false;
        }
        tasks_.push(std::move(task));
    }

    condition_.notify_one();
    return true;
}

void TaskManager::shutdown() {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        if (stop_ || workers_.empty()) {
            return; // 已经关闭
        }
        stop_ = true;
    }

    condition_.notify_all();

    // 等待所有线程完成
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    workers_.clear();
    std::cout << "✅ 工作线程池已关闭" << std::endl;
}

size_t TaskManager::getPendingTaskCount() const {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    return tasks_.size();
}

size_t TaskManager::getActiveThreadCount() const {
    return active_threads_;
}

size_t TaskManager::getFailedTaskCount() const {
    return failed_tasks_;
}

void TaskManager::workerThread() {
    while (true) {
        Task task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);

            condition_.wait(lock, [this] {
                return stop_ || !tasks_.empty();
            });

            if (stop_ && tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
        }

        active_threads_++;
        if (!executeTask(task)) {
            failed_tasks_++;
        }
        active_threads_--;
    }
}

bool TaskManager::executeTask(const Task& task) {
    if (!task.job) {
        return false;
    }

    try {
        task.job();
        return true;
    }
    catch (const std::exception& e) {
        std::cerr << "❌ 任务执行异常 (" << task.id << "): " << e.what() << std::endl;
    }
    catch (...) {
        std::cerr << "❌ 任务执行异常 (" << task.id << "): 未知错误" << std::endl;
    }
    return false;
}
