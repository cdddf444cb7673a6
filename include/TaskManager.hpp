#ifndef TASK_MANAGER_HPP
#define TASK_MANAGER_HPP

#include <queue>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <vector>
#include <functional>
#include <atomic>
#include <string>

// 队列中的任务
struct Task
{
    std::string id;            // 用于日志
    std::function<void()> job; // 任务体，抛出的异常会被记录
};

// 固定大小的工作线程池，OAuthServer 用它处理已接受的连接
class TaskManager
{
public:
    TaskManager() = default;
    ~TaskManager();

    // 禁用拷贝构造和赋值
    TaskManager(const TaskManager &) = delete;
    TaskManager &operator=(const TaskManager &) = delete;

    // 启动工作线程
    void initialize(size_t thread_count = 4);

    // 添加任务；线程池已关闭时返回 false
    bool addTask(Task task);

    // 处理完队列中剩余任务后关闭
    void shutdown();

    // 获取当前任务数量
    size_t getPendingTaskCount() const;

    // 获取活跃线程数
    size_t getActiveThreadCount() const;

    // 执行失败（抛出异常）的任务数
    size_t getFailedTaskCount() const;

    bool isRunning() const { return !workers_.empty() && !stop_; }

private:
    // 工作线程函数
    void workerThread();

    // 执行单个任务，返回是否成功
    bool executeTask(const Task &task);

    // 线程池
    std::vector<std::thread> workers_;

    // 任务队列
    std::queue<Task> tasks_;

    // 同步原语
    mutable std::mutex queue_mutex_;
    std::condition_variable condition_;

    // 状态标志
    std::atomic<bool> stop_{false};
    std::atomic<size_t> active_threads_{0};
    std::atomic<size_t> failed_tasks_{0};
};

#endif // TASK_MANAGER_HPP
