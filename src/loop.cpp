#include "loop.hpp"

namespace beam {

void Loop::Run() {
    while (true)
    {
        Task task;

        {
            std::unique_lock<std::mutex> lock(Mutex_);
            Cv_.wait(lock, [this]{
                return !TaskQueue_.empty() || Stopped_;
            });
            if (TaskQueue_.empty()) {
                return;
            }
            task = std::move(TaskQueue_.front());
            TaskQueue_.pop();
        }
        task();
    }
}

void Loop::Stop() {
    {
        std::lock_guard<std::mutex> lock(Mutex_);
        Stopped_ = true;
    }

    Cv_.notify_all();
}

size_t Loop::RunPending() {
    std::queue<Task> batch;
    {
        std::lock_guard<std::mutex> lock(Mutex_);
        std::swap(batch, TaskQueue_);
    }

    size_t count = batch.size();
    while (!batch.empty()) {
        batch.front()();
        batch.pop();
    }
    return count;
}

void Loop::EnqueueTask(Task&& task) {
    {
        std::lock_guard<std::mutex> lock(Mutex_);
        TaskQueue_.push(std::move(task));
    }

    Cv_.notify_one();
}

} //namespace beam
