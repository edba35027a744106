#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <type_traits>

namespace beam {

using Task = std::function<void()>;

// Serialises work coming from library threads onto the thread that calls
// Run(). Everything owned by a Loop is only touched from inside its tasks.
class Loop {
public:
    void EnqueueTask(Task&& task);

    // Runs tasks until Stop() is called and the queue has drained.
    void Run();
    void Stop();

    // Runs whatever is queued right now without blocking. Returns the number
    // of tasks executed.
    size_t RunPending();

    template <typename F>
    auto Call(F&& fn) -> std::future<std::invoke_result_t<F>> {
        using Result = std::invoke_result_t<F>;
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(fn));
        auto future = task->get_future();
        EnqueueTask([task] { (*task)(); });
        return future;
    }

private:
    std::mutex Mutex_;
    std::condition_variable Cv_;
    std::queue<Task> TaskQueue_;
    bool Stopped_ = false;
};

} // namespace beam
