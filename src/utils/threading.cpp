#include "utils/threading.h"

namespace codemend {
namespace utils {

ThreadPool::ThreadPool(size_t threads)
    : stop_(false), numThreads_(threads) {
    if (numThreads_ == 0) numThreads_ = 4;

    for (size_t i = 0; i < numThreads_; i++) {
        workers_.emplace_back([this] { workerLoop(); });
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::workerLoop() {
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            condition_.wait(lock, [this] {
                return stop_ || !tasks_.empty();
            });

            if (stop_ && tasks_.empty()) return;

            task = std::move(tasks_.front());
            tasks_.pop();
        }

        task();
    }
}

void ThreadPool::shutdown() {
    {
        std::unique_lock<std::mutex> lock(queueMutex_);
        stop_ = true;
    }
    condition_.notify_all();
    for (std::thread& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

CancellationToken::CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

void CancellationToken::cancel() {
    flag_->store(true);
}

bool CancellationToken::isCancelled() const {
    return flag_->load();
}

void CancellationToken::reset() {
    flag_->store(false);
}

}
}
