#include "kiln/worker_pool.hpp"

#include <algorithm>

namespace kiln {

WorkerPool::WorkerPool(size_t workers) {
    workers = std::max<size_t>(workers, 1);
    threads_.reserve(workers);
    for (size_t i = 0; i < workers; ++i) {
        threads_.emplace_back([this] { run(); });
    }
}

WorkerPool::~WorkerPool() {
    queue_.shutdown();
    for (auto& t : threads_) {
        if (t.joinable()) {
            t.join();
        }
    }
}

void WorkerPool::run() {
    while (auto task = queue_.pop()) {
        (*task)();
    }
}

} // namespace kiln
