/**
 * @file worker_pool.cpp
 * @brief WorkerPool implementation.
 * @author Dimitris Kafetzis
 */

#include "executor/worker_pool.hpp"

#include <pthread.h>

namespace exec_engine {

WorkerPool::WorkerPool(size_t num_threads, std::string name)
    : size_(num_threads), name_(std::move(name)) {
    if (size_ == 0) {
        size_ = std::thread::hardware_concurrency();
        if (size_ == 0) size_ = 4;  // fallback
    }
}

WorkerPool::~WorkerPool() {
    join();
}

bool WorkerPool::start(Body body) {
    if (!workers_.empty() || stop_requested_.load()) return false;

    body_ = std::move(body);
    workers_.reserve(size_);
    for (size_t i = 0; i < size_; ++i) {
        running_.fetch_add(1);
        workers_.emplace_back([this, i](std::stop_token stop) {
            // Linux caps thread names at 15 characters.
            auto thread_name = (name_ + "-" + std::to_string(i)).substr(0, 15);
            ::pthread_setname_np(::pthread_self(), thread_name.c_str());

            body_(stop, i);
            running_.fetch_sub(1);
        });
    }
    return true;
}

void WorkerPool::request_stop() {
    stop_requested_.store(true);
    for (auto& worker : workers_) {
        worker.request_stop();
    }
}

void WorkerPool::join() {
    request_stop();
    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
}

}  // namespace exec_engine
