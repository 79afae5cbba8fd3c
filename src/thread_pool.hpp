#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

// Fixed-size worker pool. submit() queues a task; wait() blocks until every
// queued task has finished and rethrows the first exception a task raised
// since the previous wait().
class ThreadPool {
public:
    explicit ThreadPool(int n_threads)
    {
        if (n_threads < 1) n_threads = 1;
        workers.reserve(static_cast<std::size_t>(n_threads));
        for (int i = 0; i < n_threads; ++i)
            workers.emplace_back([this] { worker_loop(); });
    }

    ThreadPool(const ThreadPool&)            = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    ~ThreadPool()
    {
        {
            std::lock_guard<std::mutex> lock(mtx);
            stopping = true;
        }
        cv_task.notify_all();
        for (auto& t : workers) t.join();
    }

    int size() const { return static_cast<int>(workers.size()); }

    void submit(std::function<void()> f)
    {
        {
            std::lock_guard<std::mutex> lock(mtx);
            ++pending;
            tasks.push_back(std::move(f));
        }
        cv_task.notify_one();
    }

    void wait()
    {
        std::unique_lock<std::mutex> lock(mtx);
        cv_done.wait(lock, [this] { return pending == 0; });
        if (first_error) {
            std::exception_ptr e = first_error;
            first_error = nullptr;
            std::rethrow_exception(e);
        }
    }

private:
    void worker_loop()
    {
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(mtx);
                cv_task.wait(lock, [this] { return !tasks.empty() || stopping; });
                if (stopping && tasks.empty()) return;
                task = std::move(tasks.front());
                tasks.pop_front();
            }

            std::exception_ptr error;
            try {
                task();
            } catch (...) {
                error = std::current_exception();
            }

            std::lock_guard<std::mutex> lock(mtx);
            if (error && !first_error) first_error = error;
            if (--pending == 0) cv_done.notify_all();
        }
    }

    std::vector<std::thread>          workers;
    std::deque<std::function<void()>> tasks;
    std::mutex                        mtx;
    std::condition_variable           cv_task;
    std::condition_variable           cv_done;
    std::exception_ptr                first_error;
    int                               pending  = 0;
    bool                              stopping = false;
};
