#ifndef PIIGUARD_UTIL_THREAD_POOL_HPP
#define PIIGUARD_UTIL_THREAD_POOL_HPP

#include <vector>
#include <functional>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>
#include <exception>
#include <algorithm>
#include <cstddef>

/**
 * @file thread_pool.hpp
 * @brief Indexed fan-out over a fixed set of worker threads.
 *
 * The scanners only ever need "run fn(0..n-1), give me the results in index order",
 * so that is the whole interface. One batch runs at a time; the calling thread
 * works on the batch too, so a pool of one worker still gets two threads.
 *
 * Usage Example:
 *  @code
 *    piiguard::util::ThreadPool pool(4);
 *    std::vector<std::vector<Span>> perRule = pool.map<std::vector<Span>>(
 *        rules.size(), [&](size_t i) { return scanRule(text, *rules[i]); });
 *  @endcode
 */

namespace piiguard {
namespace util {

class ThreadPool
{
public:
    /**
     * @param threadCount Number of worker threads. Zero selects hardware concurrency.
     */
    explicit ThreadPool(size_t threadCount = 0)
    {
        if (threadCount == 0) {
            threadCount = std::max<size_t>(1, std::thread::hardware_concurrency());
        }
        workers_.reserve(threadCount);
        for (size_t i = 0; i < threadCount; ++i) {
            workers_.emplace_back([this] { workerLoop(); });
        }
    }

    ~ThreadPool()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_ = true;
        }
        wakeup_.notify_all();
        for (auto &worker : workers_) {
            worker.join();
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    size_t size() const { return workers_.size(); }

    /**
     * @brief Evaluate fn(i) for every i in [0, count) across the pool.
     * @return The results, indexed like the inputs.
     * @throw the exception of the lowest index that threw, after every index has run.
     */
    template<typename R>
    std::vector<R> map(size_t count, const std::function<R(size_t)> &fn)
    {
        std::vector<R> results(count);
        std::vector<std::exception_ptr> errors(count);

        Batch batch;
        batch.count = count;
        batch.remaining = count;
        batch.run = [&](size_t i) {
            try {
                results[i] = fn(i);
            } catch (...) {
                errors[i] = std::current_exception();
            }
        };

        std::lock_guard<std::mutex> serial(batchMutex_);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            batch_ = &batch;
            ++generation_;
        }
        wakeup_.notify_all();

        drain(batch);

        {
            std::unique_lock<std::mutex> lock(mutex_);
            done_.wait(lock, [&] { return batch.remaining == 0 && active_ == 0; });
            batch_ = nullptr;
        }

        for (const std::exception_ptr &error : errors) {
            if (error) {
                std::rethrow_exception(error);
            }
        }
        return results;
    }

private:
    struct Batch
    {
        std::function<void(size_t)> run;
        size_t count = 0;
        std::atomic<size_t> next{0};
        size_t remaining = 0; // guarded by mutex_
    };

    void drain(Batch &batch)
    {
        for (size_t i = batch.next++; i < batch.count; i = batch.next++) {
            batch.run(i);
            std::lock_guard<std::mutex> lock(mutex_);
            if (--batch.remaining == 0) {
                done_.notify_all();
            }
        }
    }

    void workerLoop()
    {
        size_t seen = 0;
        while (true) {
            Batch *batch = nullptr;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                wakeup_.wait(lock, [&] {
                    return stop_ || (batch_ != nullptr && generation_ != seen);
                });
                if (stop_) {
                    return;
                }
                seen = generation_;
                batch = batch_;
                ++active_;
            }

            drain(*batch);

            std::lock_guard<std::mutex> lock(mutex_);
            --active_;
            done_.notify_all();
        }
    }

    std::vector<std::thread> workers_;
    std::mutex batchMutex_;
    std::mutex mutex_;
    std::condition_variable wakeup_;
    std::condition_variable done_;
    Batch *batch_ = nullptr;
    size_t generation_ = 0;
    size_t active_ = 0;
    bool stop_ = false;
};

} // namespace util
} // namespace piiguard

#endif // PIIGUARD_UTIL_THREAD_POOL_HPP
