#pragma once

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <vector>
#include "IParallelExecutor.h"

/**
 * @file ParallelExecutors.h
 * @brief Executor policies for the independent diagnostic stages.
 *
 * The stages write only to their own result slots, so the policy affects
 * wall-clock time and never the results.
 */
namespace ebitdascope
{
namespace concurrency
{
    /**
     * @brief Runs each task inline on the calling thread.
     *
     * The returned future is already satisfied. Default for analysis runs.
     */
    class SingleThreadExecutor : public IParallelExecutor
    {
    public:
        std::future<void> submit(std::function<void()> task) override
        {
            std::packaged_task<void()> packaged(std::move(task));
            std::future<void> result = packaged.get_future();
            packaged();
            return result;
        }
    };

    /**
     * @brief Fixed pool of worker threads fed from a FIFO queue.
     *
     * A thread count of 0 means one thread per hardware thread, and never
     * fewer than 2. The destructor finishes every queued task before joining.
     */
    class ThreadPoolExecutor : public IParallelExecutor
    {
    public:
        explicit ThreadPoolExecutor(std::size_t threads = 0)
        {
            if (threads == 0)
                threads = std::max<std::size_t>(2, std::thread::hardware_concurrency());

            mWorkers.reserve(threads);
            try
            {
                for (std::size_t i = 0; i < threads; ++i)
                    mWorkers.emplace_back([this] { drainQueue(); });
            }
            catch (const std::system_error&)
            {
                shutdown();
                throw;
            }
        }

        ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
        ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;

        ~ThreadPoolExecutor() override
        {
            shutdown();
        }

        std::size_t numThreads() const
        {
            return mWorkers.size();
        }

        std::future<void> submit(std::function<void()> task) override
        {
            auto packaged = std::make_shared<std::packaged_task<void()>>(std::move(task));
            std::future<void> result = packaged->get_future();
            {
                std::lock_guard<std::mutex> lock(mQueueMutex);
                if (mStopping)
                    throw std::runtime_error("ThreadPoolExecutor: submit after shutdown");
                mQueue.emplace_back([packaged] { (*packaged)(); });
            }
            mQueueReady.notify_one();
            return result;
        }

    private:
        void drainQueue()
        {
            for (;;)
            {
                std::function<void()> next;
                {
                    std::unique_lock<std::mutex> lock(mQueueMutex);
                    mQueueReady.wait(lock, [this] { return mStopping || !mQueue.empty(); });
                    if (mQueue.empty())
                        return;
                    next = std::move(mQueue.front());
                    mQueue.pop_front();
                }
                next();
            }
        }

        void shutdown()
        {
            {
                std::lock_guard<std::mutex> lock(mQueueMutex);
                mStopping = true;
            }
            mQueueReady.notify_all();
            for (auto& worker : mWorkers)
            {
                if (worker.joinable())
                    worker.join();
            }
        }

        std::vector<std::thread> mWorkers;
        std::deque<std::function<void()>> mQueue;
        std::mutex mQueueMutex;
        std::condition_variable mQueueReady;
        bool mStopping = false;
    };

    /**
     * @brief Inline executor for serial runs, a hardware-sized pool otherwise.
     */
    inline std::unique_ptr<IParallelExecutor> makeExecutor(bool parallel, std::size_t threads = 0)
    {
        if (!parallel)
            return std::make_unique<SingleThreadExecutor>();

        return std::make_unique<ThreadPoolExecutor>(threads);
    }

} // namespace concurrency
} // namespace ebitdascope
