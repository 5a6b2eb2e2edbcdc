#pragma once

#include <exception>
#include <functional>
#include <future>
#include <vector>

namespace ebitdascope
{
namespace concurrency
{
    /**
     * @brief Runs independent units of work and hands back a future per unit.
     *
     * Implementations decide where the work runs; callers only see futures.
     */
    class IParallelExecutor
    {
    public:
        virtual ~IParallelExecutor() = default;

        virtual std::future<void> submit(std::function<void()> task) = 0;

        // Waits on every future in submission order. The first stored
        // exception is rethrown only after all futures have been drained.
        virtual void waitAll(std::vector<std::future<void>>& futures)
        {
            std::exception_ptr firstFailure;
            for (auto& future : futures)
            {
                try
                {
                    future.get();
                }
                catch (const std::exception&)
                {
                    if (!firstFailure)
                        firstFailure = std::current_exception();
                }
            }

            if (firstFailure)
                std::rethrow_exception(firstFailure);
        }
    };

} // namespace concurrency
} // namespace ebitdascope
