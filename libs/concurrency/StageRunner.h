#pragma once

#include <exception>
#include <functional>
#include <future>
#include <stdexcept>
#include <string>
#include <vector>
#include "IParallelExecutor.h"

namespace ebitdascope
{
namespace concurrency
{
    class StageExecutionException : public std::runtime_error
    {
    public:
        StageExecutionException(const std::string& stageName, const std::string& msg)
            : std::runtime_error(stageName + ": " + msg),
              mStageName(stageName)
        {
        }

        const std::string& getStageName() const
        {
            return mStageName;
        }

    private:
        std::string mStageName;
    };

    /**
     * @brief A named unit of work. Each stage must write only to state it owns.
     */
    struct Stage
    {
        std::string name;
        std::function<void()> work;
    };

    /**
     * @brief Submits every stage to the executor and waits for all of them.
     *
     * Every stage runs to completion even when an earlier one fails. The
     * failure of the earliest-listed failing stage is then rethrown as a
     * StageExecutionException carrying that stage's name.
     */
    inline void runStages(IParallelExecutor& executor, const std::vector<Stage>& stages)
    {
        std::vector<std::future<void>> futures;
        futures.reserve(stages.size());
        for (const auto& stage : stages)
        {
            futures.push_back(executor.submit([name = stage.name, work = stage.work]() {
                try
                {
                    work();
                }
                catch (const std::exception& e)
                {
                    throw StageExecutionException(name, e.what());
                }
            }));
        }

        executor.waitAll(futures);
    }

} // namespace concurrency
} // namespace ebitdascope
