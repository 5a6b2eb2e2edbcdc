#pragma once

#include <stdexcept>
#include <string>

namespace ebitdascope
{
namespace initiatives
{

class RankingConfigurationException : public std::runtime_error
{
public:
    explicit RankingConfigurationException(const std::string& msg)
        : std::runtime_error(msg)
    {
    }

    ~RankingConfigurationException() noexcept = default;
};

} // namespace initiatives
} // namespace ebitdascope
