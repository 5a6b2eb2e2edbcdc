#pragma once

#include <string>
#include "InitiativeTypes.h"
#include "RankingConfigurationException.h"

namespace ebitdascope
{
namespace initiatives
{

/**
 * @brief Divisors of the ranking score.
 *
 * score = impactMid * confidence / (riskMultiplier(risk) * timeMultiplier(weeks))
 *
 * Passed by value into InitiativeRanker; never read from global state.
 */
struct RankingConfiguration
{
    double riskMultiplierLow = 1.0;
    double riskMultiplierMed = 1.2;
    double riskMultiplierHigh = 1.5;
    double timeMultiplierBase = 1.0;
    double timeMultiplierPerWeek = 0.01;

    /**
     * @throws RankingConfigurationException on a non-positive or non-finite
     * risk multiplier, or a negative or non-finite time term
     */
    void validate() const;

    double riskMultiplier(RiskLevel level) const;

    double timeMultiplier(unsigned int timeToValueWeeks) const
    {
        return timeMultiplierBase + static_cast<double>(timeToValueWeeks) * timeMultiplierPerWeek;
    }
};

/**
 * @brief Loads RankingConfiguration from JSON.
 *
 * Recognised keys: risk_multiplier_low, risk_multiplier_med,
 * risk_multiplier_high, time_multiplier_base, time_multiplier_per_week.
 * Missing keys keep their defaults; unknown keys are ignored.
 */
class RankingConfigurationReader
{
public:
    /**
     * @throws RankingConfigurationException if the file cannot be read, is not
     * a JSON object, holds a non-numeric value for a recognised key, or fails
     * validation
     */
    static RankingConfiguration readFile(const std::string& filePath);

    static RankingConfiguration readString(const std::string& json);
};

} // namespace initiatives
} // namespace ebitdascope
