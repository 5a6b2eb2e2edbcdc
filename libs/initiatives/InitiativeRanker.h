#pragma once

#include <vector>
#include "InitiativeTypes.h"
#include "RankingConfiguration.h"

namespace ebitdascope
{
namespace initiatives
{

/**
 * @brief Orders sized initiatives by risk- and time-adjusted impact.
 *
 * Order is score descending, then impact mid-point descending, then title
 * ascending, so the result does not depend on input order. Ranks are dense
 * and start at 1.
 */
class InitiativeRanker
{
public:
    /**
     * @throws RankingConfigurationException if config fails validation
     */
    explicit InitiativeRanker(const RankingConfiguration& config = RankingConfiguration());

    std::vector<RankedInitiative> rank(const std::vector<SizedInitiative>& initiatives) const;

    // 0 when the denominator is not positive
    double score(const SizedInitiative& initiative) const;

    const RankingConfiguration& getConfig() const
    {
        return mConfig;
    }

private:
    RankingConfiguration mConfig;
};

} // namespace initiatives
} // namespace ebitdascope
