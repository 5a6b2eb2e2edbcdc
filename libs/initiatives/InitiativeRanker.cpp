#include "InitiativeRanker.h"
#include <algorithm>
#include <cmath>
#include <string>
#include <tuple>
#include <spdlog/spdlog.h>

namespace ebitdascope
{
namespace initiatives
{

InitiativeRanker::InitiativeRanker(const RankingConfiguration& config)
    : mConfig(config)
{
    mConfig.validate();
}

double InitiativeRanker::score(const SizedInitiative& initiative) const
{
    const double denominator = mConfig.riskMultiplier(initiative.riskLevel)
        * mConfig.timeMultiplier(initiative.timeToValueWeeks);
    if (!(denominator > 0.0))
        return 0.0;

    const double value = initiative.impactMid() * initiative.confidence / denominator;
    return std::isfinite(value) && value > 0.0 ? value : 0.0;
}

namespace
{
/**
 * @brief Total order over ranked entries.
 *
 * Score, impact midpoint and title decide in practice. The remaining keys
 * separate entries that share a title (repeated hypotheses), so the result
 * never depends on input order.
 */
struct RankOrder
{
    bool operator()(const RankedInitiative& lhs, const RankedInitiative& rhs) const
    {
        if (lhs.weightedScore != rhs.weightedScore)
            return lhs.weightedScore > rhs.weightedScore;

        const SizedInitiative& a = lhs.initiative;
        const SizedInitiative& b = rhs.initiative;
        if (a.impactMid() != b.impactMid())
            return a.impactMid() > b.impactMid();
        if (a.title() != b.title())
            return a.title() < b.title();

        const std::string categoryA = initiativeCategoryName(a.hypothesis.category);
        const std::string categoryB = initiativeCategoryName(b.hypothesis.category);
        if (categoryA != categoryB)
            return categoryA < categoryB;
        if (a.hypothesis.description != b.hypothesis.description)
            return a.hypothesis.description < b.hypothesis.description;

        return std::tie(a.impactLow, a.confidence, a.riskLevel, a.timeToValueWeeks,
                        a.implementationCostEstimate, a.needsData, a.assumptions, a.nextSteps)
            < std::tie(b.impactLow, b.confidence, b.riskLevel, b.timeToValueWeeks,
                       b.implementationCostEstimate, b.needsData, b.assumptions, b.nextSteps);
    }
};
} // namespace

std::vector<RankedInitiative> InitiativeRanker::rank(const std::vector<SizedInitiative>& initiatives) const
{
    std::vector<RankedInitiative> ranked;
    ranked.reserve(initiatives.size());
    for (const auto& initiative : initiatives)
        ranked.push_back(RankedInitiative{initiative, score(initiative), 0});

    std::sort(ranked.begin(), ranked.end(), RankOrder());

    unsigned int position = 0;
    for (auto& entry : ranked)
        entry.rank = ++position;

    spdlog::debug("InitiativeRanker: ranked {} initiative(s)", ranked.size());
    return ranked;
}

} // namespace initiatives
} // namespace ebitdascope
