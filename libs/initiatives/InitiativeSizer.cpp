#include "InitiativeSizer.h"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace ebitdascope
{
namespace initiatives
{

template <typename Strategy>
SizingEstimate InitiativeSizer::sizeWith(const Strategy& strategy, const SizingInputs& inputs,
                                         bool& needsData) const
{
    if (auto est = strategy.estimate(inputs, mConfig))
    {
        needsData = false;
        return *est;
    }

    needsData = true;
    return fallback(inputs, Strategy::nominalRisk, Strategy::nominalWeeks,
                    Strategy::nominalConfidence, Strategy::requiredData);
}

SizingEstimate InitiativeSizer::fallback(const SizingInputs& inputs, RiskLevel risk, unsigned int weeks,
                                         double nominalConfidence, const char* requiredData) const
{
    SizingEstimate est;
    est.riskLevel = risk;
    est.timeToValueWeeks = weeks;
    est.confidence = mConfig.confidenceFloor
        + mConfig.fallbackConfidencePull * (nominalConfidence - mConfig.confidenceFloor);

    if (auto generic = GenericSizing().estimate(inputs, mConfig))
    {
        const double mid = (generic->impactLow + generic->impactHigh) / 2.0;
        const double halfWidth = (generic->impactHigh - generic->impactLow) / 2.0
            * std::max(1.5, mConfig.fallbackWidening);

        est.impactLow = std::max(0.0, mid - halfWidth);
        est.impactHigh = mid + halfWidth;
        est.implementationCost = generic->implementationCost;
        est.assumptions = generic->assumptions;
        est.assumptions.push_back("Band widened for missing " + std::string(requiredData) + " data");
    }
    else
    {
        est.assumptions.push_back("No revenue available to scale the estimate");
    }

    est.nextSteps.push_back("Provide " + std::string(requiredData) + " data to refine this estimate");
    return est;
}

bool InitiativeSizer::applyHistoryLimit(const SizingInputs& inputs, SizingEstimate& est) const
{
    // the general ledger bounds every estimate, whatever dataset it was built from
    const std::size_t glMonths = inputs.diagnostics.getCompleteness().totalMonths;
    const std::size_t months = std::min(est.monthsOfHistory, glMonths);
    if (months >= mConfig.minHistoryMonths)
        return false;

    est.confidence = mConfig.confidenceFloor
        + mConfig.fallbackConfidencePull * (est.confidence - mConfig.confidenceFloor);
    est.assumptions.push_back("Annualized from only " + std::to_string(months) + " month(s) of history");
    est.nextSteps.push_back("Provide at least " + std::to_string(mConfig.minHistoryMonths)
                            + " months of history to refine this estimate");

    spdlog::debug("InitiativeSizer: estimate rests on {} month(s), confidence lowered to {:.3f}",
                  months, est.confidence);
    return true;
}

double InitiativeSizer::roundToUnit(double value) const
{
    if (!std::isfinite(value) || value < 0.0)
        return 0.0;
    if (mConfig.roundingUnit <= 0.0)
        return value;

    return std::round(value / mConfig.roundingUnit) * mConfig.roundingUnit;
}

SizedInitiative InitiativeSizer::size(const InitiativeHypothesis& hypothesis,
                                      const SizingInputs& inputs,
                                      const CompanyContext& context) const
{
    bool needsData = false;
    SizingEstimate est = std::visit(
        [&](const auto& strategy) { return sizeWith(strategy, inputs, needsData); },
        strategyFor(hypothesis));

    if (!needsData)
        needsData = applyHistoryLimit(inputs, est);

    SizedInitiative sized;
    sized.hypothesis = hypothesis;
    sized.impactLow = roundToUnit(est.impactLow);
    sized.impactHigh = std::max(sized.impactLow, roundToUnit(est.impactHigh));
    sized.implementationCostEstimate = roundToUnit(est.implementationCost);
    sized.timeToValueWeeks = std::max(1u, est.timeToValueWeeks);
    sized.riskLevel = est.riskLevel;
    sized.confidence = std::isfinite(est.confidence)
        ? std::clamp(est.confidence, mConfig.confidenceFloor, mConfig.confidenceCeiling)
        : mConfig.confidenceFloor;
    sized.needsData = needsData;
    sized.assumptions = std::move(est.assumptions);
    sized.nextSteps = std::move(est.nextSteps);

    if (!context.companyName.empty())
        sized.assumptions.push_back("Company: " + context.companyName);
    if (!context.industry.empty())
        sized.assumptions.push_back("Industry context: " + context.industry);
    if (!context.notes.empty())
        sized.assumptions.push_back("Context notes: " + context.notes);

    if (needsData)
        spdlog::debug("InitiativeSizer: '{}' ({}) sized with fallback band", hypothesis.title,
                      initiativeCategoryName(hypothesis.category));

    return sized;
}

SizedInitiative InitiativeSizer::size(const InitiativeHypothesis& hypothesis,
                                      const CanonicalPnL& pnl,
                                      const DiagnosticsBundle& diagnostics,
                                      const InputSnapshot& snapshot,
                                      const CompanyContext& context) const
{
    const SizingInputs inputs{pnl, diagnostics, snapshot.payroll, snapshot.vendors, snapshot.segments};
    return size(hypothesis, inputs, context);
}

std::vector<SizedInitiative> InitiativeSizer::sizeAll(const std::vector<InitiativeHypothesis>& hypotheses,
                                                      const CanonicalPnL& pnl,
                                                      const DiagnosticsBundle& diagnostics,
                                                      const InputSnapshot& snapshot,
                                                      const CompanyContext& context) const
{
    const SizingInputs inputs{pnl, diagnostics, snapshot.payroll, snapshot.vendors, snapshot.segments};

    std::vector<SizedInitiative> sized;
    sized.reserve(hypotheses.size());
    for (const auto& hypothesis : hypotheses)
        sized.push_back(size(hypothesis, inputs, context));

    return sized;
}

} // namespace initiatives
} // namespace ebitdascope
