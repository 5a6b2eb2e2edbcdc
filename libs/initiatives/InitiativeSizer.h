#pragma once

#include <vector>
#include "DiagnosticsBundle.h"
#include "InitiativeTypes.h"
#include "InputRecords.h"
#include "PnLReconstructor.h"
#include "SizingStrategies.h"

namespace ebitdascope
{
namespace initiatives
{

/**
 * @brief Sizes hypotheses into annualized impact bands.
 *
 * Dispatch is through strategyFor(). A strategy that lacks its data is
 * replaced by the widened generic band with reduced confidence and needsData
 * set. An estimate annualized from fewer than minHistoryMonths months keeps
 * its band but gets the same confidence reduction and needsData. Sizing
 * never throws.
 */
class InitiativeSizer
{
public:
    explicit InitiativeSizer(const SizingConfig& config = SizingConfig())
        : mConfig(config)
    {
    }

    SizedInitiative size(const InitiativeHypothesis& hypothesis,
                         const SizingInputs& inputs,
                         const CompanyContext& context = CompanyContext()) const;

    SizedInitiative size(const InitiativeHypothesis& hypothesis,
                         const CanonicalPnL& pnl,
                         const DiagnosticsBundle& diagnostics,
                         const InputSnapshot& snapshot,
                         const CompanyContext& context = CompanyContext()) const;

    std::vector<SizedInitiative> sizeAll(const std::vector<InitiativeHypothesis>& hypotheses,
                                         const CanonicalPnL& pnl,
                                         const DiagnosticsBundle& diagnostics,
                                         const InputSnapshot& snapshot,
                                         const CompanyContext& context = CompanyContext()) const;

    const SizingConfig& getConfig() const
    {
        return mConfig;
    }

private:
    template <typename Strategy>
    SizingEstimate sizeWith(const Strategy& strategy, const SizingInputs& inputs, bool& needsData) const;

    SizingEstimate fallback(const SizingInputs& inputs, RiskLevel risk, unsigned int weeks,
                            double nominalConfidence, const char* requiredData) const;

    // Lowers confidence when the estimate rests on fewer than minHistoryMonths.
    // Returns true when it did.
    bool applyHistoryLimit(const SizingInputs& inputs, SizingEstimate& est) const;

    double roundToUnit(double value) const;

private:
    SizingConfig mConfig;
};

} // namespace initiatives
} // namespace ebitdascope
