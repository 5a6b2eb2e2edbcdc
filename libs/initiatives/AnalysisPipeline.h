#pragma once

#include <utility>
#include <vector>
#include "DiagnosticsBundle.h"
#include "DiagnosticsEngine.h"
#include "IParallelExecutor.h"
#include "InitiativeRanker.h"
#include "InitiativeSizer.h"
#include "InitiativeTypes.h"
#include "InputRecords.h"
#include "PnLReconstructor.h"
#include "RankingConfiguration.h"

namespace ebitdascope
{
namespace initiatives
{

/**
 * @brief Everything one analysis run produces.
 */
class AnalysisResult
{
public:
    AnalysisResult(CanonicalPnL pnl, DiagnosticsBundle diagnostics, std::vector<RankedInitiative> ranked)
        : mPnL(std::move(pnl)),
          mDiagnostics(std::move(diagnostics)),
          mRanked(std::move(ranked))
    {
    }

    const CanonicalPnL& getPnL() const
    {
        return mPnL;
    }

    const DiagnosticsBundle& getDiagnostics() const
    {
        return mDiagnostics;
    }

    const std::vector<RankedInitiative>& getRankedInitiatives() const
    {
        return mRanked;
    }

private:
    CanonicalPnL mPnL;
    DiagnosticsBundle mDiagnostics;
    std::vector<RankedInitiative> mRanked;
};

/**
 * @brief Runs reconstruction, diagnostics, sizing and ranking over one
 * snapshot.
 *
 * The ranking configuration is validated before any other stage runs.
 */
class AnalysisPipeline
{
public:
    AnalysisPipeline(const DiagnosticsConfig& diagnosticsConfig = DiagnosticsConfig(),
                     const SizingConfig& sizingConfig = SizingConfig())
        : mDiagnosticsConfig(diagnosticsConfig),
          mSizingConfig(sizingConfig)
    {
    }

    /**
     * @throws DuplicateMonthException from reconstruction
     * @throws RankingConfigurationException if rankingConfig is invalid
     */
    AnalysisResult run(const InputSnapshot& snapshot,
                       const std::vector<InitiativeHypothesis>& hypotheses,
                       const CompanyContext& context,
                       const RankingConfiguration& rankingConfig,
                       concurrency::IParallelExecutor& executor) const;

    AnalysisResult run(const InputSnapshot& snapshot,
                       const std::vector<InitiativeHypothesis>& hypotheses,
                       const CompanyContext& context,
                       const RankingConfiguration& rankingConfig) const;

private:
    DiagnosticsConfig mDiagnosticsConfig;
    SizingConfig mSizingConfig;
};

} // namespace initiatives
} // namespace ebitdascope
