#include "AnalysisPipeline.h"
#include "ParallelExecutors.h"
#include <spdlog/spdlog.h>

namespace ebitdascope
{
namespace initiatives
{

AnalysisResult AnalysisPipeline::run(const InputSnapshot& snapshot,
                                     const std::vector<InitiativeHypothesis>& hypotheses,
                                     const CompanyContext& context,
                                     const RankingConfiguration& rankingConfig,
                                     concurrency::IParallelExecutor& executor) const
{
    // Fail fast on a bad configuration before anything is computed
    InitiativeRanker ranker(rankingConfig);

    CanonicalPnL pnl = PnLReconstructor().reconstruct(snapshot.glRows);
    DiagnosticsBundle diagnostics = DiagnosticsEngine(mDiagnosticsConfig).run(pnl, snapshot, executor);

    std::vector<SizedInitiative> sized = InitiativeSizer(mSizingConfig)
        .sizeAll(hypotheses, pnl, diagnostics, snapshot, context);
    std::vector<RankedInitiative> ranked = ranker.rank(sized);

    spdlog::info("Analysis complete: {} month(s), {} initiative(s) ranked", pnl.size(), ranked.size());
    return AnalysisResult(std::move(pnl), std::move(diagnostics), std::move(ranked));
}

AnalysisResult AnalysisPipeline::run(const InputSnapshot& snapshot,
                                     const std::vector<InitiativeHypothesis>& hypotheses,
                                     const CompanyContext& context,
                                     const RankingConfiguration& rankingConfig) const
{
    concurrency::SingleThreadExecutor executor;
    return run(snapshot, hypotheses, context, rankingConfig, executor);
}

} // namespace initiatives
} // namespace ebitdascope
