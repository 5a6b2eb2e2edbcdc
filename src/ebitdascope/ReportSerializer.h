#pragma once

#include <string>
#include <rapidjson/document.h>
#include "AnalysisPipeline.h"
#include "InitiativeTypes.h"

namespace ebitdascope
{

/**
 * @brief Renders an analysis run as pretty-printed JSON.
 *
 * The document carries no timestamps or other run-dependent values, and
 * every collection is emitted in the engine's deterministic order, so
 * identical inputs give byte-identical reports.
 */
class ReportSerializer
{
public:
    static std::string toJson(const initiatives::AnalysisResult& result,
                              const initiatives::CompanyContext& context);

    /**
     * @return false if the file could not be written
     */
    static bool saveToFile(const initiatives::AnalysisResult& result,
                           const initiatives::CompanyContext& context,
                           const std::string& filePath);

private:
    using Allocator = rapidjson::Document::AllocatorType;

    static rapidjson::Value serializePnL(const CanonicalPnL& pnl, Allocator& allocator);
    static rapidjson::Value serializeDiagnostics(const DiagnosticsBundle& bundle, Allocator& allocator);
    static rapidjson::Value serializeOutliers(const OutlierReport& outliers, Allocator& allocator);
    static rapidjson::Value serializeCompleteness(const CompletenessReport& report, Allocator& allocator);
    static rapidjson::Value serializeInitiative(const initiatives::RankedInitiative& ranked,
                                                Allocator& allocator);
};

} // namespace ebitdascope
