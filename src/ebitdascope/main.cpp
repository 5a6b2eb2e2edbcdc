#include <iostream>
#include <string>
#include <vector>
#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>
#include "AnalysisPipeline.h"
#include "HypothesisReader.h"
#include "LedgerCsvReaders.h"
#include "ParallelExecutors.h"
#include "RankingConfiguration.h"
#include "ReportSerializer.h"

namespace po = boost::program_options;
using namespace ebitdascope;

void printUsage(const po::options_description& desc)
{
    std::cout << "EbitdaScope - P&L diagnostics and initiative ranking\n\n";
    std::cout << "Usage: ebitdascope --gl <file> [options]\n\n";
    std::cout << desc << std::endl;

    std::cout << "\nExamples:\n";
    std::cout << "  # Diagnostics only\n";
    std::cout << "  ebitdascope --gl gl.csv --output report.json\n\n";
    std::cout << "  # Full run with optional datasets and hypotheses\n";
    std::cout << "  ebitdascope --gl gl.csv --payroll payroll.csv --vendors vendors.csv \\\n";
    std::cout << "              --segments segments.csv --hypotheses hypotheses.json \\\n";
    std::cout << "              --ranking-config ranking.json --industry SaaS --parallel\n";
}

InputSnapshot loadSnapshot(const po::variables_map& vm)
{
    InputSnapshot snapshot;

    GLCsvReader glReader(vm["gl"].as<std::string>());
    glReader.readFile();
    snapshot.glRows = glReader.getRows();
    spdlog::info("Read {} GL row(s) from {}", snapshot.glRows.size(), glReader.getFileName());

    if (vm.count("payroll"))
    {
        PayrollCsvReader reader(vm["payroll"].as<std::string>());
        reader.readFile();
        snapshot.payroll = reader.getRecords();
        spdlog::info("Read {} payroll record(s) from {}", snapshot.payroll.size(), reader.getFileName());
    }

    if (vm.count("vendors"))
    {
        VendorCsvReader reader(vm["vendors"].as<std::string>());
        reader.readFile();
        snapshot.vendors = reader.getRecords();
        spdlog::info("Read {} vendor record(s) from {}", snapshot.vendors.size(), reader.getFileName());
    }

    if (vm.count("segments"))
    {
        SegmentCsvReader reader(vm["segments"].as<std::string>());
        reader.readFile();
        snapshot.segments = reader.getRecords();
        spdlog::info("Read {} segment record(s) from {}", snapshot.segments.size(), reader.getFileName());
    }

    return snapshot;
}

int main(int argc, char* argv[])
{
    try
    {
        po::options_description desc("Options");
        desc.add_options()
            ("help,h", "Show help message")
            ("gl", po::value<std::string>(), "General ledger CSV (month, revenue, cogs, opex_*)")
            ("payroll", po::value<std::string>(), "Payroll CSV (month, function, headcount, fully_loaded_cost)")
            ("vendors", po::value<std::string>(), "Vendor spend CSV (month, vendor, category, amount)")
            ("segments", po::value<std::string>(), "Segment revenue CSV (month, segment, revenue)")
            ("hypotheses", po::value<std::string>(), "Initiative hypotheses JSON")
            ("ranking-config", po::value<std::string>(), "Ranking configuration JSON")
            ("company", po::value<std::string>()->default_value(""), "Company name for the report")
            ("industry", po::value<std::string>()->default_value(""), "Industry context")
            ("notes", po::value<std::string>()->default_value(""), "Free-text company notes")
            ("output,o", po::value<std::string>()->default_value("ebitdascope_report.json"), "Report output file")
            ("parallel,p", "Run diagnostics stages on a thread pool")
            ("verbose,v", "Verbose output");

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);

        if (vm.count("help"))
        {
            printUsage(desc);
            return 0;
        }

        if (!vm.count("gl"))
        {
            std::cerr << "Error: --gl is required\n\n";
            printUsage(desc);
            return 1;
        }

        if (vm.count("verbose"))
            spdlog::set_level(spdlog::level::debug);

        initiatives::RankingConfiguration rankingConfig;
        if (vm.count("ranking-config"))
            rankingConfig = initiatives::RankingConfigurationReader::readFile(vm["ranking-config"].as<std::string>());

        std::vector<initiatives::InitiativeHypothesis> hypotheses;
        if (vm.count("hypotheses"))
            hypotheses = initiatives::HypothesisReader::readFile(vm["hypotheses"].as<std::string>());

        initiatives::CompanyContext context;
        context.companyName = vm["company"].as<std::string>();
        context.industry = vm["industry"].as<std::string>();
        context.notes = vm["notes"].as<std::string>();

        InputSnapshot snapshot = loadSnapshot(vm);

        auto executor = concurrency::makeExecutor(vm.count("parallel") > 0);
        initiatives::AnalysisResult result = initiatives::AnalysisPipeline()
            .run(snapshot, hypotheses, context, rankingConfig, *executor);

        const std::string outputPath = vm["output"].as<std::string>();
        if (!ReportSerializer::saveToFile(result, context, outputPath))
            return 1;

        spdlog::info("Report written to {}", outputPath);
        return 0;
    }
    catch (const std::exception& e)
    {
        spdlog::error("{}", e.what());
        return 1;
    }
}
