#include <Dataset/StoreCatalog.hpp>
#include <Pipeline/AnalysisPool.hpp>
#include <Pipeline/DayPipeline.hpp>
#include <Report/JsonSerializer.hpp>
#include <Report/StoreComparison.hpp>
#include <Report/StoreReport.hpp>
#include <RunLogger/RunLogger.hpp>
#include <TimeBase/TimeIndex.hpp>

#include <charconv>
#include <exception>
#include <iostream>
#include <string>
#include <string_view>

using namespace footfall;

namespace
{
    int usage(const char *argv0)
    {
        std::cerr << "usage: " << argv0 << " <data_folder> [output_folder] [worker_count]\n";
        return 2;
    }
} // namespace

int main(int argc, char **argv)
{
    if (argc > 4)
        return usage(argv[0]);

    const std::filesystem::path dataFolder = argc > 1 ? argv[1] : "Data";

    report::CacheConfig cacheCfg;
    if (argc > 2)
        cacheCfg.outputFolder = argv[2];

    pipeline::PoolConfig poolCfg;
    if (argc > 3)
    {
        const std::string_view arg = argv[3];
        std::size_t workers = 0;
        auto [ptr, ec] = std::from_chars(arg.data(), arg.data() + arg.size(), workers);
        if (ec != std::errc{} || ptr != arg.data() + arg.size() || workers == 0)
        {
            std::cerr << "[Main] Invalid worker count: " << arg << "\n";
            return usage(argv[0]);
        }
        poolCfg.workerCount = workers;
    }

    auto catalog = dataset::StoreCatalog::scan(dataFolder);
    if (!catalog)
        return 1;
    if (catalog->stores().empty())
    {
        std::cerr << "[Main] No store folders found in " << dataFolder.string() << "\n";
        return 1;
    }

    std::cout << "[Main] Detected " << catalog->stores().size() << " store(s):";
    for (const auto &s : catalog->stores())
        std::cout << " " << s.name << "(" << s.dates.size() << " days)";
    std::cout << "\n";

    // Configs
    pipeline::PipelineConfig pipelineCfg;
    pipelineCfg.stitcher.fastMode = false;

    logging::LoggerConfig logCfg;
    logCfg.outputPath = (cacheCfg.outputFolder / "analysis_run.log").string();

    try
    {
        std::filesystem::create_directories(cacheCfg.outputFolder);

        report::StoreReportBuilder reports;
        report::StoreComparisonBuilder comparisons;
        pipeline::DayPipeline dayPipeline(pipelineCfg);
        pipeline::AnalysisPool pool(dayPipeline, poolCfg);
        logging::RunLogger runLogger(logCfg, pool);

        pool.subscribe([&reports, &comparisons](const pipeline::DayResult &r)
                       {
                           reports.add(r);
                           comparisons.add(r);
                       });
        pool.subscribe([](const pipeline::RunEvent &e)
                       {
                           if (e.type == pipeline::RunEventType::DayCompleted)
                               std::cout << "[Main] " << e.store << " " << e.date << " done (" << e.description << ")\n";
                       });
        runLogger.start();

        const dataset::StoreCatalog &stores = *catalog;
        for (const auto &store : stores.stores())
        {
            if (!store.has_wards)
            {
                std::cerr << "[Main] Skipping " << store.name << ": no " << dataset::StoreCatalog::WardFile << "\n";
                continue;
            }

            for (const auto &date : store.dates)
            {
                pipeline::AnalysisJob job;
                job.store = store.name;
                job.date = date;
                job.load = [&stores, name = store.name, date]() -> std::optional<pipeline::StoreDay>
                {
                    dataset::LoadReport wardReport;
                    auto wards = stores.loadWards(name, wardReport);
                    if (!wards || wards->empty())
                        return std::nullopt;

                    dataset::LoadReport dayReport;
                    auto detections = stores.loadDay(name, date, dayReport);
                    if (!detections)
                        return std::nullopt;
                    if (dayReport.rows_skipped > 0)
                        std::cerr << "[Dataset] " << name << " " << timebase::formatDate(date) << ": skipped "
                                  << dayReport.rows_skipped << " of " << dayReport.rows_read << " rows ("
                                  << dayReport.first_skip_reason << ")\n";

                    return pipeline::StoreDay{name, date, std::move(*wards), std::move(*detections)};
                };
                pool.submit(std::move(job));
            }
        }

        pool.start();
        pool.waitIdle();
        pool.stop();
        runLogger.stop();

        std::cout << "[Main] Days analyzed: " << pool.completedCount()
                  << ", skipped: " << pool.skippedCount()
                  << ", failed: " << pool.failedCount() << "\n";

        if (!report::writeCache(cacheCfg, reports.build()))
            return 1;
        if (!report::writeComparison(cacheCfg, comparisons.build()))
            return 1;
    }
    catch (const std::exception &e)
    {
        std::cerr << "[Main] " << e.what() << "\n";
        return 1;
    }

    return 0;
}
