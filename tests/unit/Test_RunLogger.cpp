#include <catch2/catch_test_macros.hpp>
#include <RunLogger/RunLogger.hpp>
#include <Pipeline/AnalysisPool.hpp>
#include <TimeBase/TimeIndex.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <thread>

using namespace footfall;

namespace
{
    pipeline::AnalysisJob dayJob(const std::string &store, const std::string &date)
    {
        pipeline::AnalysisJob job;
        job.store = store;
        job.date = timebase::parseDate(date);
        job.load = [store, date]() -> std::optional<pipeline::StoreDay>
        {
            pipeline::StoreDay day;
            day.store = store;
            day.date = timebase::parseDate(date);
            WardConfig w;
            w.id = "S1";
            day.wards.push_back(w);
            day.detections.push_back({12, "S1", "aa", device::iPhone, -65.0});
            return day;
        };
        return job;
    }

    std::string readAll(const std::filesystem::path &path)
    {
        std::ifstream in(path);
        return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }
} // namespace

TEST_CASE("RunLogger writes day results and run events", "[RunLogger]")
{
    pipeline::DayPipeline dayPipeline;
    pipeline::PoolConfig poolCfg;
    poolCfg.workerCount = 2;
    pipeline::AnalysisPool pool(dayPipeline, poolCfg);

    auto tempPath = std::filesystem::temp_directory_path() /
                    ("footfall_runlog_enabled_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + ".log");

    logging::LoggerConfig cfg;
    cfg.outputPath = tempPath.string();
    logging::RunLogger logger(cfg, pool);

    logger.start();
    REQUIRE(logger.isOpen());

    pipeline::AnalysisJob broken;
    broken.store = "Store_X";
    broken.date = timebase::parseDate("2025-11-12");
    broken.load = []() -> std::optional<pipeline::StoreDay>
    { throw std::runtime_error("unreadable"); };

    pool.submit(dayJob("Store_A", "2025-11-10"));
    pool.submit(std::move(broken));
    pool.start();
    pool.waitIdle();
    pool.stop();
    logger.stop();
    REQUIRE_FALSE(logger.isOpen());

    const auto contents = readAll(tempPath);
    REQUIRE(contents.find("[DayResult] store=Store_A date=2025-11-10 identifiers=1 journeys=1") != std::string::npos);
    REQUIRE(contents.find("[RunEvent] type=DayStarted store=Store_A") != std::string::npos);
    REQUIRE(contents.find("[RunEvent] type=DayCompleted store=Store_A date=2025-11-10 desc=journeys=1") != std::string::npos);
    REQUIRE(contents.find("[RunEvent] type=JobFailed store=Store_X date=2025-11-12 desc=unreadable") != std::string::npos);

    std::filesystem::remove(tempPath);
}

TEST_CASE("RunLogger respects disabled logging flags", "[RunLogger]")
{
    pipeline::DayPipeline dayPipeline;
    pipeline::PoolConfig poolCfg;
    poolCfg.workerCount = 1;
    pipeline::AnalysisPool pool(dayPipeline, poolCfg);

    auto tempPath = std::filesystem::temp_directory_path() /
                    ("footfall_runlog_disabled_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + ".log");

    logging::LoggerConfig cfg;
    cfg.outputPath = tempPath.string();
    cfg.logDayResults = false;
    cfg.logRunEvents = false;
    logging::RunLogger logger(cfg, pool);

    logger.start();
    pool.submit(dayJob("Store_A", "2025-11-10"));
    pool.start();
    pool.waitIdle();
    pool.stop();
    logger.stop();

    REQUIRE(pool.completedCount() == 1);
    REQUIRE(readAll(tempPath).empty());

    std::filesystem::remove(tempPath);
}

TEST_CASE("RunLogger can start while the pool is delivering", "[RunLogger]")
{
    pipeline::DayPipeline dayPipeline;
    pipeline::PoolConfig poolCfg;
    poolCfg.workerCount = 4;
    pipeline::AnalysisPool pool(dayPipeline, poolCfg);

    // keep the delivery lock busy while the logger subscribes
    pool.subscribe([](const pipeline::RunEvent &)
                   { std::this_thread::sleep_for(std::chrono::milliseconds(1)); });

    for (int d = 10; d < 30; ++d)
        pool.submit(dayJob("Store_A", "2025-11-" + std::to_string(d)));
    pool.start();

    auto tempPath = std::filesystem::temp_directory_path() /
                    ("footfall_runlog_late_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + ".log");

    logging::LoggerConfig cfg;
    cfg.outputPath = tempPath.string();
    logging::RunLogger logger(cfg, pool);

    logger.start();
    REQUIRE(logger.isOpen());

    pool.waitIdle();
    pool.stop();
    logger.stop();

    REQUIRE(pool.completedCount() == 20);
    std::filesystem::remove(tempPath);
}

TEST_CASE("RunLogger line formats", "[RunLogger]")
{
    pipeline::DayResult r;
    r.store = "Store_A";
    r.date = timebase::parseDate("2025-11-15");
    r.conversion.total_traffic = 3;
    r.conversion.visit_count = 1;
    r.conversion.conversion_rate = 1.0 / 3.0;

    REQUIRE(logging::RunLogger::formatDayResult(r) ==
            "[DayResult] store=Store_A date=2025-11-15 identifiers=0 journeys=0 traffic=3 visits=1 conversion=0.333");

    pipeline::RunEvent e;
    e.type = pipeline::RunEventType::DaySkipped;
    e.store = "Store_B";
    e.date = "2025-11-15";
    e.description = "no usable input";
    REQUIRE(logging::RunLogger::formatRunEvent(e) ==
            "[RunEvent] type=DaySkipped store=Store_B date=2025-11-15 desc=no usable input");
}

TEST_CASE("RunLogger without a writable file stays closed", "[RunLogger]")
{
    pipeline::DayPipeline dayPipeline;
    pipeline::AnalysisPool pool(dayPipeline);

    logging::LoggerConfig cfg;
    cfg.outputPath = (std::filesystem::temp_directory_path() / "footfall_missing_dir_x9" / "run.log").string();
    logging::RunLogger logger(cfg, pool);

    logger.start();
    REQUIRE_FALSE(logger.isOpen());
    logger.stop();
}
