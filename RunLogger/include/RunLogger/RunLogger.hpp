#pragma once

#include <Pipeline/AnalysisPool.hpp>

#include <fstream>
#include <mutex>
#include <string>

namespace footfall::logging
{
    struct LoggerConfig
    {
        std::string outputPath;
        bool logDayResults = true;
        bool logRunEvents = true;
    };

    // Appends one text line per pool event to outputPath.
    class RunLogger
    {
    public:
        RunLogger(const LoggerConfig &config,
                  pipeline::AnalysisPool &pool);

        // Subscribes to the pool. Safe while the pool is already delivering; events
        // delivered before the subscription are not logged.
        void start();
        void stop();

        [[nodiscard]] bool isOpen() const { return m_file.is_open(); }

        static std::string formatDayResult(const pipeline::DayResult &r);
        static std::string formatRunEvent(const pipeline::RunEvent &e);

    private:
        void handleDayResult(const pipeline::DayResult &r);
        void handleRunEvent(const pipeline::RunEvent &e);

    private:
        LoggerConfig m_config;
        pipeline::AnalysisPool &m_pool;

        std::ofstream m_file;
        std::mutex m_mutex;

        bool m_running = false;
        bool m_subscribed = false;
    };
} // namespace footfall::logging
