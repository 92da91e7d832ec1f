#include <RunLogger/RunLogger.hpp>
#include <TimeBase/TimeIndex.hpp>

#include <iomanip>
#include <iostream>
#include <sstream>

namespace footfall::logging
{
    RunLogger::RunLogger(const LoggerConfig &config, pipeline::AnalysisPool &pool) : m_config(config), m_pool(pool) {}

    void RunLogger::start()
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_running)
                return;

            m_file.open(m_config.outputPath, std::ios::out | std::ios::trunc);
            if (!m_file.is_open())
            {
                std::cerr << "[RunLogger] Cannot open " << m_config.outputPath << ", run log disabled\n";
                return;
            }
            m_running = true;

            // the pool has no unsubscribe; handlers check m_running instead
            if (m_subscribed)
                return;
            m_subscribed = true;
        }

        // outside m_mutex: delivery holds the pool's lock before it takes m_mutex
        if (m_config.logDayResults)
            m_pool.subscribe([this](const pipeline::DayResult &r)
                             { this->handleDayResult(r); });

        if (m_config.logRunEvents)
            m_pool.subscribe([this](const pipeline::RunEvent &e)
                             { this->handleRunEvent(e); });
    }

    void RunLogger::stop()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running)
            return;
        m_running = false;

        if (m_file.is_open())
            m_file.close();
    }

    std::string RunLogger::formatDayResult(const pipeline::DayResult &r)
    {
        std::ostringstream oss;
        oss << "[DayResult] store=" << r.store
            << " date=" << timebase::formatDate(r.date)
            << " identifiers=" << r.stitch.features.size()
            << " journeys=" << r.stitch.journeys.size()
            << " traffic=" << r.conversion.total_traffic
            << " visits=" << r.conversion.visit_count
            << " conversion=" << std::fixed << std::setprecision(3) << r.conversion.conversion_rate;
        return oss.str();
    }

    std::string RunLogger::formatRunEvent(const pipeline::RunEvent &e)
    {
        std::ostringstream oss;
        oss << "[RunEvent] type=" << pipeline::runEventName(e.type)
            << " store=" << e.store
            << " date=" << e.date
            << " desc=" << e.description;
        return oss.str();
    }

    void RunLogger::handleDayResult(const pipeline::DayResult &r)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running)
            return;
        m_file << formatDayResult(r) << "\n";
    }

    void RunLogger::handleRunEvent(const pipeline::RunEvent &e)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running)
            return;
        m_file << formatRunEvent(e) << "\n";
    }

} // namespace footfall::logging
