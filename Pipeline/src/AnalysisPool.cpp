#include <Pipeline/AnalysisPool.hpp>
#include <TimeBase/TimeIndex.hpp>

#include <exception>
#include <iostream>
#include <stdexcept>

namespace footfall::pipeline
{
    std::string_view runEventName(RunEventType type) noexcept
    {
        switch (type)
        {
        case RunEventType::DayStarted:
            return "DayStarted";
        case RunEventType::DayCompleted:
            return "DayCompleted";
        case RunEventType::DaySkipped:
            return "DaySkipped";
        case RunEventType::JobFailed:
            return "JobFailed";
        }
        return "Unknown";
    }

    AnalysisPool::AnalysisPool(const DayPipeline &pipeline, const PoolConfig &config)
        : m_pipeline(pipeline), m_config(config)
    {
        if (m_config.workerCount == 0)
            throw std::invalid_argument("PoolConfig: workerCount must be positive");
    }

    AnalysisPool::~AnalysisPool()
    {
        stop();
    }

    void AnalysisPool::start()
    {
        bool expected = false;
        if (!m_running.compare_exchange_strong(expected, true))
        {
            // already running
            return;
        }

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_stopping = false;
        }

        m_workers.reserve(m_config.workerCount);
        for (std::size_t i = 0; i < m_config.workerCount; ++i)
            m_workers.emplace_back([this](std::stop_token st)
                                   { workerLoop(st); });
    }

    void AnalysisPool::stop()
    {
        bool expected = true;
        if (!m_running.compare_exchange_strong(expected, false))
            return;

        for (auto &w : m_workers)
            w.request_stop();

        std::size_t dropped = 0;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_stopping = true;
            dropped = m_jobs.size();
            std::queue<AnalysisJob>().swap(m_jobs);
        }
        m_cv.notify_all();

        for (auto &w : m_workers)
            if (w.joinable())
                w.join();
        m_workers.clear();
        m_idleCv.notify_all();

        if (dropped > 0)
            std::cerr << "[AnalysisPool] Stopped with " << dropped << " queued job(s) dropped\n";
    }

    void AnalysisPool::submit(AnalysisJob job)
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_jobs.push(std::move(job));
        }
        m_cv.notify_one();
    }

    void AnalysisPool::waitIdle()
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_idleCv.wait(lock, [&]
                      { return !m_running.load() || m_stopping || (m_jobs.empty() && m_active == 0); });
    }

    void AnalysisPool::subscribe(DayResultHandler handler)
    {
        std::lock_guard<std::mutex> lock(m_deliveryMutex);
        m_resultHandlers.emplace_back(std::move(handler));
    }

    void AnalysisPool::subscribe(RunEventHandler handler)
    {
        std::lock_guard<std::mutex> lock(m_deliveryMutex);
        m_eventHandlers.emplace_back(std::move(handler));
    }

    void AnalysisPool::workerLoop(std::stop_token st)
    {
        while (true)
        {
            AnalysisJob job;
            {
                std::unique_lock<std::mutex> lock(m_mutex);
                m_cv.wait(lock, [&]
                          { return !m_jobs.empty() || m_stopping || st.stop_requested(); });

                if (m_stopping || st.stop_requested())
                    break;

                job = std::move(m_jobs.front());
                m_jobs.pop();
                ++m_active;
            }

            execute(job);

            {
                std::lock_guard<std::mutex> lock(m_mutex);
                --m_active;
            }
            m_idleCv.notify_all();
        }
    }

    void AnalysisPool::execute(AnalysisJob &job)
    {
        publishEvent(RunEventType::DayStarted, job);
        try
        {
            std::optional<StoreDay> day = job.load ? job.load() : std::nullopt;
            if (!day)
            {
                ++m_skipped;
                publishEvent(RunEventType::DaySkipped, job, "no usable input");
                return;
            }

            const DayResult result = m_pipeline.run(*day);
            ++m_completed;
            deliver(result);
            publishEvent(RunEventType::DayCompleted, job,
                         "journeys=" + std::to_string(result.stitch.journeys.size()));
        }
        catch (const std::exception &e)
        {
            ++m_failed;
            std::cerr << "[AnalysisPool] " << job.store << " " << timebase::formatDate(job.date)
                      << " failed: " << e.what() << "\n";
            publishEvent(RunEventType::JobFailed, job, e.what());
        }
    }

    void AnalysisPool::deliver(const DayResult &result)
    {
        std::lock_guard<std::mutex> lock(m_deliveryMutex);
        for (auto &h : m_resultHandlers)
        {
            if (h)
            {
                h(result);
            }
        }
    }

    void AnalysisPool::deliver(const RunEvent &event)
    {
        std::lock_guard<std::mutex> lock(m_deliveryMutex);
        for (auto &h : m_eventHandlers)
        {
            if (h)
            {
                h(event);
            }
        }
    }

    void AnalysisPool::publishEvent(RunEventType type, const AnalysisJob &job, std::string description)
    {
        RunEvent event;
        event.timestamp = std::chrono::steady_clock::now();
        event.type = type;
        event.store = job.store;
        event.date = timebase::formatDate(job.date);
        event.description = std::move(description);
        deliver(event);
    }

} // namespace footfall::pipeline
