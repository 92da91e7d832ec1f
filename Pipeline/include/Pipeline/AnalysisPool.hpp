#pragma once

#include <Pipeline/DayPipeline.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace footfall::pipeline
{
    enum class RunEventType
    {
        DayStarted,
        DayCompleted,
        DaySkipped,
        JobFailed
    };

    std::string_view runEventName(RunEventType type) noexcept;

    struct RunEvent
    {
        std::chrono::steady_clock::time_point timestamp;
        RunEventType type{RunEventType::DayStarted};
        std::string store;
        std::string date;
        std::string description;
    };

    // One unit of work. load() runs on the worker thread; std::nullopt means the
    // store-day has no usable input and is reported as skipped.
    struct AnalysisJob
    {
        std::string store;
        std::chrono::year_month_day date{};
        std::function<std::optional<StoreDay>()> load;
    };

    struct PoolConfig
    {
        std::size_t workerCount = std::max(1u, std::thread::hardware_concurrency());
    };

    // Runs independent store-day jobs on a fixed set of worker threads and fans out
    // results. Handlers are called one at a time, so subscribers need no locking of their own.
    class AnalysisPool
    {
    public:
        using DayResultHandler = std::function<void(const DayResult &)>;
        using RunEventHandler = std::function<void(const RunEvent &)>;

        AnalysisPool(const DayPipeline &pipeline, const PoolConfig &config = {});
        ~AnalysisPool();

        AnalysisPool(const AnalysisPool &) = delete;
        AnalysisPool &operator=(const AnalysisPool &) = delete;

        void start();
        // Workers finish their current job; queued jobs are dropped.
        void stop();

        // Thread-safe
        void submit(AnalysisJob job);

        // Blocks until the queue is drained and no job is running. Returns at once when not running.
        void waitIdle();

        // Subscription API - call before start()
        void subscribe(DayResultHandler handler);
        void subscribe(RunEventHandler handler);

        [[nodiscard]] std::size_t completedCount() const noexcept { return m_completed.load(); }
        [[nodiscard]] std::size_t failedCount() const noexcept { return m_failed.load(); }
        [[nodiscard]] std::size_t skippedCount() const noexcept { return m_skipped.load(); }

    private:
        void workerLoop(std::stop_token st);
        void execute(AnalysisJob &job);

        void deliver(const DayResult &result);
        void deliver(const RunEvent &event);
        void publishEvent(RunEventType type, const AnalysisJob &job, std::string description = {});

        const DayPipeline &m_pipeline;
        PoolConfig m_config{};

        std::queue<AnalysisJob> m_jobs;
        std::size_t m_active{0};

        std::vector<DayResultHandler> m_resultHandlers;
        std::vector<RunEventHandler> m_eventHandlers;

        // Synchronization
        std::mutex m_mutex;
        std::condition_variable m_cv;
        std::condition_variable m_idleCv;
        bool m_stopping{false};
        std::mutex m_deliveryMutex;

        std::atomic<bool> m_running{false};
        std::atomic<std::size_t> m_completed{0};
        std::atomic<std::size_t> m_failed{0};
        std::atomic<std::size_t> m_skipped{0};
        std::vector<std::jthread> m_workers;
    };

} // namespace footfall::pipeline
