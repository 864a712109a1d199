/**
 * @file metrics_collector.hpp
 * @brief Wall-time, CPU-time and memory measurement around one execution
 *
 * Sampling happens immediately before dispatch and immediately after the
 * execution settles, whatever the outcome. Two finishing modes exist:
 * - Stop(): in-process units. CPU is the calling thread's CPU clock, memory
 *   is the delta of this process's resident set size (may be negative).
 * - StopWithChildUsage(): isolated units. CPU and peak memory come from the
 *   reaped worker's rusage.
 *
 * @date 2025
 */

#pragma once

#include "capsule/core/types.hpp"

#include <sys/resource.h>

#include <chrono>
#include <optional>

namespace capsule {
namespace monitors {

/**
 * @class MetricsCollector
 * @brief One-shot stopwatch producing ExecutionMetrics
 *
 * **Usage**:
 * @code
 * MetricsCollector collector;
 * collector.Start();
 * RunScript();
 * result.metrics = collector.Stop();
 * @endcode
 *
 * **Thread Safety**: Not thread-safe; Start() and Stop() must run on the
 * thread whose CPU time is being measured.
 */
class MetricsCollector {
public:
    MetricsCollector() = default;

    /**
     * @brief Take the "before" sample
     */
    void Start();

    /**
     * @brief Take the "after" sample for an in-process execution
     * @return Wall ms, thread CPU ms and RSS delta MB, rounded
     */
    core::ExecutionMetrics Stop() const;

    /**
     * @brief Finish using the resource usage of a reaped worker process
     * @param usage rusage filled by wait4()
     */
    core::ExecutionMetrics StopWithChildUsage(const struct rusage& usage) const;

    /**
     * @brief Wall time elapsed since Start(), unrounded
     */
    std::chrono::milliseconds Elapsed() const;

    /**
     * @brief Current resident set size of this process
     * @return RSS in MB, or std::nullopt if /proc is unavailable
     */
    static std::optional<double> ReadResidentMemoryMb();

    /**
     * @brief CPU time consumed so far by the calling thread
     */
    static double ThreadCpuTimeMs();

    static double RoundMilliseconds(double ms);
    static double RoundMegabytes(double mb);

private:
    std::chrono::steady_clock::time_point start_wall_;
    double start_cpu_ms_{0.0};
    std::optional<double> start_rss_mb_;
};

} // namespace monitors
} // namespace capsule
