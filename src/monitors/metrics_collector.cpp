/**
 * @file metrics_collector.cpp
 * @brief Execution telemetry sampling (Linux)
 *
 * Memory is read from the VmRSS line of /proc/self/status; CPU time from
 * CLOCK_THREAD_CPUTIME_ID. Worker metrics use ru_utime + ru_stime and
 * ru_maxrss (kB) from wait4().
 *
 * @date 2025
 */

#include "capsule/monitors/metrics_collector.hpp"
#include "capsule/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <time.h>

#include <cmath>
#include <fstream>
#include <sstream>
#include <string>

namespace capsule {
namespace monitors {

namespace {

double TimevalToMs(const struct timeval& tv) {
    return static_cast<double>(tv.tv_sec) * 1000.0 + static_cast<double>(tv.tv_usec) / 1000.0;
}

} // anonymous namespace

void MetricsCollector::Start() {
    start_rss_mb_ = ReadResidentMemoryMb();
    start_cpu_ms_ = ThreadCpuTimeMs();
    start_wall_ = std::chrono::steady_clock::now();
}

std::chrono::milliseconds MetricsCollector::Elapsed() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_wall_);
}

core::ExecutionMetrics MetricsCollector::Stop() const {
    auto wall = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start_wall_).count();
    double cpu = ThreadCpuTimeMs() - start_cpu_ms_;
    auto end_rss = ReadResidentMemoryMb();

    core::ExecutionMetrics metrics;
    metrics.wall_time_ms = RoundMilliseconds(wall);
    metrics.cpu_time_ms = RoundMilliseconds(cpu > 0.0 ? cpu : 0.0);
    if (start_rss_mb_ && end_rss) {
        metrics.memory_used_mb = RoundMegabytes(*end_rss - *start_rss_mb_);
    }
    return metrics;
}

core::ExecutionMetrics MetricsCollector::StopWithChildUsage(const struct rusage& usage) const {
    auto wall = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start_wall_).count();

    core::ExecutionMetrics metrics;
    metrics.wall_time_ms = RoundMilliseconds(wall);
    metrics.cpu_time_ms = RoundMilliseconds(TimevalToMs(usage.ru_utime) + TimevalToMs(usage.ru_stime));
    metrics.memory_used_mb = RoundMegabytes(static_cast<double>(usage.ru_maxrss) / 1024.0);
    return metrics;
}

std::optional<double> MetricsCollector::ReadResidentMemoryMb() {
    std::ifstream status_file("/proc/self/status");
    if (!status_file.is_open()) {
        spdlog::debug("Cannot open /proc/self/status; memory metrics disabled");
        return std::nullopt;
    }

    std::string line;
    while (std::getline(status_file, line)) {
        if (utils::StringUtils::StartsWith(line, "VmRSS:")) {
            std::size_t kb = 0;
            std::istringstream iss(line.substr(6));
            if (iss >> kb) {
                return static_cast<double>(kb) / 1024.0;
            }
            break;
        }
    }
    return std::nullopt;
}

double MetricsCollector::ThreadCpuTimeMs() {
    struct timespec ts {};
    if (clock_gettime(CLOCK_THREAD_CPUTIME_ID, &ts) != 0) {
        return 0.0;
    }
    return static_cast<double>(ts.tv_sec) * 1000.0 + static_cast<double>(ts.tv_nsec) / 1.0e6;
}

double MetricsCollector::RoundMilliseconds(double ms) {
    return std::round(ms);
}

double MetricsCollector::RoundMegabytes(double mb) {
    return std::round(mb * 100.0) / 100.0;
}

} // namespace monitors
} // namespace capsule
