#include "infrastructure/monitoring/MetricsAggregator.hpp"

#include <algorithm>
#include <mutex>

namespace migengine::infra {

namespace {

using SystemClock = std::chrono::system_clock;
using SteadyClock = std::chrono::steady_clock;

} // namespace

MetricsAggregator::MetricsAggregator()
    : startTime_(SystemClock::now()), startSteady_(SteadyClock::now()), lastUpdated_(startTime_) {}

void MetricsAggregator::recordOperation(const std::string& name,
                                        std::chrono::nanoseconds duration, bool success) {
    std::unique_lock lock(mutex_);

    auto now = SystemClock::now();
    auto [it, inserted] = operations_.try_emplace(name);
    auto& stats = it->second;
    if (inserted) {
        stats.name = name;
        stats.minDuration = duration;
        stats.maxDuration = duration;
    }

    ++stats.count;
    stats.totalDuration += duration;
    stats.averageDuration = stats.totalDuration / stats.count;
    stats.minDuration = std::min(stats.minDuration, duration);
    stats.maxDuration = std::max(stats.maxDuration, duration);
    stats.lastExecution = now;
    if (!success) {
        ++stats.errorCount;
    }

    lastUpdated_ = now;
}

core::TransferStats& MetricsAggregator::ensureTransfer() {
    if (!transfer_) {
        transfer_.emplace();
        transfer_->startTime = SystemClock::now();
        transferStart_ = SteadyClock::now();
    }
    return *transfer_;
}

void MetricsAggregator::updateTransferStats(int64_t totalBytes, int64_t transferredBytes,
                                            int64_t filesProcessed, int64_t filesTotal) {
    std::unique_lock lock(mutex_);

    auto& transfer = ensureTransfer();
    transfer.totalBytes = totalBytes;
    transfer.transferredBytes = transferredBytes;
    transfer.filesProcessed = filesProcessed;
    transfer.filesTotal = filesTotal;
    transfer.duration = SteadyClock::now() - transferStart_;

    double seconds = std::chrono::duration<double>(transfer.duration).count();
    if (seconds > 0.0) {
        transfer.transferRateMBps =
            static_cast<double>(transferredBytes) / (1024.0 * 1024.0) / seconds;
    }

    if (transferredBytes >= totalBytes) {
        transfer.estimatedEta = std::chrono::seconds(0);
    } else if (transferredBytes > 0 && transfer.transferRateMBps > 0.0) {
        double remainingMiB = static_cast<double>(totalBytes - transferredBytes) / (1024.0 * 1024.0);
        transfer.estimatedEta =
            std::chrono::seconds(static_cast<int64_t>(remainingMiB / transfer.transferRateMBps));
    }

    lastUpdated_ = SystemClock::now();
}

void MetricsAggregator::recordTransferError() {
    std::unique_lock lock(mutex_);
    ++ensureTransfer().errorCount;
    lastUpdated_ = SystemClock::now();
}

void MetricsAggregator::updateSystemStats(const core::SystemStats& stats) {
    std::unique_lock lock(mutex_);
    system_ = stats;
    lastUpdated_ = SystemClock::now();
}

core::MetricsSnapshot MetricsAggregator::snapshot() const {
    std::shared_lock lock(mutex_);

    core::MetricsSnapshot snapshot;
    snapshot.operations = operations_;
    snapshot.transfer = transfer_;
    snapshot.system = system_;
    snapshot.startTime = startTime_;
    snapshot.lastUpdated = lastUpdated_;
    return snapshot;
}

std::optional<core::OperationStats> MetricsAggregator::operationStats(
    const std::string& name) const {
    std::shared_lock lock(mutex_);
    auto it = operations_.find(name);
    if (it == operations_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<core::TransferStats> MetricsAggregator::transferStats() const {
    std::shared_lock lock(mutex_);
    return transfer_;
}

double MetricsAggregator::transferProgress() const {
    std::shared_lock lock(mutex_);
    return transfer_ ? transfer_->progressPercent() : 0.0;
}

void MetricsAggregator::reset() {
    std::unique_lock lock(mutex_);
    operations_.clear();
    transfer_.reset();
    system_.reset();
    startTime_ = SystemClock::now();
    startSteady_ = SteadyClock::now();
    lastUpdated_ = startTime_;
}

core::MetricsSummary MetricsAggregator::summary() const {
    std::shared_lock lock(mutex_);

    core::MetricsSummary summary;
    summary.uptime =
        std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - startSteady_);
    summary.lastUpdated = lastUpdated_;
    summary.distinctOperations = static_cast<int64_t>(operations_.size());

    for (const auto& [name, stats] : operations_) {
        summary.totalOperationCount += stats.count;
        summary.totalErrorCount += stats.errorCount;
    }
    if (summary.totalOperationCount > 0) {
        summary.errorRatePercent = static_cast<double>(summary.totalErrorCount) /
                                   static_cast<double>(summary.totalOperationCount) * 100.0;
    }

    if (transfer_) {
        summary.transferActive = true;
        summary.transferProgressPercent = transfer_->progressPercent();
        summary.transferRateMBps = transfer_->transferRateMBps;
        summary.filesProcessed = transfer_->filesProcessed;
        summary.filesTotal = transfer_->filesTotal;
        summary.estimatedEta = transfer_->estimatedEta;
    }
    return summary;
}

} // namespace migengine::infra
