/**
 * @file IResourceMonitor.hpp
 * @brief Interface for system resource sampling.
 */

#pragma once

#include "core/types/SystemStats.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>

namespace migengine::core {

/**
 * @brief Interface for sampling CPU, memory, disk and network usage.
 */
class IResourceMonitor {
public:
    /**
     * @brief Callback invoked with each periodic snapshot.
     */
    using StatsCallback = std::function<void(const SystemStats&)>;

    virtual ~IResourceMonitor() = default;

    /**
     * @brief Takes a full snapshot. Blocks for the CPU sampling window.
     * @return Current system statistics.
     * @throws std::runtime_error if a mandatory source cannot be read.
     */
    virtual SystemStats getSystemStats() = 0;

    /**
     * @brief Samples per-core CPU utilisation. Blocks for the sampling window.
     */
    virtual CpuStats getCpuUsage() = 0;

    /**
     * @brief Reads current memory figures.
     */
    virtual MemoryStats getMemoryUsage() = 0;

    /**
     * @brief Reads usage of the filesystem containing a path.
     * @throws std::runtime_error if the path cannot be statted.
     */
    virtual DiskStats getDiskUsage(const std::filesystem::path& path) = 0;

    /**
     * @brief Starts periodic sampling until stopped.
     * @param interval Time between snapshots.
     * @param callback Function called with each snapshot.
     * @return Identifier used to stop this monitor.
     */
    virtual int64_t startMonitoring(std::chrono::milliseconds interval, StatsCallback callback) = 0;

    /**
     * @brief Stops one monitor. Unknown identifiers are ignored.
     *
     * Waits for a snapshot already being taken, so the callback is never
     * invoked after this returns (unless called from the callback itself).
     */
    virtual void stopMonitoring(int64_t monitorId) = 0;

    /**
     * @brief Stops every running monitor.
     */
    virtual void stopAllMonitoring() = 0;

    /**
     * @brief Checks whether a monitor is running.
     */
    virtual bool isMonitoring(int64_t monitorId) const = 0;
};

} // namespace migengine::core
