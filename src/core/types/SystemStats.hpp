/**
 * @file SystemStats.hpp
 * @brief Snapshot types for CPU, memory, disk, network and process statistics.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace migengine::core {

/**
 * @brief Per-core CPU utilisation sampled over a fixed window.
 */
struct CpuStats {
    std::vector<double> usagePercent; ///< Utilisation per logical core (0-100)
    int count{0};                     ///< Number of logical cores sampled
    std::string modelName;            ///< CPU model name, empty if unknown

    /**
     * @brief Average utilisation across all cores.
     * @return Mean of usagePercent, or 0 if no cores were sampled.
     */
    [[nodiscard]] double averagePercent() const;
};

/**
 * @brief Point-in-time physical memory figures in bytes.
 */
struct MemoryStats {
    uint64_t total{0};        ///< Total physical memory
    uint64_t available{0};    ///< Memory available for new allocations
    uint64_t used{0};         ///< total - available
    double usedPercent{0.0};  ///< used / total * 100
    uint64_t free{0};         ///< Completely unused memory
};

/**
 * @brief Usage of a single mounted filesystem in bytes.
 */
struct DiskStats {
    std::string device;      ///< Backing device, empty for path queries
    std::string mountpoint;  ///< Mount point or queried path
    std::string fstype;      ///< Filesystem type, empty for path queries
    uint64_t total{0};       ///< Filesystem size
    uint64_t free{0};        ///< Space available to unprivileged users
    uint64_t used{0};        ///< total - free blocks
    double usedPercent{0.0}; ///< used / (used + free) * 100
};

/**
 * @brief Network interface counters summed over all interfaces.
 *
 * Counters are cumulative since boot. Rates are obtained by diffing two
 * snapshots.
 */
struct NetworkStats {
    uint64_t bytesSent{0};
    uint64_t bytesRecv{0};
    uint64_t packetsSent{0};
    uint64_t packetsRecv{0};
};

/**
 * @brief Internals of the engine process itself.
 */
struct ProcessStats {
    int threadCount{0};             ///< Threads in this process
    int hardwareThreads{0};         ///< std::thread::hardware_concurrency()
    uint64_t residentBytes{0};      ///< Resident set size
    uint64_t virtualBytes{0};       ///< Virtual memory size
    uint64_t heapAllocatedBytes{0}; ///< Bytes in use by the allocator
    uint64_t heapTotalBytes{0};     ///< Bytes obtained from the system by the allocator
};

/**
 * @brief Complete timestamped system snapshot.
 */
struct SystemStats {
    std::chrono::system_clock::time_point timestamp; ///< When the snapshot was taken
    CpuStats cpu;                                    ///< CPU utilisation
    MemoryStats memory;                              ///< Memory figures
    std::vector<DiskStats> disks;                    ///< Statable mounted filesystems
    NetworkStats network;                            ///< Cumulative network counters
    ProcessStats process;                            ///< Engine process internals
};

} // namespace migengine::core
