#pragma once

#include "core/services/IResourceMonitor.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <asio.hpp>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace migengine::infra {

/**
 * @brief Samples system resources from procfs.
 *
 * CPU utilisation is the busy share of jiffies between two /proc/stat
 * readings taken one sampling window apart. Memory, network and process
 * figures are read from /proc/meminfo, /proc/net/dev and
 * /proc/self/status; filesystems come from the mount table and statvfs.
 *
 * Periodic monitors run on steady timers of the shared AsioContext and
 * stay active until stopped. Implements the core::IResourceMonitor
 * interface.
 */
class ResourceMonitor : public core::IResourceMonitor {
public:
    /**
     * @brief Constructs a ResourceMonitor.
     * @param context I/O context that drives periodic monitors.
     * @param cpuWindow Time between the two CPU readings.
     * @param procRoot Root of the proc filesystem.
     */
    explicit ResourceMonitor(AsioContext& context,
                             std::chrono::milliseconds cpuWindow = std::chrono::seconds(1),
                             std::filesystem::path procRoot = "/proc");

    ~ResourceMonitor() override;

    ResourceMonitor(const ResourceMonitor&) = delete;
    ResourceMonitor& operator=(const ResourceMonitor&) = delete;

    core::SystemStats getSystemStats() override;
    core::CpuStats getCpuUsage() override;
    core::MemoryStats getMemoryUsage() override;
    core::DiskStats getDiskUsage(const std::filesystem::path& path) override;

    int64_t startMonitoring(std::chrono::milliseconds interval, StatsCallback callback) override;
    void stopMonitoring(int64_t monitorId) override;
    void stopAllMonitoring() override;
    bool isMonitoring(int64_t monitorId) const override;

    /**
     * @brief Lists usage of every mounted filesystem with a non-zero size.
     */
    std::vector<core::DiskStats> getAllDiskUsage() const;

    core::NetworkStats getNetworkCounters() const;
    core::ProcessStats getProcessStats() const;

private:
    struct CpuTimes {
        uint64_t idle{0};
        uint64_t total{0};
    };

    /**
     * @brief State of one periodic monitor, shared with its pending handlers.
     *
     * The timer is only touched on the strand. The mutex guards active and
     * sampling, so stop can wait for a sample that is already running.
     */
    struct Monitor {
        explicit Monitor(asio::io_context& io) : strand(asio::make_strand(io)), timer(strand) {}

        int64_t id{0};
        std::chrono::milliseconds interval{0};
        StatsCallback callback;
        asio::strand<asio::io_context::executor_type> strand;
        asio::steady_timer timer;

        std::mutex mutex;
        std::condition_variable idle;
        bool active{true};
        bool sampling{false};
        std::thread::id samplingThread;
    };

    std::vector<CpuTimes> readCpuTimes() const;
    std::string readCpuModel() const;
    static void scheduleNext(ResourceMonitor* owner, std::shared_ptr<Monitor> monitor);
    static void deactivate(const std::shared_ptr<Monitor>& monitor);

    AsioContext& context_;
    std::chrono::milliseconds cpuWindow_;
    std::filesystem::path procRoot_;
    std::map<int64_t, std::shared_ptr<Monitor>> monitors_;
    int64_t nextMonitorId_{1};
    mutable std::mutex mutex_;
};

} // namespace migengine::infra
