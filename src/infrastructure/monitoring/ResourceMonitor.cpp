#include "infrastructure/monitoring/ResourceMonitor.hpp"

#include <mntent.h>
#include <spdlog/spdlog.h>
#include <sys/statvfs.h>

#if defined(__GLIBC__)
#include <malloc.h>
#endif

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <fstream>
#include <memory>
#include <mutex>
#include <set>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace migengine::infra {

namespace {

constexpr uint64_t kKiB = 1024;

std::ifstream openProcFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("failed to read " + path.string() + ": " + std::strerror(errno));
    }
    return file;
}

/// Reads "Key:   value kB" lines into a map of values in bytes (or raw counts).
std::map<std::string, uint64_t> readKeyValueFile(const std::filesystem::path& path) {
    auto file = openProcFile(path);
    std::map<std::string, uint64_t> values;
    std::string line;
    while (std::getline(file, line)) {
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        std::istringstream rest(line.substr(colon + 1));
        uint64_t value = 0;
        std::string unit;
        if (!(rest >> value)) {
            continue;
        }
        rest >> unit;
        values[line.substr(0, colon)] = unit == "kB" ? value * kKiB : value;
    }
    return values;
}

uint64_t valueOr(const std::map<std::string, uint64_t>& values, const std::string& key,
                 uint64_t fallback = 0) {
    auto it = values.find(key);
    return it != values.end() ? it->second : fallback;
}

core::DiskStats diskStatsFromStatvfs(const struct statvfs& fs) {
    core::DiskStats disk;
    uint64_t blockSize = fs.f_frsize > 0 ? fs.f_frsize : fs.f_bsize;
    disk.total = static_cast<uint64_t>(fs.f_blocks) * blockSize;
    disk.free = static_cast<uint64_t>(fs.f_bavail) * blockSize;
    disk.used = static_cast<uint64_t>(fs.f_blocks - fs.f_bfree) * blockSize;
    if (disk.used + disk.free > 0) {
        disk.usedPercent = static_cast<double>(disk.used) /
                           static_cast<double>(disk.used + disk.free) * 100.0;
    }
    return disk;
}

} // namespace

ResourceMonitor::ResourceMonitor(AsioContext& context, std::chrono::milliseconds cpuWindow,
                                 std::filesystem::path procRoot)
    : context_(context), cpuWindow_(cpuWindow), procRoot_(std::move(procRoot)) {}

ResourceMonitor::~ResourceMonitor() {
    stopAllMonitoring();
}

core::SystemStats ResourceMonitor::getSystemStats() {
    core::SystemStats stats;
    stats.timestamp = std::chrono::system_clock::now();
    stats.cpu = getCpuUsage();
    stats.memory = getMemoryUsage();
    stats.disks = getAllDiskUsage();
    stats.network = getNetworkCounters();
    stats.process = getProcessStats();
    return stats;
}

std::vector<ResourceMonitor::CpuTimes> ResourceMonitor::readCpuTimes() const {
    auto file = openProcFile(procRoot_ / "stat");
    std::vector<CpuTimes> cores;
    std::string line;
    while (std::getline(file, line)) {
        // Per-core lines are "cpuN ..."; the aggregate "cpu " line is skipped
        if (line.rfind("cpu", 0) != 0 || line.size() < 4 ||
            !std::isdigit(static_cast<unsigned char>(line[3]))) {
            continue;
        }

        std::istringstream fields(line);
        std::string label;
        fields >> label;

        CpuTimes times;
        uint64_t value = 0;
        for (int column = 0; column < 8 && fields >> value; ++column) {
            times.total += value;
            if (column == 3 || column == 4) { // idle, iowait
                times.idle += value;
            }
        }
        cores.push_back(times);
    }

    if (cores.empty()) {
        throw std::runtime_error("no per-core CPU lines in " + (procRoot_ / "stat").string());
    }
    return cores;
}

std::string ResourceMonitor::readCpuModel() const {
    std::ifstream file(procRoot_ / "cpuinfo");
    std::string line;
    while (std::getline(file, line)) {
        if (line.rfind("model name", 0) == 0) {
            auto colon = line.find(':');
            if (colon != std::string::npos) {
                auto model = line.substr(colon + 1);
                model.erase(0, model.find_first_not_of(" \t"));
                return model;
            }
        }
    }
    return {};
}

core::CpuStats ResourceMonitor::getCpuUsage() {
    auto before = readCpuTimes();
    std::this_thread::sleep_for(cpuWindow_);
    auto after = readCpuTimes();

    core::CpuStats cpu;
    size_t count = std::min(before.size(), after.size());
    cpu.usagePercent.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        uint64_t total = after[i].total > before[i].total ? after[i].total - before[i].total : 0;
        uint64_t idle = after[i].idle > before[i].idle ? after[i].idle - before[i].idle : 0;
        double usage = total > 0 ? static_cast<double>(total - std::min(idle, total)) /
                                       static_cast<double>(total) * 100.0
                                 : 0.0;
        cpu.usagePercent.push_back(std::clamp(usage, 0.0, 100.0));
    }
    cpu.count = static_cast<int>(count);
    cpu.modelName = readCpuModel();
    return cpu;
}

core::MemoryStats ResourceMonitor::getMemoryUsage() {
    auto values = readKeyValueFile(procRoot_ / "meminfo");

    core::MemoryStats memory;
    memory.total = valueOr(values, "MemTotal");
    memory.free = valueOr(values, "MemFree");
    memory.available = valueOr(values, "MemAvailable",
                               memory.free + valueOr(values, "Buffers") + valueOr(values, "Cached"));
    memory.used = memory.total > memory.available ? memory.total - memory.available : 0;
    if (memory.total > 0) {
        memory.usedPercent =
            static_cast<double>(memory.used) / static_cast<double>(memory.total) * 100.0;
    }
    return memory;
}

core::DiskStats ResourceMonitor::getDiskUsage(const std::filesystem::path& path) {
    struct statvfs fs {};
    if (::statvfs(path.c_str(), &fs) != 0) {
        throw std::runtime_error("failed to get disk usage for " + path.string() + ": " +
                                 std::strerror(errno));
    }
    auto disk = diskStatsFromStatvfs(fs);
    disk.mountpoint = path.string();
    return disk;
}

std::vector<core::DiskStats> ResourceMonitor::getAllDiskUsage() const {
    std::vector<core::DiskStats> disks;

    auto mounts = procRoot_ / "self" / "mounts";
    std::unique_ptr<FILE, int (*)(FILE*)> table(setmntent(mounts.c_str(), "r"), endmntent);
    if (!table) {
        spdlog::warn("Cannot read mount table {}: {}", mounts.string(), std::strerror(errno));
        return disks;
    }

    std::set<std::string> seen;
    struct mntent entry {};
    char buffer[4096];
    while (getmntent_r(table.get(), &entry, buffer, sizeof(buffer)) != nullptr) {
        std::string mountpoint = entry.mnt_dir;
        if (!seen.insert(mountpoint).second) {
            continue;
        }

        struct statvfs fs {};
        if (::statvfs(entry.mnt_dir, &fs) != 0) {
            spdlog::debug("Skipping unstatable mount {}", mountpoint);
            continue;
        }
        if (fs.f_blocks == 0) {
            continue; // pseudo filesystem
        }

        auto disk = diskStatsFromStatvfs(fs);
        disk.device = entry.mnt_fsname;
        disk.mountpoint = mountpoint;
        disk.fstype = entry.mnt_type;
        disks.push_back(std::move(disk));
    }
    return disks;
}

core::NetworkStats ResourceMonitor::getNetworkCounters() const {
    core::NetworkStats network;

    std::ifstream file(procRoot_ / "net" / "dev");
    if (!file) {
        spdlog::debug("Network counters unavailable");
        return network;
    }

    std::string line;
    while (std::getline(file, line)) {
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue; // header lines
        }

        std::istringstream fields(line.substr(colon + 1));
        uint64_t value[16] = {};
        int parsed = 0;
        while (parsed < 16 && fields >> value[parsed]) {
            ++parsed;
        }
        if (parsed < 10) {
            continue;
        }
        network.bytesRecv += value[0];
        network.packetsRecv += value[1];
        network.bytesSent += value[8];
        network.packetsSent += value[9];
    }
    return network;
}

core::ProcessStats ResourceMonitor::getProcessStats() const {
    core::ProcessStats process;
    process.hardwareThreads = static_cast<int>(std::thread::hardware_concurrency());

    try {
        auto status = readKeyValueFile(procRoot_ / "self" / "status");
        process.threadCount = static_cast<int>(valueOr(status, "Threads"));
        process.residentBytes = valueOr(status, "VmRSS");
        process.virtualBytes = valueOr(status, "VmSize");
    } catch (const std::runtime_error& e) {
        spdlog::debug("Process status unavailable: {}", e.what());
    }

#if defined(__GLIBC__) && (__GLIBC__ > 2 || (__GLIBC__ == 2 && __GLIBC_MINOR__ >= 33))
    auto heap = mallinfo2();
    process.heapAllocatedBytes = heap.uordblks + heap.hblkhd;
    process.heapTotalBytes = heap.arena + heap.hblkhd;
#endif

    return process;
}

int64_t ResourceMonitor::startMonitoring(std::chrono::milliseconds interval,
                                         StatsCallback callback) {
    auto monitor = std::make_shared<Monitor>(context_.getContext());
    monitor->interval = interval.count() > 0 ? interval : std::chrono::milliseconds(1000);
    monitor->callback = std::move(callback);

    {
        std::lock_guard lock(mutex_);
        monitor->id = nextMonitorId_++;
        monitors_[monitor->id] = monitor;
    }

    spdlog::info("Started resource monitor {} (interval {} ms)", monitor->id,
                 monitor->interval.count());
    asio::post(monitor->strand, [owner = this, monitor] { scheduleNext(owner, monitor); });
    return monitor->id;
}

void ResourceMonitor::stopMonitoring(int64_t monitorId) {
    std::shared_ptr<Monitor> monitor;
    {
        std::lock_guard lock(mutex_);
        auto it = monitors_.find(monitorId);
        if (it == monitors_.end()) {
            return;
        }
        monitor = it->second;
        monitors_.erase(it);
    }

    deactivate(monitor);
    spdlog::info("Stopped resource monitor {}", monitorId);
}

void ResourceMonitor::stopAllMonitoring() {
    std::map<int64_t, std::shared_ptr<Monitor>> stopping;
    {
        std::lock_guard lock(mutex_);
        stopping.swap(monitors_);
    }

    if (stopping.empty()) {
        return;
    }
    for (auto& [id, monitor] : stopping) {
        deactivate(monitor);
    }
    spdlog::info("Stopped all resource monitors");
}

bool ResourceMonitor::isMonitoring(int64_t monitorId) const {
    std::lock_guard lock(mutex_);
    return monitors_.contains(monitorId);
}

void ResourceMonitor::deactivate(const std::shared_ptr<Monitor>& monitor) {
    {
        std::unique_lock lock(monitor->mutex);
        monitor->active = false;
        // A callback stopping its own monitor must not wait for itself
        if (monitor->samplingThread != std::this_thread::get_id()) {
            monitor->idle.wait(lock, [&monitor] { return !monitor->sampling; });
        }
    }
    asio::post(monitor->strand, [monitor] { monitor->timer.cancel(); });
}

void ResourceMonitor::scheduleNext(ResourceMonitor* owner, std::shared_ptr<Monitor> monitor) {
    // Runs on the monitor's strand. owner is dereferenced only while the
    // monitor is active and marked as sampling, which deactivate() waits out.
    monitor->timer.expires_after(monitor->interval);
    monitor->timer.async_wait(asio::bind_executor(
        monitor->strand, [owner, monitor](const asio::error_code& ec) {
            if (ec) {
                return;
            }
            {
                std::lock_guard lock(monitor->mutex);
                if (!monitor->active) {
                    return;
                }
                monitor->sampling = true;
                monitor->samplingThread = std::this_thread::get_id();
            }

            struct SamplingScope {
                Monitor& monitor;
                ~SamplingScope() {
                    std::lock_guard lock(monitor.mutex);
                    monitor.sampling = false;
                    monitor.samplingThread = {};
                    monitor.idle.notify_all();
                }
            };

            {
                SamplingScope scope{*monitor};
                try {
                    auto stats = owner->getSystemStats();
                    if (monitor->callback) {
                        monitor->callback(stats);
                    }
                } catch (const std::exception& e) {
                    spdlog::warn("Resource monitor {} sample failed: {}", monitor->id, e.what());
                }
            }

            std::lock_guard lock(monitor->mutex);
            if (monitor->active) {
                scheduleNext(owner, monitor);
            }
        }));
}

} // namespace migengine::infra
