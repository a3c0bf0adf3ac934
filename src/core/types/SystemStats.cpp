#include "core/types/SystemStats.hpp"

#include <numeric>

namespace migengine::core {

double CpuStats::averagePercent() const {
    if (usagePercent.empty()) {
        return 0.0;
    }
    return std::accumulate(usagePercent.begin(), usagePercent.end(), 0.0) /
           static_cast<double>(usagePercent.size());
}

} // namespace migengine::core
