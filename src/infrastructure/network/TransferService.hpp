#pragma once

#include "core/services/IFileCopier.hpp"
#include "core/services/ITransferService.hpp"

namespace migengine::infra {

/**
 * @brief HTTP and local bulk transfers with bounded retry.
 *
 * Downloads and uploads go through HttpClient. A failed attempt (connection
 * error, timeout, unexpected status, truncated body) is retried up to
 * retryAttempts more times, sleeping retryDelay * attempt before each
 * retry. Local "concurrent" transfers delegate to the file copier.
 * Implements the core::ITransferService interface.
 */
class TransferService : public core::ITransferService {
public:
    TransferService(core::TransferConfig config, core::IFileCopier& copier);

    core::TransferResult transfer(const std::string& source, const std::string& destination,
                                  const std::string& method) override;

    core::TransferResult download(const std::string& url,
                                  const std::filesystem::path& destination) override;

    core::TransferResult upload(const std::filesystem::path& source,
                                const std::string& url) override;

    std::vector<core::TransferResult> concurrentDownload(
        const std::vector<std::string>& urls,
        const std::filesystem::path& destinationDir) override;

    core::TransferResult transferWithProgress(const std::filesystem::path& source,
                                              const std::filesystem::path& destination,
                                              core::TransferProgressCallback callback) override;

    const core::TransferConfig& config() const { return config_; }

private:
    int64_t chunkedCopy(const std::filesystem::path& source,
                        const std::filesystem::path& destination,
                        const core::TransferProgressCallback& callback) const;
    int64_t concurrentCopy(const std::filesystem::path& source,
                           const std::filesystem::path& destination);

    core::TransferConfig config_;
    core::IFileCopier& copier_;
};

} // namespace migengine::infra
