/**
 * @file ITransferService.hpp
 * @brief Interface for network-oriented transfers.
 */

#pragma once

#include "core/types/TransferResult.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace migengine::core {

/**
 * @brief Interface for HTTP downloads/uploads and bulk local transfers.
 *
 * Failures other than an unknown method are reported through
 * TransferResult::success and TransferResult::error.
 */
class ITransferService {
public:
    virtual ~ITransferService() = default;

    /**
     * @brief Dispatches a transfer by method name.
     * @param source Source URL or path.
     * @param destination Destination path.
     * @param method "http", "chunked" or "concurrent".
     * @return Transfer outcome.
     * @throws std::invalid_argument for an unsupported method.
     */
    virtual TransferResult transfer(const std::string& source, const std::string& destination,
                                    const std::string& method) = 0;

    /**
     * @brief Downloads a URL to a file with bounded retry.
     */
    virtual TransferResult download(const std::string& url,
                                    const std::filesystem::path& destination) = 0;

    /**
     * @brief Uploads a file to a URL with HTTP PUT and bounded retry.
     */
    virtual TransferResult upload(const std::filesystem::path& source, const std::string& url) = 0;

    /**
     * @brief Downloads several URLs into a directory with bounded concurrency.
     * @return One result per URL, in input order.
     */
    virtual std::vector<TransferResult> concurrentDownload(
        const std::vector<std::string>& urls, const std::filesystem::path& destinationDir) = 0;

    /**
     * @brief Copies a local file, reporting progress after every chunk.
     */
    virtual TransferResult transferWithProgress(const std::filesystem::path& source,
                                                const std::filesystem::path& destination,
                                                TransferProgressCallback callback) = 0;
};

} // namespace migengine::core
