#pragma once

#include "FileTransfer.hpp"
#include "core/link/DeviceLink.hpp"
#include <memory>
#include <mutex>
#include <string>

namespace core::job {
    constexpr const char *PROJECT_FILE_EXTENSION = ".3mf";

    /**
     * @brief Uploads a print-ready file, then asks the printer to start it.
     *
     * The start command is published only after the upload succeeded. Nothing is retried:
     * a failure after the upload leaves the file on the printer.
     */
    class JobSubmitter {
    public:
        JobSubmitter(std::shared_ptr<link::DeviceLink> link, std::shared_ptr<FileTransfer> transfer);

        /**
         * @return the job id carried as sequence_id in the start command
         * @throws core::types::NotFoundException when filePath does not exist
         * @throws core::types::ConfigurationException when the link is not configured
         * @throws core::types::TransferException when the upload fails (no command is sent)
         * @throws core::types::ConnectivityException when the link cannot be established
         */
        std::string submit(const std::string &filePath, const std::string &printName);

        static std::string remoteFileName(const std::string &printName);

        static std::string generateJobId();

    private:
        std::shared_ptr<link::DeviceLink> link_;
        std::shared_ptr<FileTransfer> transfer_;
        std::mutex submitMutex_;
    };
} // namespace core::job
