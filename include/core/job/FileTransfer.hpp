#pragma once

#include <string>

namespace core::job {
    /**
     * @brief Secondary channel used to place a job file on the device.
     * Each upload opens and closes its own connection.
     */
    class FileTransfer {
    public:
        /**
         * @throws core::types::TransferException when the file cannot be stored as remoteName
         */
        virtual void upload(const std::string &localPath, const std::string &remoteName) = 0;

        virtual ~FileTransfer() = default;
    };
} // namespace core::job
