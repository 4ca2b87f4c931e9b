#pragma once

#include "FileTransfer.hpp"
#include "application/config/LinkConfig.hpp"
#include <cstddef>

namespace core::job {
    class FtpFileTransfer : public FileTransfer {
    public:
        explicit FtpFileTransfer(config::LinkConfig config);

        ~FtpFileTransfer() override;

        void upload(const std::string &localPath, const std::string &remoteName) override;

        /**
         * @brief ftp://host:port/name, or ftps:// when implicit TLS is configured
         */
        std::string buildUrl(const std::string &remoteName) const;

    private:
        config::LinkConfig config_;

        static size_t readCallback(char *buffer, size_t size, size_t nitems, void *userp);
    };
} // namespace core::job
