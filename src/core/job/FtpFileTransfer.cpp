#include "core/job/FtpFileTransfer.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"
#include <curl/curl.h>
#include <filesystem>
#include <fstream>
#include <memory>

namespace core::job {
    using core::types::TransferException;

    FtpFileTransfer::FtpFileTransfer(config::LinkConfig config) : config_(std::move(config)) {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }

    FtpFileTransfer::~FtpFileTransfer() {
        curl_global_cleanup();
    }

    std::string FtpFileTransfer::buildUrl(const std::string &remoteName) const {
        std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
        if (!curl) {
            throw TransferException("Failed to initialize CURL");
        }

        // print names may carry spaces, '#' or '?', all of which change the meaning of a URL
        std::unique_ptr<char, decltype(&curl_free)> escaped(
            curl_easy_escape(curl.get(), remoteName.c_str(), static_cast<int>(remoteName.size())), &curl_free);
        if (!escaped) {
            throw TransferException("Cannot encode remote file name: " + remoteName);
        }

        std::string scheme = config_.ftpImplicitTls ? "ftps://" : "ftp://";
        return scheme + config_.printerIp + ":" + std::to_string(config_.ftpPort) + "/" + escaped.get();
    }

    void FtpFileTransfer::upload(const std::string &localPath, const std::string &remoteName) {
        std::ifstream inFile(localPath, std::ios::binary);
        if (!inFile.is_open()) {
            throw TransferException("Cannot open " + localPath + " for upload");
        }

        std::error_code sizeEc;
        auto fileSize = std::filesystem::file_size(localPath, sizeEc);
        if (sizeEc) {
            throw TransferException("Cannot stat " + localPath + ": " + sizeEc.message());
        }

        std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
        if (!curl) {
            throw TransferException("Failed to initialize CURL");
        }

        std::string url = buildUrl(remoteName);
        std::string credentials = config_.username + ":" + config_.accessCode;

        curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_USERPWD, credentials.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_UPLOAD, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_READFUNCTION, readCallback);
        curl_easy_setopt(curl.get(), CURLOPT_READDATA, &inFile);
        curl_easy_setopt(curl.get(), CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(fileSize));

        if (config_.ftpImplicitTls) {
            // same self-signed certificate as the control channel
            curl_easy_setopt(curl.get(), CURLOPT_USE_SSL, static_cast<long>(CURLUSESSL_ALL));
            curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 0L);
            curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 0L);
        }

        // Timeouts
        curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, 30L);
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, 300L);
        curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, 60L);
        curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1024L);

        Logger::logInfo("[FtpFileTransfer] Uploading " + localPath + " (" + std::to_string(fileSize) +
                        " bytes) to " + url);

        CURLcode res = curl_easy_perform(curl.get());
        if (res != CURLE_OK) {
            std::string error = "Upload of " + remoteName + " failed: " + curl_easy_strerror(res);
            Logger::logError("[FtpFileTransfer] " + error);
            throw TransferException(error);
        }

        long responseCode = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &responseCode);
        if (responseCode >= 400) {
            std::string error = "Server rejected " + remoteName + " with FTP code " + std::to_string(responseCode);
            Logger::logError("[FtpFileTransfer] " + error);
            throw TransferException(error);
        }

        Logger::logInfo("[FtpFileTransfer] Upload completed: " + remoteName);
    }

    size_t FtpFileTransfer::readCallback(char *buffer, size_t size, size_t nitems, void *userp) {
        auto *file = static_cast<std::ifstream *>(userp);
        file->read(buffer, static_cast<std::streamsize>(size * nitems));
        if (file->bad()) {
            return CURL_READFUNC_ABORT;
        }
        return static_cast<size_t>(file->gcount());
    }
} // namespace core::job
