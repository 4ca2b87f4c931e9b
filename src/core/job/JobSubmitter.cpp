#include "core/job/JobSubmitter.hpp"
#include "core/models/DeviceCommand.hpp"
#include "core/models/PrintJob.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <filesystem>

namespace core::job {
    using core::types::ConfigurationException;
    using core::types::NotFoundException;

    JobSubmitter::JobSubmitter(std::shared_ptr<link::DeviceLink> link, std::shared_ptr<FileTransfer> transfer)
        : link_(std::move(link)), transfer_(std::move(transfer)) {
    }

    std::string JobSubmitter::remoteFileName(const std::string &printName) {
        return printName + PROJECT_FILE_EXTENSION;
    }

    std::string JobSubmitter::generateJobId() {
        static thread_local boost::uuids::random_generator generator;
        return boost::uuids::to_string(generator());
    }

    std::string JobSubmitter::submit(const std::string &filePath, const std::string &printName) {
        std::lock_guard<std::mutex> lock(submitMutex_);

        std::error_code ec;
        if (!std::filesystem::is_regular_file(filePath, ec)) {
            throw NotFoundException(filePath);
        }

        const auto &config = link_->config();
        if (!config.isComplete()) {
            throw ConfigurationException("Cannot submit " + printName + ": printer link not configured");
        }

        models::PrintJob job;
        job.filePath = filePath;
        job.printName = printName;
        job.remoteFileName = remoteFileName(printName);
        job.submittedAt = std::chrono::system_clock::now();

        transfer_->upload(filePath, job.remoteFileName);

        // the file is on the printer from here on, failures below are not rolled back
        link_->connect();

        job.jobId = generateJobId();
        link_->publish(models::DeviceCommand::projectFile(job.remoteFileName, job.jobId, config.userTag));

        Logger::logInfo("[JobSubmitter] Submitted job: " + job.toJson().dump());
        return job.jobId;
    }
} // namespace core::job
