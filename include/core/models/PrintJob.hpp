#pragma once

#include "core/utils/Time.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <string>

namespace core::models {

    /**
     * @brief One submission. Lives only for the duration of JobSubmitter::submit().
     */
    struct PrintJob {
        std::string jobId;
        std::string filePath;
        std::string printName;
        std::string remoteFileName;
        std::chrono::system_clock::time_point submittedAt;

        nlohmann::json toJson() const {
            return nlohmann::json{
                {"job_id", jobId},
                {"file_path", filePath},
                {"print_name", printName},
                {"remote_file", remoteFileName},
                {"submitted_at", utils::toIsoString(submittedAt)}
            };
        }
    };

} // namespace core::models
