#pragma once

#include "DeviceMessage.hpp"
#include <string>

namespace core::models {

    /**
     * @brief Command published on device/{serial}/request.
     *
     * Wire form: {"print": {"command": ..., "param": ..., "sequence_id": ..., "user_id": ...}}
     */
    class DeviceCommand : public DeviceMessage {
    public:
        static constexpr const char *PROJECT_FILE = "project_file";

        std::string command;
        std::string param;
        std::string sequenceId;
        std::string userId;

        DeviceCommand() = default;

        DeviceCommand(const std::string &command, const std::string &param,
                      const std::string &sequenceId, const std::string &userId)
            : command(command), param(param), sequenceId(sequenceId), userId(userId) {
        }

        explicit DeviceCommand(const nlohmann::json &json) { fromJson(json); }

        static DeviceCommand projectFile(const std::string &remoteFileName, const std::string &jobId,
                                         const std::string &userId) {
            return DeviceCommand(PROJECT_FILE, remoteFileName, jobId, userId);
        }

        nlohmann::json toJson() const override {
            return nlohmann::json{
                {
                    "print", {
                        {"command", command},
                        {"param", param},
                        {"sequence_id", sequenceId},
                        {"user_id", userId}
                    }
                }
            };
        }

        void fromJson(const nlohmann::json &json) override {
            const auto &print = json.at("print");
            command = print.at("command").get<std::string>();

            if (print.contains("param") && !print["param"].is_null()) {
                param = print["param"].get<std::string>();
            }
            if (print.contains("sequence_id") && !print["sequence_id"].is_null()) {
                sequenceId = print["sequence_id"].get<std::string>();
            }
            if (print.contains("user_id") && !print["user_id"].is_null()) {
                userId = print["user_id"].get<std::string>();
            }
        }

        bool isValid() const override {
            return !command.empty() && !sequenceId.empty();
        }

        std::string getTypeName() const override {
            return "DeviceCommand";
        }
    };

} // namespace core::models
