#pragma once

#include "common/ILoggerBackend.h"
#include <cstddef>
#include <nlohmann/json.hpp>
#include <string>

namespace SFR {

using json = nlohmann::json;

/**
 * @brief Runtime options of a flow, loadable from JSON
 *
 * @code
 * {
 *   "allowUnlockedRendering": true,
 *   "workerThreads": 4,
 *   "logging": { "level": "info", "dir": "/var/log/bot", "toFile": true }
 * }
 * @endcode
 *
 * Every key is optional. workerThreads == 0 selects the inline executor.
 */
struct FlowOptions {
    bool allowUnlockedRendering = false;
    size_t workerThreads = 0;
    LogLevel logLevel = LogLevel::Info;
    std::string logDir;
    bool logToFile = false;

    /**
     * @brief Parse options from JSON text
     * @throws FlowConfigurationError on malformed JSON or mistyped values
     */
    static FlowOptions fromJson(const std::string &text);

    /**
     * @brief Parse options from a JSON file
     * @throws FlowConfigurationError if the file cannot be read or parsed
     */
    static FlowOptions fromFile(const std::string &path);

    static FlowOptions fromJsonObject(const json &object);

    json toJson() const;

    /**
     * @brief Initialize the logger (file sink, level) according to these options
     *
     * A file sink is added even if logging already started on the console.
     * @throws FlowConfigurationError if the log directory cannot be created
     */
    void applyLogging() const;
};

}  // namespace SFR
