#include "common/FlowOptions.h"
#include "common/FlowErrors.h"
#include "common/Logger.h"
#include <fstream>
#include <sstream>

namespace SFR {

FlowOptions FlowOptions::fromJson(const std::string &text) {
    json parsed;
    try {
        parsed = json::parse(text);
    } catch (const json::parse_error &e) {
        throw FlowConfigurationError(std::string("Invalid flow options JSON: ") + e.what());
    }
    return fromJsonObject(parsed);
}

FlowOptions FlowOptions::fromFile(const std::string &path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw FlowConfigurationError("Cannot open flow options file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return fromJson(buffer.str());
}

FlowOptions FlowOptions::fromJsonObject(const json &object) {
    if (!object.is_object()) {
        throw FlowConfigurationError("Flow options must be a JSON object");
    }

    FlowOptions options;
    try {
        options.allowUnlockedRendering = object.value("allowUnlockedRendering", options.allowUnlockedRendering);

        if (object.contains("workerThreads")) {
            const auto &workers = object.at("workerThreads");
            if (!workers.is_number_unsigned()) {
                throw FlowConfigurationError("workerThreads must be a non-negative integer");
            }
            options.workerThreads = workers.get<size_t>();
        }

        if (object.contains("logging")) {
            const auto &logging = object.at("logging");
            if (!logging.is_object()) {
                throw FlowConfigurationError("logging must be a JSON object");
            }
            if (logging.contains("level")) {
                auto levelText = logging.at("level").get<std::string>();
                // Two different fallbacks only agree when the text names a real level
                options.logLevel = parseLogLevel(levelText, LogLevel::Trace);
                if (options.logLevel != parseLogLevel(levelText, LogLevel::Off)) {
                    throw FlowConfigurationError("Unknown log level: " + levelText);
                }
            }
            options.logDir = logging.value("dir", options.logDir);
            options.logToFile = logging.value("toFile", options.logToFile);
        }
    } catch (const json::type_error &e) {
        throw FlowConfigurationError(std::string("Mistyped flow option: ") + e.what());
    }

    return options;
}

json FlowOptions::toJson() const {
    return json{{"allowUnlockedRendering", allowUnlockedRendering},
                {"workerThreads", workerThreads},
                {"logging", {{"level", toString(logLevel)}, {"dir", logDir}, {"toFile", logToFile}}}};
}

void FlowOptions::applyLogging() const {
    if (logToFile) {
        bool enabled = false;
        try {
            enabled = Logger::enableFileOutput(logDir);
        } catch (const std::exception &e) {
            throw FlowConfigurationError("Cannot log to directory '" + logDir + "': " + e.what());
        }
        if (!enabled) {
            LOG_WARN("Flow options: file logging to '{}' is not available with the current logger backend", logDir);
        }
    } else {
        Logger::initialize();
    }
    Logger::setLevel(logLevel);
    LOG_DEBUG("Flow options applied: {}", toJson().dump());
}

}  // namespace SFR
