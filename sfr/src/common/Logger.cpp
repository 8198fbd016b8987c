// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-SFR-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of SFR (Session Flow Runtime).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)
//
// Commercial License:
//   Individual: $100 cumulative
//   Enterprise: $500 cumulative
//   Contact: https://github.com/newmassrael
//
// Full terms: https://github.com/newmassrael/scxml-core-engine/blob/main/LICENSE
#include "common/Logger.h"

#ifdef SFR_USE_SPDLOG
#include "backends/SpdlogBackend.h"
#else
#include "backends/DefaultBackend.h"
#endif

#include <algorithm>
#include <cctype>
#include <mutex>

namespace SFR {

namespace {
std::mutex backendMutex;
std::shared_ptr<ILoggerBackend> currentBackend;
// Set while the backend came from setBackend() rather than from us
bool injectedBackend = false;

std::shared_ptr<ILoggerBackend> makeDefaultBackend() {
#ifdef SFR_USE_SPDLOG
    return std::make_shared<SpdlogBackend>("", false);
#else
    return std::make_shared<DefaultBackend>();
#endif
}
}  // namespace

const char *toString(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "trace";
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Info:
        return "info";
    case LogLevel::Warn:
        return "warn";
    case LogLevel::Error:
        return "error";
    case LogLevel::Critical:
        return "critical";
    case LogLevel::Off:
        return "off";
    }
    return "unknown";
}

LogLevel parseLogLevel(const std::string &text, LogLevel fallback) {
    std::string level = text;
    std::transform(level.begin(), level.end(), level.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (level == "trace") {
        return LogLevel::Trace;
    } else if (level == "debug") {
        return LogLevel::Debug;
    } else if (level == "info") {
        return LogLevel::Info;
    } else if (level == "warn" || level == "warning") {
        return LogLevel::Warn;
    } else if (level == "err" || level == "error") {
        return LogLevel::Error;
    } else if (level == "critical") {
        return LogLevel::Critical;
    } else if (level == "off") {
        return LogLevel::Off;
    }
    return fallback;
}

void Logger::setBackend(std::unique_ptr<ILoggerBackend> backend) {
    std::lock_guard<std::mutex> lock(backendMutex);
    injectedBackend = backend != nullptr;
    currentBackend = std::move(backend);
}

void Logger::initialize() {
    std::lock_guard<std::mutex> lock(backendMutex);
    if (!currentBackend) {
        currentBackend = makeDefaultBackend();
    }
}

bool Logger::enableFileOutput(const std::string &logDir) {
#ifdef SFR_USE_SPDLOG
    if (logDir.empty()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(backendMutex);
    if (injectedBackend) {
        return false;
    }
    currentBackend = std::make_shared<SpdlogBackend>(logDir, true);
    return true;
#else
    // DefaultBackend doesn't support file logging
    (void)logDir;
    return false;
#endif
}

void Logger::setLevel(LogLevel level) {
    backend()->setLevel(level);
}

void Logger::trace(const std::string &message, const std::source_location &loc) {
    write(LogLevel::Trace, message, loc);
}

void Logger::debug(const std::string &message, const std::source_location &loc) {
    write(LogLevel::Debug, message, loc);
}

void Logger::info(const std::string &message, const std::source_location &loc) {
    write(LogLevel::Info, message, loc);
}

void Logger::warn(const std::string &message, const std::source_location &loc) {
    write(LogLevel::Warn, message, loc);
}

void Logger::error(const std::string &message, const std::source_location &loc) {
    write(LogLevel::Error, message, loc);
}

void Logger::flush() {
    backend()->flush();
}

std::shared_ptr<ILoggerBackend> Logger::backend() {
    std::lock_guard<std::mutex> lock(backendMutex);
    if (!currentBackend) {
        currentBackend = makeDefaultBackend();
    }
    return currentBackend;
}

void Logger::write(LogLevel level, const std::string &message, const std::source_location &loc) {
    // Hold a reference so a concurrent setBackend() cannot destroy the backend mid-call
    auto target = backend();
    target->log(level, extractCleanFunctionName(loc) + "() - " + message, loc);
}

std::string Logger::extractCleanFunctionName(const std::source_location &loc) {
    std::string fullName = loc.function_name();

    size_t parenPos = fullName.find('(');
    if (parenPos == std::string::npos) {
        return "UnknownFunction";
    }

    size_t nameEnd = parenPos;
    while (nameEnd > 0 && (std::isspace(static_cast<unsigned char>(fullName[nameEnd - 1])) ||
                           fullName[nameEnd - 1] == ')')) {
        nameEnd--;
    }

    // Last space outside template/parameter brackets separates the return type
    size_t nameStart = 0;
    size_t spacePos = std::string::npos;
    int angleDepth = 0;
    int parenDepth = 0;
    for (size_t i = 0; i < nameEnd; i++) {
        char c = fullName[i];
        if (c == '<') {
            angleDepth++;
        } else if (c == '>') {
            angleDepth--;
        } else if (c == '(') {
            parenDepth++;
        } else if (c == ')') {
            parenDepth--;
        } else if (c == ' ' && angleDepth == 0 && parenDepth == 0) {
            spacePos = i;
        }
    }

    if (spacePos != std::string::npos) {
        nameStart = spacePos + 1;
    }

    std::string qualified = fullName.substr(nameStart, nameEnd - nameStart);
    while (!qualified.empty() &&
           (std::isspace(static_cast<unsigned char>(qualified[0])) || qualified[0] == '*' || qualified[0] == '&')) {
        qualified.erase(0, 1);
    }

    // Strip template arguments: Flow<ConsoleRenderer>::onLoaded -> Flow::onLoaded
    std::string result;
    int depth = 0;
    for (char c : qualified) {
        if (c == '<') {
            depth++;
        } else if (c == '>') {
            depth--;
        } else if (depth == 0) {
            result += c;
        }
    }

    while (!result.empty() && std::isspace(static_cast<unsigned char>(result.back()))) {
        result.pop_back();
    }

    return result.empty() ? "UnknownFunction" : result;
}

}  // namespace SFR
