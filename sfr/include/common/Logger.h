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

#pragma once

#include "common/ILoggerBackend.h"
#include <format>
#include <memory>
#include <source_location>
#include <string>

namespace SFR {

/**
 * @brief Centralized logging facade with dependency injection support
 *
 * 1. Default mode: built-in backend (spdlog if available, DefaultBackend otherwise)
 * 2. Custom mode: an injected ILoggerBackend
 *
 * Thread-safe: backend replacement is guarded, logging is delegated to the
 * backend which must itself be thread-safe.
 *
 * @code
 * SFR::Logger::initialize();
 * LOG_INFO("Flow started with {} workers", workers);
 * @endcode
 */
class Logger {
public:
    /**
     * @brief Inject custom logger backend
     *
     * @param backend User's logger backend (ownership transferred)
     */
    static void setBackend(std::unique_ptr<ILoggerBackend> backend);

    /**
     * @brief Initialize default logger (stdout, no file)
     *
     * Creates default backend if no custom backend was injected.
     */
    static void initialize();

    /**
     * @brief Replace the built-in backend with one that also writes logDir/flow.log
     *
     * Works whether or not a built-in backend already exists. An injected
     * backend is left in place.
     *
     * @return false if file output could not be enabled (empty logDir,
     *         injected backend, or built without spdlog)
     */
    static bool enableFileOutput(const std::string &logDir);

    static void setLevel(LogLevel level);

    static void trace(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void debug(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void info(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void warn(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void error(const std::string &message, const std::source_location &loc = std::source_location::current());

    static void flush();

private:
    static std::shared_ptr<ILoggerBackend> backend();
    static void write(LogLevel level, const std::string &message, const std::source_location &loc);
    static std::string extractCleanFunctionName(const std::source_location &loc);
};

}  // namespace SFR

// std::format based macros with source_location capture
#define LOG_TRACE(...) SFR::Logger::trace(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_DEBUG(...) SFR::Logger::debug(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_INFO(...) SFR::Logger::info(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_WARN(...) SFR::Logger::warn(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_ERROR(...) SFR::Logger::error(std::format(__VA_ARGS__), std::source_location::current())
