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

#include <source_location>
#include <string>

namespace SFR {

// Ordered by severity; a backend drops messages below its configured level
enum class LogLevel { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Critical = 5, Off = 6 };

/**
 * @brief Destination for Logger output
 *
 * Replace the default (spdlog or stdout) backend to send flow diagnostics
 * into the host application's own logging:
 *
 * @code
 * class BotLogBackend : public SFR::ILoggerBackend {
 * public:
 *     void log(SFR::LogLevel level, const std::string &message, const std::source_location &loc) override {
 *         journal_.append(SFR::toString(level), message, loc.file_name(), loc.line());
 *     }
 *     void setLevel(SFR::LogLevel level) override { journal_.setThreshold(level); }
 *     void flush() override { journal_.sync(); }
 * };
 *
 * SFR::Logger::setBackend(std::make_unique<BotLogBackend>());
 * @endcode
 *
 * Implementations must be thread-safe: pipelines log from executor threads.
 */
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    /**
     * @param message Already formatted, prefixed with the calling function
     */
    virtual void log(LogLevel level, const std::string &message, const std::source_location &loc) = 0;

    virtual void setLevel(LogLevel level) = 0;

    virtual void flush() = 0;
};

/**
 * @brief Lower-case level name ("trace" ... "off")
 */
const char *toString(LogLevel level);

/**
 * @brief Case-insensitive inverse of toString(); also accepts "warning" and "err"
 *
 * @return Parsed level, or fallback if the text names no level
 */
LogLevel parseLogLevel(const std::string &text, LogLevel fallback);

}  // namespace SFR
