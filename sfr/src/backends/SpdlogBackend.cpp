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
#include "backends/SpdlogBackend.h"
#include <cstdlib>
#include <filesystem>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace SFR {

SpdlogBackend::SpdlogBackend(const std::string &logDir, bool logToFile) {
    std::vector<spdlog::sink_ptr> sinks;

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%t] %v");
    sinks.push_back(consoleSink);

    if (logToFile && !logDir.empty()) {
        std::filesystem::create_directories(logDir);
        std::filesystem::path logPath = std::filesystem::path(logDir) / "flow.log";

        auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logPath.string(), true);
        fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
        sinks.push_back(fileSink);
    }

    // Not registered globally: Logger may replace backends (tests do) without name clashes
    logger_ = std::make_shared<spdlog::logger>("SFR", sinks.begin(), sinks.end());
    logger_->set_level(spdlog::level::debug);

    const char *envLevel = std::getenv("SPDLOG_LEVEL");
    if (envLevel) {
        logger_->set_level(toSpdlog(parseLogLevel(envLevel, LogLevel::Debug)));
    }
}

void SpdlogBackend::log(LogLevel level, const std::string &message, const std::source_location &loc) {
    spdlog::source_loc where{loc.file_name(), static_cast<int>(loc.line()), loc.function_name()};
    logger_->log(where, toSpdlog(level), message);
}

void SpdlogBackend::setLevel(LogLevel level) {
    logger_->set_level(toSpdlog(level));
}

void SpdlogBackend::flush() {
    logger_->flush();
}

spdlog::level::level_enum SpdlogBackend::toSpdlog(LogLevel level) {
    // LogLevel mirrors spdlog's ordering one to one
    return static_cast<spdlog::level::level_enum>(static_cast<int>(level));
}

}  // namespace SFR
