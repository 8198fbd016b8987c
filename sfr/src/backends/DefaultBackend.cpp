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
#include "backends/DefaultBackend.h"
#include <array>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <format>
#include <thread>

namespace SFR {

namespace {

// Indexed by LogLevel
constexpr std::array<const char *, 7> LEVEL_COLORS = {
    "\033[37m",  // trace
    "\033[36m",  // debug
    "\033[32m",  // info
    "\033[33m",  // warn
    "\033[31m",  // error
    "\033[35m",  // critical
    "",          // off
};
constexpr const char *COLOR_RESET = "\033[0m";

}  // namespace

DefaultBackend::DefaultBackend(std::ostream &out, bool colored)
    : out_(out), colored_(colored), threshold_(LogLevel::Debug) {
    if (const char *envLevel = std::getenv("SPDLOG_LEVEL")) {
        threshold_ = parseLogLevel(envLevel, LogLevel::Debug);
    }
}

void DefaultBackend::log(LogLevel level, const std::string &message, const std::source_location &) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < threshold_ || level == LogLevel::Off) {
        return;
    }

    out_ << '[' << timestamp() << "] [";
    if (colored_) {
        out_ << LEVEL_COLORS[static_cast<size_t>(level)] << toString(level) << COLOR_RESET;
    } else {
        out_ << toString(level);
    }
    out_ << "] [" << std::this_thread::get_id() << "] " << message << '\n';
}

void DefaultBackend::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    threshold_ = level;
}

void DefaultBackend::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    out_.flush();
}

std::string DefaultBackend::timestamp() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t seconds = system_clock::to_time_t(now);
    auto millis = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &seconds);
#else
    localtime_r(&seconds, &local);
#endif

    return std::format("{:02d}:{:02d}:{:02d}.{:03d}", local.tm_hour, local.tm_min, local.tm_sec,
                       static_cast<int>(millis));
}

}  // namespace SFR
