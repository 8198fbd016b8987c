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
#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace SFR {

/**
 * @brief Backend writing through a private spdlog logger
 *
 * Sinks: colored console always, plus <logDir>/flow.log when logToFile is set.
 * The initial level comes from SPDLOG_LEVEL if present, debug otherwise.
 */
class SpdlogBackend : public ILoggerBackend {
public:
    explicit SpdlogBackend(const std::string &logDir = "", bool logToFile = false);

    void log(LogLevel level, const std::string &message, const std::source_location &loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

    const std::shared_ptr<spdlog::logger> &getLogger() const {
        return logger_;
    }

private:
    static spdlog::level::level_enum toSpdlog(LogLevel level);

    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace SFR
