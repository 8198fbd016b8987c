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
#include <iostream>
#include <mutex>
#include <ostream>
#include <string>

namespace SFR {

/**
 * @brief Dependency-free backend used when SFR is built without spdlog
 *
 * One line per message: time, level, thread, message. Honours SPDLOG_LEVEL
 * like the spdlog backend does.
 */
class DefaultBackend : public ILoggerBackend {
public:
    /**
     * @param out Stream to write to; must outlive the backend
     * @param colored Wrap the level in ANSI colors
     */
    explicit DefaultBackend(std::ostream &out = std::cout, bool colored = true);

    void log(LogLevel level, const std::string &message, const std::source_location &loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    static std::string timestamp();

    std::ostream &out_;
    bool colored_;
    LogLevel threshold_;
    std::mutex mutex_;
};

}  // namespace SFR
