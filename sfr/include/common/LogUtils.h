#pragma once

#include <string>

namespace SFR {
namespace Log {

/**
 * @brief Sanitize string for safe logging (prevent log injection)
 *
 * Event and state descriptions come from user input (chat messages etc.):
 * - '\n' -> "\\n"
 * - '\r' -> "\\r"
 * - Other control chars -> '?'
 * - Printable ASCII (32-126) preserved as-is
 */
inline std::string sanitize(const std::string &input) {
    std::string sanitized;
    sanitized.reserve(input.length());

    for (char c : input) {
        if (c == '\n') {
            sanitized += "\\n";
        } else if (c == '\r') {
            sanitized += "\\r";
        } else if (c >= 32 && c < 127) {
            sanitized += c;
        } else {
            sanitized += '?';
        }
    }

    return sanitized;
}

}  // namespace Log
}  // namespace SFR
