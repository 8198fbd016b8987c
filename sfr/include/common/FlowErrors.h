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

#include <exception>
#include <stdexcept>
#include <string>

namespace SFR {

/**
 * @brief Failure taxonomy of the event pipeline
 *
 * Each kind names the pipeline stage at whose boundary the failure was caught.
 */
enum class ErrorKind {
    LockAcquisition,  // session lock could not be taken
    StateLoad,        // (state, vars) could not be read from storage
    Dispatch,         // no controller resolves for (event type, state)
    Transition,       // controller failed to produce a new state
    ViewBinding,      // no view resolves for the new state's type
    Store,            // new (state, vars) could not be persisted
    Render,           // bound view failed
    FailureRender,    // failure view itself failed
    Submission        // executor rejected the event
};

const char *toString(ErrorKind kind);

/**
 * @brief Exception carried through the failure path of the pipeline
 *
 * Wraps the original cause (if any) so the failure view and the logs can see
 * both the stage that failed and the collaborator's own error.
 */
class FlowException : public std::runtime_error {
public:
    FlowException(ErrorKind kind, const std::string &message, std::exception_ptr cause = nullptr);

    ErrorKind getKind() const {
        return kind_;
    }

    std::exception_ptr getCause() const {
        return cause_;
    }

    /**
     * @brief Attach a stage to an arbitrary error
     *
     * Errors that already are FlowException keep their original kind, so a
     * dispatch failure raised inside the registry is not relabelled.
     */
    static std::exception_ptr wrap(ErrorKind kind, std::exception_ptr error);

    /**
     * @brief Kind of a wrapped error, or fallback if it is not a FlowException
     */
    static ErrorKind kindOf(std::exception_ptr error, ErrorKind fallback);

private:
    ErrorKind kind_;
    std::exception_ptr cause_;
};

/**
 * @brief Raised at build time for incomplete or inconsistent configuration
 */
class FlowConfigurationError : public std::invalid_argument {
public:
    explicit FlowConfigurationError(const std::string &message) : std::invalid_argument(message) {}
};

/**
 * @brief Render an exception (and its cause chain) for logs
 */
std::string describeException(std::exception_ptr error);

}  // namespace SFR
