#include "common/FlowErrors.h"

namespace SFR {

const char *toString(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::LockAcquisition:
        return "LockAcquisitionFailure";
    case ErrorKind::StateLoad:
        return "StateLoadFailure";
    case ErrorKind::Dispatch:
        return "DispatchFailure";
    case ErrorKind::Transition:
        return "TransitionFailure";
    case ErrorKind::ViewBinding:
        return "ViewBindingFailure";
    case ErrorKind::Store:
        return "StoreFailure";
    case ErrorKind::Render:
        return "RenderFailure";
    case ErrorKind::FailureRender:
        return "FailureRenderFailure";
    case ErrorKind::Submission:
        return "SubmissionFailure";
    default:
        return "UnknownFailure";
    }
}

FlowException::FlowException(ErrorKind kind, const std::string &message, std::exception_ptr cause)
    : std::runtime_error(message), kind_(kind), cause_(std::move(cause)) {}

std::exception_ptr FlowException::wrap(ErrorKind kind, std::exception_ptr error) {
    if (!error) {
        return std::make_exception_ptr(FlowException(kind, toString(kind)));
    }

    try {
        std::rethrow_exception(error);
    } catch (const FlowException &) {
        return error;
    } catch (...) {
        // The original error stays reachable as the cause
        return std::make_exception_ptr(FlowException(kind, toString(kind), error));
    }
}

ErrorKind FlowException::kindOf(std::exception_ptr error, ErrorKind fallback) {
    if (!error) {
        return fallback;
    }

    try {
        std::rethrow_exception(error);
    } catch (const FlowException &e) {
        return e.getKind();
    } catch (...) {
        return fallback;
    }
}

std::string describeException(std::exception_ptr error) {
    std::string description;
    int depth = 0;

    while (error && depth < 8) {
        if (depth > 0) {
            description += "; caused by: ";
        }

        std::exception_ptr next;
        try {
            std::rethrow_exception(error);
        } catch (const FlowException &e) {
            description += e.what();
            next = e.getCause();
        } catch (const std::exception &e) {
            description += e.what();
        } catch (...) {
            description += "unknown exception";
        }

        error = next;
        depth++;
    }

    return description.empty() ? "no error" : description;
}

}  // namespace SFR
