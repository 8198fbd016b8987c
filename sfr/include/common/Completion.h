#pragma once

#include <exception>
#include <functional>
#include <optional>
#include <stdexcept>
#include <utility>

namespace SFR {

/**
 * @brief Completion of an asynchronous operation without a value
 *
 * Invoked exactly once, with a null pointer on success or the error otherwise.
 * May be invoked on any thread, synchronously or later.
 */
using Completion = std::function<void(std::exception_ptr)>;

/**
 * @brief Outcome of an asynchronous stage producing a value
 */
template <typename T> class StageResult {
public:
    static StageResult createSuccess(T value) {
        StageResult result;
        result.value_ = std::move(value);
        return result;
    }

    static StageResult createError(std::exception_ptr error) {
        StageResult result;
        result.error_ = error ? error : std::make_exception_ptr(std::runtime_error("unspecified stage error"));
        return result;
    }

    bool isSuccess() const {
        return !error_;
    }

    bool isError() const {
        return static_cast<bool>(error_);
    }

    const T &getValue() const {
        if (error_) {
            std::rethrow_exception(error_);
        }
        return *value_;
    }

    T &&takeValue() {
        if (error_) {
            std::rethrow_exception(error_);
        }
        return std::move(*value_);
    }

    std::exception_ptr getError() const {
        return error_;
    }

private:
    StageResult() = default;

    std::optional<T> value_;
    std::exception_ptr error_;
};

template <typename T> using ResultCallback = std::function<void(StageResult<T>)>;

}  // namespace SFR
