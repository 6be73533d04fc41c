#pragma once

#include "ecp/core/Expected.hpp"

#include <system_error>
#include <utility>

namespace ecp {

/**
 * @brief How a client reacts to a failed network call.
 *
 * - `Lenient` (default): the failure is logged and swallowed. The call still
 *   returns a value (empty, or whatever was gathered before the failure).
 * - `Strict`: the failure is surfaced as an error.
 */
enum class ErrorPolicy {
    Lenient,
    Strict
};

enum class OutcomeKind {
    Ok,       ///< Everything succeeded.
    EmptyOk,  ///< A failure was swallowed; value may be empty or partial.
    Error     ///< The call failed; no value.
};

/**
 * @brief Result of a public operation.
 *
 * Unlike `expected<T>`, an `EmptyOk` outcome carries both a (possibly partial)
 * value and the error that was swallowed, so lenient callers can keep going
 * and diagnostic callers can still look at what went wrong.
 */
template <typename T>
class Outcome {
public:
    static Outcome ok(T value) {
        return Outcome(OutcomeKind::Ok, std::move(value), {});
    }

    static Outcome swallowed(T partial, std::error_code error) {
        return Outcome(OutcomeKind::EmptyOk, std::move(partial), error);
    }

    static Outcome failed(std::error_code error) {
        return Outcome(OutcomeKind::Error, T{}, error);
    }

    /// Pick `swallowed` or `failed` according to @p policy.
    static Outcome fromFailure(ErrorPolicy policy, T partial, std::error_code error) {
        if (policy == ErrorPolicy::Strict) {
            return failed(error);
        }
        return swallowed(std::move(partial), error);
    }

    OutcomeKind kind() const noexcept { return kind_; }
    bool isOk() const noexcept { return kind_ == OutcomeKind::Ok; }
    bool isEmptyOk() const noexcept { return kind_ == OutcomeKind::EmptyOk; }
    bool isError() const noexcept { return kind_ == OutcomeKind::Error; }

    /// True unless the outcome is an error.
    explicit operator bool() const noexcept { return kind_ != OutcomeKind::Error; }

    /// The value. For `Error` outcomes this is a default-constructed `T`.
    const T& value() const& noexcept { return value_; }
    T&& value() && noexcept { return std::move(value_); }

    /// The swallowed (`EmptyOk`) or reported (`Error`) error; empty for `Ok`.
    std::error_code error() const noexcept { return error_; }

    expected<T> toExpected() const {
        if (kind_ == OutcomeKind::Error) {
            return unexpected(error_);
        }
        return value_;
    }

private:
    Outcome(OutcomeKind kind, T value, std::error_code error)
    : kind_(kind)
    , value_(std::move(value))
    , error_(error)
    {}

    OutcomeKind kind_;
    T value_;
    std::error_code error_;
};

} // namespace ecp
