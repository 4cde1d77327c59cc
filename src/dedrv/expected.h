#pragma once

/// @file expected.h
/// @brief expected<T, E> for error handling without exceptions
///
/// Modeled after C++23's std::expected. E is a plain value type (an enum, or
/// a struct carrying the details of a failure) and is stored inline.
///
/// Example:
/// @code
/// expected<int, DriverError> readRegister(u8 reg) {
///     if (reg > 0x7f) {
///         return expected<int, DriverError>::failure(DriverError::INVALID_ARGUMENT, "no such register");
///     }
///     return expected<int, DriverError>::success(0x42);
/// }
/// @endcode

#include "dedrv/type_traits.h"

namespace dedrv {

template<typename T, typename E> class expected;

/// @brief expected type for operations that can fail
/// @tparam T The type of the successful value (default constructible)
/// @tparam E The type of the error
template<typename T, typename E>
class expected {
public:
    /// @brief Check if operation succeeded
    bool ok() const { return mOk; }

    /// @brief Get error (only meaningful if !ok())
    const E& error() const { return mError; }

    /// @brief Get the static message attached to the failure, "" if none
    const char* message() const { return mMessage ? mMessage : ""; }

    /// @warning Unspecified value if called when !ok()
    T& value() { return mValue; }
    const T& value() const { return mValue; }

    explicit operator bool() const { return ok(); }

    static expected success(T value) {
        expected r;
        r.mOk = true;
        r.mValue = dedrv::move(value);
        return r;
    }

    /// @param msg must outlive the result (a string literal)
    static expected failure(const E& err, const char* msg = nullptr) {
        expected r;
        r.mOk = false;
        r.mError = err;
        r.mMessage = msg;
        return r;
    }

    /// @brief Default constructor (creates error state)
    expected() : mValue(), mError(), mMessage(nullptr), mOk(false) {}

private:
    T mValue;
    E mError;
    const char* mMessage;
    bool mOk;
};

/// @brief Specialization for void (no value to return)
template<typename E>
class expected<void, E> {
public:
    bool ok() const { return mOk; }

    const E& error() const { return mError; }

    const char* message() const { return mMessage ? mMessage : ""; }

    explicit operator bool() const { return ok(); }

    static expected success() {
        expected r;
        r.mOk = true;
        return r;
    }

    static expected failure(const E& err, const char* msg = nullptr) {
        expected r;
        r.mOk = false;
        r.mError = err;
        r.mMessage = msg;
        return r;
    }

    /// @brief Default constructor (creates error state)
    expected() : mError(), mMessage(nullptr), mOk(false) {}

private:
    E mError;
    const char* mMessage;
    bool mOk;
};

} // namespace dedrv
