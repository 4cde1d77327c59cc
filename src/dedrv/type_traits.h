#pragma once

/*
Minimal trait set for targets that ship without a usable <type_traits>
(avr-gcc, some vendor toolchains). Only what dedrv itself needs: the
tag types behind is_device/implements, declval for the SFINAE'd
with() helpers, and the layout checks on Descriptor and FixedVector.
*/

#include "dedrv/stdint.h"

namespace dedrv { // mandatory namespace to prevent name collision with
                  // std::integral_constant.

// Using enum instead of static constexpr to avoid ODR-use issues in C++11
template <typename T, T v>
struct integral_constant {
    enum : T { value = v };
    using value_type = T;
    using type = integral_constant;
    constexpr operator value_type() const noexcept { return value; }
};

using true_type = integral_constant<bool, true>;
using false_type = integral_constant<bool, false>;

template <typename T> struct remove_reference { using type = T; };
template <typename T> struct remove_reference<T &> { using type = T; };
template <typename T> struct remove_reference<T &&> { using type = T; };

template <typename T>
constexpr typename remove_reference<T>::type &&move(T &&t) noexcept {
    return static_cast<typename remove_reference<T>::type &&>(t);
}

template <typename T> struct add_rvalue_reference { using type = T &&; };
template <typename T> struct add_rvalue_reference<T &> { using type = T &; };

template <typename T>
typename add_rvalue_reference<T>::type declval() noexcept;

// GCC and Clang both provide these as intrinsics.
template <typename T> struct is_empty {
    enum : bool { value = __is_empty(T) };
};

template <typename T> struct is_standard_layout {
    enum : bool { value = __is_standard_layout(T) };
};

template <typename T> struct is_trivially_destructible {
#if defined(__clang__)
    enum : bool { value = __is_trivially_destructible(T) };
#else
    enum : bool { value = __has_trivial_destructor(T) };
#endif
};

} // namespace dedrv
