// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef DUALPIPE_SRC_UTILITIES_DTYPE_H
#define DUALPIPE_SRC_UTILITIES_DTYPE_H

#include <cstddef>
#include <cstdint>
#include <string_view>

//! Element types that can travel between pipeline stages.
enum class ETensorDType : int {
    FP32,
    FP64,
    INT32,
    INT64,
    BYTE
};

[[nodiscard]] constexpr std::size_t get_dtype_size(ETensorDType dtype) {
    switch (dtype) {
    case ETensorDType::FP32:
    case ETensorDType::INT32:
        return 4;
    case ETensorDType::FP64:
    case ETensorDType::INT64:
        return 8;
    case ETensorDType::BYTE:
        return 1;
    }
    return 0;
}

const char* dtype_to_str(ETensorDType dtype);

//! Parses a dtype name (case-insensitive, e.g. "fp32", "float32", "int64").
//! Throws std::runtime_error for unknown names.
ETensorDType dtype_from_str(std::string_view dtype);

template<class T>
constexpr ETensorDType unsupported_dtype() {
    static_assert(sizeof(T) == 0, "No tensor dtype for this element type");
    return ETensorDType::BYTE;
}

template<class T>
inline constexpr ETensorDType dtype_from_type = unsupported_dtype<T>();

template<> inline constexpr ETensorDType dtype_from_type<float> = ETensorDType::FP32;
template<> inline constexpr ETensorDType dtype_from_type<double> = ETensorDType::FP64;
template<> inline constexpr ETensorDType dtype_from_type<std::int32_t> = ETensorDType::INT32;
template<> inline constexpr ETensorDType dtype_from_type<std::int64_t> = ETensorDType::INT64;
template<> inline constexpr ETensorDType dtype_from_type<std::byte> = ETensorDType::BYTE;

#endif //DUALPIPE_SRC_UTILITIES_DTYPE_H
