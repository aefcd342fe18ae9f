// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "dtype.h"

#include <stdexcept>
#include <string>

#include <fmt/core.h>

#include "utils.h"

const char* dtype_to_str(ETensorDType dtype) {
    switch (dtype) {
    case ETensorDType::FP32: return "fp32";
    case ETensorDType::FP64: return "fp64";
    case ETensorDType::INT32: return "int32";
    case ETensorDType::INT64: return "int64";
    case ETensorDType::BYTE: return "byte";
    }
    throw std::logic_error(fmt::format("dtype_to_str: invalid dtype {}", static_cast<int>(dtype)));
}

ETensorDType dtype_from_str(std::string_view dtype) {
    if (iequals(dtype, "fp32") || iequals(dtype, "float32") || iequals(dtype, "float")) {
        return ETensorDType::FP32;
    }
    if (iequals(dtype, "fp64") || iequals(dtype, "float64") || iequals(dtype, "double")) {
        return ETensorDType::FP64;
    }
    if (iequals(dtype, "int32")) return ETensorDType::INT32;
    if (iequals(dtype, "int64")) return ETensorDType::INT64;
    if (iequals(dtype, "byte") || iequals(dtype, "uint8")) return ETensorDType::BYTE;
    throw std::runtime_error(fmt::format("Unknown dtype: {}", dtype));
}
