// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "pipeline/stage.h"

#include <stdexcept>

namespace dualpipe {

OverlapResult IStage::forward_backward(const OverlapRequest&, WeightGradStore&) {
    throw std::logic_error("This stage does not implement overlapped forward/backward");
}

} // namespace dualpipe
