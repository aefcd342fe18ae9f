// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "tensor.h"

#include <algorithm>
#include <cstring>

#include <fmt/core.h>
#include <fmt/ranges.h>

/**
 * @brief Allocate a zero-initialized host tensor.
 *
 * @param dtype  Element type.
 * @param shape  Tensor shape; at most MAX_TENSOR_DIM dimensions, all non-negative.
 * @return Tensor that owns its storage and covers all of it.
 *
 * @throws std::runtime_error if the rank is too large or a dimension is negative.
 */
Tensor Tensor::allocate(ETensorDType dtype, const std::vector<long>& shape) {
    if (shape.size() > MAX_TENSOR_DIM) {
        throw std::runtime_error("Tensor rank too large");
    }
    if (std::any_of(shape.begin(), shape.end(), [](long s) { return s < 0; })) {
        throw std::runtime_error(fmt::format("Invalid tensor shape [{}]", fmt::join(shape, ", ")));
    }

    Tensor t;
    t.DType = dtype;
    t.Rank = narrow<int>(shape.size());
    std::copy(shape.begin(), shape.end(), t.Sizes.begin());
    std::fill(t.Sizes.begin() + shape.size(), t.Sizes.end(), 1);
    t.StorageBytes = t.bytes();
    t.Storage = std::make_shared<std::byte[]>(t.StorageBytes);
    t.Data = t.Storage.get();
    return t;
}

/**
 * @brief Create a contiguous view into @p src by slicing the first dimension.
 *
 * Only dimension 0 is supported because slices must remain contiguous.
 *
 * @param src  Source tensor to slice (view semantics; no copy).
 * @param dim  Dimension to slice; must be 0.
 * @param start  Inclusive start index along @p dim (in elements).
 * @param end    Exclusive end index along @p dim (in elements).
 * @return Tensor view that shares storage with @p src and has Sizes[dim] = end-start.
 *
 * @throws std::logic_error if @p dim != 0 or if indices are out of bounds.
 */
Tensor slice(const Tensor& src, int dim, long start, long end) {
    if (dim != 0)
        throw std::logic_error("Slices must be contiguous, so only the first dimension can be sliced.");

    if (src.Rank == 0 || start < 0 || start >= src.Sizes[dim] || end > src.Sizes[dim] || end < start)
        throw std::logic_error("Slice out of bounds.");

    std::size_t row_bytes = get_dtype_size(src.DType);
    for (int i = 1; i < src.Rank; ++i)
        row_bytes *= src.Sizes[i];

    Tensor dst = src;
    dst.Sizes[dim] = end - start;
    dst.Data = src.Data + start * row_bytes;
    return dst;
}

namespace {

//! Number of elements spanned by the dimensions before @p dim.
std::size_t outer_size(const Tensor& t, int dim) {
    std::size_t sz = 1;
    for (int i = 0; i < dim; ++i)
        sz *= t.Sizes[i];
    return sz;
}

//! Bytes spanned by one index step along @p dim.
std::size_t inner_bytes(const Tensor& t, int dim) {
    std::size_t sz = get_dtype_size(t.DType);
    for (int i = dim + 1; i < t.Rank; ++i)
        sz *= t.Sizes[i];
    return sz;
}

Tensor copy_range(const Tensor& src, int dim, long start, long end) {
    std::vector<long> shape = src.shape();
    shape[dim] = end - start;
    Tensor dst = Tensor::allocate(src.DType, shape);

    const std::size_t outer = outer_size(src, dim);
    const std::size_t step = inner_bytes(src, dim);
    const std::size_t src_stride = src.Sizes[dim] * step;
    const std::size_t dst_stride = (end - start) * step;
    for (std::size_t o = 0; o < outer; ++o) {
        std::memcpy(dst.Data + o * dst_stride, src.Data + o * src_stride + start * step, dst_stride);
    }
    return dst;
}

void check_dim(const Tensor& t, int dim, const char* where) {
    if (dim < 0 || dim >= t.Rank) {
        throw std::invalid_argument(fmt::format("{}: dimension {} out of range for tensor of rank {}", where, dim, t.Rank));
    }
}

} // namespace

Tensor copy_of(const Tensor& src) {
    if (src.is_null()) {
        return Tensor{};
    }
    Tensor dst = Tensor::allocate(src.DType, src.shape());
    std::memcpy(dst.Data, src.Data, src.bytes());
    return dst;
}

/**
 * @brief Split a list of tensors into @p num_chunks micro-batches.
 *
 * Splitting along dimension 0 yields views on the original storage; any other
 * dimension is not contiguous, so those chunks are copied.
 *
 * @throws std::invalid_argument if @p num_chunks is not positive or @p dim is out of range.
 * @throws std::runtime_error if a tensor's size along @p dim is not divisible by @p num_chunks.
 */
std::vector<TensorList> scatter(const TensorList& tensors, int num_chunks, int dim) {
    if (num_chunks <= 0) {
        throw std::invalid_argument(fmt::format("scatter: invalid number of chunks {}", num_chunks));
    }

    std::vector<TensorList> chunks(num_chunks);
    for (auto& chunk : chunks) {
        chunk.reserve(tensors.size());
    }

    for (const Tensor& t : tensors) {
        if (t.is_null()) {
            for (auto& chunk : chunks) {
                chunk.emplace_back();
            }
            continue;
        }

        check_dim(t, dim, "scatter");
        const long part = div_exact(t.Sizes[dim], static_cast<long>(num_chunks));
        for (int c = 0; c < num_chunks; ++c) {
            if (dim == 0) {
                chunks[c].push_back(slice(t, 0, c * part, (c + 1) * part));
            } else {
                chunks[c].push_back(copy_range(t, dim, c * part, (c + 1) * part));
            }
        }
    }
    return chunks;
}

/**
 * @brief Inverse of scatter(): concatenate per-chunk tensors along @p dim.
 *
 * @throws std::invalid_argument if chunks disagree in length, dtype, rank or in
 *         any dimension other than @p dim, or if a slot is null in only some chunks.
 */
TensorList gather(const std::vector<TensorList>& chunks, int dim) {
    if (chunks.empty()) {
        return {};
    }

    const std::size_t count = chunks.front().size();
    for (const auto& chunk : chunks) {
        if (chunk.size() != count) {
            throw std::invalid_argument(fmt::format("gather: chunks hold different numbers of tensors ({} vs {})", chunk.size(), count));
        }
    }

    TensorList result;
    result.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        const Tensor& first = chunks.front()[i];
        if (first.is_null()) {
            for (const auto& chunk : chunks) {
                if (chunk[i].has_value()) {
                    throw std::invalid_argument(fmt::format("gather: tensor {} is missing in some chunks", i));
                }
            }
            result.emplace_back();
            continue;
        }

        check_dim(first, dim, "gather");
        long total = 0;
        for (const auto& chunk : chunks) {
            const Tensor& t = chunk[i];
            if (t.is_null() || t.DType != first.DType || t.Rank != first.Rank) {
                throw std::invalid_argument(fmt::format("gather: tensor {} has inconsistent type or rank across chunks", i));
            }
            for (int d = 0; d < first.Rank; ++d) {
                if (d != dim && t.Sizes[d] != first.Sizes[d]) {
                    throw std::invalid_argument(fmt::format("gather: tensor {} differs in dimension {} ({} vs {})", i, d, t.Sizes[d], first.Sizes[d]));
                }
            }
            total += t.Sizes[dim];
        }

        std::vector<long> shape = first.shape();
        shape[dim] = total;
        Tensor out = Tensor::allocate(first.DType, shape);

        const std::size_t outer = outer_size(first, dim);
        const std::size_t step = inner_bytes(first, dim);
        const std::size_t out_stride = total * step;
        long at = 0;
        for (const auto& chunk : chunks) {
            const Tensor& t = chunk[i];
            const std::size_t len = t.Sizes[dim] * step;
            for (std::size_t o = 0; o < outer; ++o) {
                std::memcpy(out.Data + o * out_stride + at * step, t.Data + o * len, len);
            }
            at += t.Sizes[dim];
        }
        result.push_back(std::move(out));
    }
    return result;
}

/**
 * @brief Drop this tensor's hold on its storage.
 *
 * @throws std::logic_error if @p tensor is a view; a view keeps the memory of its
 *         base tensor alive, so releasing it would not free anything.
 */
void release(Tensor& tensor) {
    if (tensor.is_view()) {
        throw std::logic_error(fmt::format("pipeline stage should not return view tensors (shape [{}])",
                                           fmt::join(tensor.shape(), ", ")));
    }
    tensor.Storage.reset();
    tensor.StorageBytes = 0;
    tensor.Data = nullptr;
}
