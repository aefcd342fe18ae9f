// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef DUALPIPE_SRC_UTILITIES_TENSOR_H
#define DUALPIPE_SRC_UTILITIES_TENSOR_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "dtype.h"
#include "utils.h"

constexpr int MAX_TENSOR_DIM = 5;

//! \brief The Tensor class represents a contiguous view on host memory that is associated
//! with a specific data type and shape.
//!
//! Storage is reference counted; copying a Tensor creates another view on the same memory.
//! A default constructed Tensor is null and marks an absent slot in a TensorList.
struct Tensor {
    ETensorDType DType = ETensorDType::FP32;
    std::array<long, MAX_TENSOR_DIM> Sizes{};
    std::byte* Data = nullptr;
    int Rank = 0;
    std::shared_ptr<std::byte[]> Storage;
    std::size_t StorageBytes = 0;

    [[nodiscard]] constexpr std::size_t bytes() const {
        return nelem() * get_dtype_size(DType);
    }

    [[nodiscard]] constexpr std::size_t nelem() const {
        std::size_t sz = 1;
        for(int i = 0; i < Rank; ++i) {
            sz *= Sizes[i];
        }
        return sz;
    }

    [[nodiscard]] bool is_null() const { return Data == nullptr; }
    [[nodiscard]] bool has_value() const { return Data != nullptr; }

    //! True if this tensor does not cover the whole of its storage, i.e. it aliases
    //! memory that some other tensor owns.
    [[nodiscard]] bool is_view() const {
        return Storage && (Data != Storage.get() || bytes() != StorageBytes);
    }

    [[nodiscard]] std::vector<long> shape() const {
        return std::vector<long>(Sizes.begin(), Sizes.begin() + Rank);
    }

    //! Allocates zero-initialized host storage of the given shape.
    static Tensor allocate(ETensorDType dtype, const std::vector<long>& shape);

    template<class TargetType>
    [[nodiscard]] const TargetType* get() const {
        if(dtype_from_type<TargetType> != DType) {
            throw std::logic_error(std::string("DType mismatch: expected ") +
                dtype_to_str(dtype_from_type<TargetType>) + ", got " + dtype_to_str(DType));
        }

        return reinterpret_cast<const TargetType*>(Data);
    }

    template<typename TargetType>
    [[nodiscard]] TargetType* get() {
        if(dtype_from_type<TargetType> != DType) {
            throw std::logic_error(std::string("DType mismatch: expected ") +
                dtype_to_str(dtype_from_type<TargetType>) + ", got " + dtype_to_str(DType));
        }

        return reinterpret_cast<TargetType*>(Data);
    }
};

using TensorList = std::vector<Tensor>;

Tensor slice(const Tensor& src, int dim, long start, long end);

//! Deep copy into freshly allocated, contiguous storage.
Tensor copy_of(const Tensor& src);

//! Splits every tensor of @p tensors into @p num_chunks equal parts along @p dim.
//! Returns one TensorList per chunk. Null entries stay null in every chunk.
std::vector<TensorList> scatter(const TensorList& tensors, int num_chunks, int dim);

//! Concatenates the i-th tensor of every chunk along @p dim.
TensorList gather(const std::vector<TensorList>& chunks, int dim);

//! Frees the storage held by @p tensor. Views cannot be released.
void release(Tensor& tensor);

#endif //DUALPIPE_SRC_UTILITIES_TENSOR_H
