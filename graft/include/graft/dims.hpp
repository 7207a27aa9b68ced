// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#ifndef GRAFT_DIMS_HPP
#define GRAFT_DIMS_HPP

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace graft {

// Data type for dimension.
typedef int64_t DimType;

// DIMS_LEN is the maximum number of dimensions of a tensor.
constexpr int DIMS_LEN = 4;

// Extent of a dimension whose size is only known at run time.
constexpr DimType DYNAMIC_DIM = 0;

// Up-to-`DIMS_LEN`-dimensional shape. An empty Dims is the shape of a scalar.
class Dims {
   private:
    std::vector<DimType> data_;

   public:
    Dims();

    Dims(DimType d0);

    Dims(DimType d0, DimType d1);

    Dims(DimType d0, DimType d1, DimType d2);

    Dims(DimType d0, DimType d1, DimType d2, DimType d3);

    Dims(const Dims &dims_) = default;
    // Construct from a vector. Raise an error if the vector is longer than
    // DIMS_LEN or holds a negative extent.
    Dims(const std::vector<DimType> &vec);

    // Return the number of elements. Dynamic dimensions count as zero, and a
    // scalar has one element.
    DimType nelems() const;
    // Return the number of dimensions.
    int ndims() const;
    // Return true if this is the shape of a scalar.
    bool is_no_dim() const;
    // Return true if any dimension is dynamic.
    bool has_dynamic() const;
    // Return the dimensions as a vector.
    const std::vector<DimType> &vector() const;

    std::string serialize() const;

    // Negative indices count from the last dimension.
    DimType &operator[](int idx);

    const DimType &operator[](int idx) const;

    Dims &operator=(const Dims &) = default;

    friend bool operator==(const Dims &a, const Dims &b);
    friend bool operator!=(const Dims &a, const Dims &b);
};

std::ostream &operator<<(std::ostream &os, const Dims &dims);

}  // namespace graft

#endif  // GRAFT_DIMS_HPP
