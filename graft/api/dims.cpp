// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#include "graft/dims.hpp"

#include <sstream>

#include "logging.hpp"

namespace graft {

Dims::Dims() {}

Dims::Dims(DimType d0) : Dims(std::vector<DimType>{d0}) {}

Dims::Dims(DimType d0, DimType d1) : Dims(std::vector<DimType>{d0, d1}) {}

Dims::Dims(DimType d0, DimType d1, DimType d2)
    : Dims(std::vector<DimType>{d0, d1, d2}) {}

Dims::Dims(DimType d0, DimType d1, DimType d2, DimType d3)
    : Dims(std::vector<DimType>{d0, d1, d2, d3}) {}

Dims::Dims(const std::vector<DimType> &vec) {
    if (vec.size() > static_cast<size_t>(DIMS_LEN)) {
        ERR(InvalidUsageError, "only support dims with size <= ", DIMS_LEN,
            ". Given: ", vec.size(), " dimensions");
    }
    for (size_t i = 0; i < vec.size(); ++i) {
        if (vec[i] < 0) {
            ERR(InvalidUsageError, "invalid dims given at index ", i, ": ",
                vec[i]);
        }
    }
    data_ = vec;
}

DimType Dims::nelems() const {
    DimType ret = 1;
    for (auto d : data_) {
        ret *= d;
    }
    return ret;
}

int Dims::ndims() const { return static_cast<int>(data_.size()); }

bool Dims::is_no_dim() const { return data_.empty(); }

bool Dims::has_dynamic() const {
    for (auto d : data_) {
        if (d == DYNAMIC_DIM) return true;
    }
    return false;
}

const std::vector<DimType> &Dims::vector() const { return data_; }

std::string Dims::serialize() const {
    std::stringstream ss;
    ss << *this;
    return ss.str();
}

DimType &Dims::operator[](int idx) {
    int nd = this->ndims();
    if (idx >= nd || idx < -nd) {
        ERR(InvalidUsageError, "invalid index given: ", idx, " for ", *this);
    }
    return data_[idx < 0 ? nd + idx : idx];
}

const DimType &Dims::operator[](int idx) const {
    int nd = this->ndims();
    if (idx >= nd || idx < -nd) {
        ERR(InvalidUsageError, "invalid index given: ", idx, " for ", *this);
    }
    return data_[idx < 0 ? nd + idx : idx];
}

bool operator==(const Dims &a, const Dims &b) { return a.data_ == b.data_; }

bool operator!=(const Dims &a, const Dims &b) { return a.data_ != b.data_; }

std::ostream &operator<<(std::ostream &os, const Dims &dims) {
    os << '<';
    const auto &vec = dims.vector();
    for (size_t i = 0; i < vec.size(); ++i) {
        if (i > 0) os << ", ";
        os << vec[i];
    }
    os << '>';
    return os;
}

}  // namespace graft
