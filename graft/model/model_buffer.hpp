// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#ifndef GRAFT_MODEL_BUFFER_HPP_
#define GRAFT_MODEL_BUFFER_HPP_

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "model_json.hpp"

namespace graft {

/// Constant payload of a tensor, stored as little-endian bytes regardless of
/// the host byte order.
class ModelBuffer {
   public:
    ModelBuffer(const std::string &data) : data_(data) {}

    static std::shared_ptr<ModelBuffer> from_floats(
        const std::vector<float> &values);

    static std::shared_ptr<ModelBuffer> from_int64s(
        const std::vector<int64_t> &values);

    const std::string &data() const { return data_; }

    size_t bytes() const { return data_.size(); }

    std::vector<float> floats() const;

    std::vector<int64_t> int64s() const;

    /// FNV-1a digest of the payload, used to identify it in JSON dumps.
    std::string digest() const;

    Json serialize() const;

   private:
    std::string data_;
};

/// Decode little-endian INT64 values from raw bytes.
std::vector<int64_t> decode_int64s(const std::string &raw);

/// Decode little-endian FP32 values from raw bytes.
std::vector<float> decode_floats(const std::string &raw);

}  // namespace graft

#endif  // GRAFT_MODEL_BUFFER_HPP_
