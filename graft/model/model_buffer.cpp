// Copyright (c) Microsoft Corporation.
// Licensed under the MIT license.

#include "model_buffer.hpp"

#include <cstring>
#include <iomanip>
#include <sstream>

#include "logging.hpp"

namespace graft {

template <typename UInt>
static void put_le(std::string &out, UInt v) {
    for (size_t i = 0; i < sizeof(UInt); ++i) {
        out.push_back(static_cast<char>((v >> (8 * i)) & 0xff));
    }
}

template <typename UInt>
static UInt get_le(const std::string &in, size_t pos) {
    UInt v = 0;
    for (size_t i = 0; i < sizeof(UInt); ++i) {
        v |= static_cast<UInt>(static_cast<unsigned char>(in[pos + i]))
             << (8 * i);
    }
    return v;
}

std::shared_ptr<ModelBuffer> ModelBuffer::from_floats(
    const std::vector<float> &values) {
    std::string data;
    data.reserve(values.size() * sizeof(float));
    for (float v : values) {
        uint32_t bits;
        std::memcpy(&bits, &v, sizeof(bits));
        put_le<uint32_t>(data, bits);
    }
    return std::make_shared<ModelBuffer>(data);
}

std::shared_ptr<ModelBuffer> ModelBuffer::from_int64s(
    const std::vector<int64_t> &values) {
    std::string data;
    data.reserve(values.size() * sizeof(int64_t));
    for (int64_t v : values) {
        put_le<uint64_t>(data, static_cast<uint64_t>(v));
    }
    return std::make_shared<ModelBuffer>(data);
}

std::vector<float> decode_floats(const std::string &raw) {
    if (raw.size() % sizeof(float) != 0) {
        ERR(InvalidUsageError, "raw data of ", raw.size(),
            " bytes is not a sequence of FP32 values");
    }
    std::vector<float> values;
    values.reserve(raw.size() / sizeof(float));
    for (size_t pos = 0; pos < raw.size(); pos += sizeof(float)) {
        uint32_t bits = get_le<uint32_t>(raw, pos);
        float v;
        std::memcpy(&v, &bits, sizeof(v));
        values.push_back(v);
    }
    return values;
}

std::vector<int64_t> decode_int64s(const std::string &raw) {
    if (raw.size() % sizeof(int64_t) != 0) {
        ERR(InvalidUsageError, "raw data of ", raw.size(),
            " bytes is not a sequence of INT64 values");
    }
    std::vector<int64_t> values;
    values.reserve(raw.size() / sizeof(int64_t));
    for (size_t pos = 0; pos < raw.size(); pos += sizeof(int64_t)) {
        values.push_back(static_cast<int64_t>(get_le<uint64_t>(raw, pos)));
    }
    return values;
}

std::vector<float> ModelBuffer::floats() const { return decode_floats(data_); }

std::vector<int64_t> ModelBuffer::int64s() const {
    return decode_int64s(data_);
}

std::string ModelBuffer::digest() const {
    uint64_t h = 0xcbf29ce484222325ULL;
    for (char c : data_) {
        h ^= static_cast<unsigned char>(c);
        h *= 0x100000001b3ULL;
    }
    std::stringstream ss;
    ss << std::hex << std::setw(16) << std::setfill('0') << h;
    return ss.str();
}

Json ModelBuffer::serialize() const {
    Json j;
    j["Bytes"] = data_.size();
    j["Digest"] = digest();
    return j;
}

}  // namespace graft
