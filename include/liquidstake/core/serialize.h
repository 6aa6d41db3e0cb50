// LIQUIDSTAKE - Record Encoding
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License
//
// Fixed-width little-endian fields for the records the state store keeps.
// Variable-length fields carry an unsigned LEB128 length prefix.

#ifndef LIQUIDSTAKE_CORE_SERIALIZE_H
#define LIQUIDSTAKE_CORE_SERIALIZE_H

#include "liquidstake/core/types.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace liquidstake {

/// Largest length prefix a reader accepts
constexpr uint64_t MAX_FIELD_LENGTH = 1 << 20;

class ByteWriter {
public:
    ByteWriter& operator<<(uint8_t value);
    ByteWriter& operator<<(bool value);
    ByteWriter& operator<<(uint32_t value);
    ByteWriter& operator<<(uint64_t value);
    ByteWriter& operator<<(int64_t value);
    ByteWriter& operator<<(const std::string& value);
    ByteWriter& operator<<(const std::vector<Byte>& value);

    /// Hashes and addresses are written raw, without a length
    template<size_t BITS>
    ByteWriter& operator<<(const BaseHash<BITS>& hash) {
        Append(hash.data(), hash.size());
        return *this;
    }

    void WriteLength(uint64_t length);

    const std::string& Buffer() const { return out_; }
    size_t Size() const { return out_.size(); }

private:
    void Append(const void* data, size_t len);
    void AppendLE(uint64_t value, size_t width);

    std::string out_;
};

/**
 * Reads fields back in the order they were written. Every read past the
 * end, and every oversized length, throws std::ios_base::failure.
 */
class ByteReader {
public:
    explicit ByteReader(std::string data) : data_(std::move(data)) {}

    ByteReader& operator>>(uint8_t& value);
    ByteReader& operator>>(bool& value);
    ByteReader& operator>>(uint32_t& value);
    ByteReader& operator>>(uint64_t& value);
    ByteReader& operator>>(int64_t& value);
    ByteReader& operator>>(std::string& value);
    ByteReader& operator>>(std::vector<Byte>& value);

    template<size_t BITS>
    ByteReader& operator>>(BaseHash<BITS>& hash) {
        Take(hash.data(), hash.size());
        return *this;
    }

    uint64_t ReadLength();

    size_t Remaining() const { return data_.size() - pos_; }
    bool AtEnd() const { return pos_ == data_.size(); }

private:
    void Take(void* out, size_t len);
    uint64_t TakeLE(size_t width);

    std::string data_;
    size_t pos_{0};
};

} // namespace liquidstake

#endif // LIQUIDSTAKE_CORE_SERIALIZE_H
