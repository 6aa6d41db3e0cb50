// LIQUIDSTAKE - Record Encoding Implementation
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License

#include "liquidstake/core/serialize.h"

#include <cstring>
#include <ios>

namespace liquidstake {

// ============================================================================
// ByteWriter
// ============================================================================

void ByteWriter::Append(const void* data, size_t len) {
    out_.append(static_cast<const char*>(data), len);
}

void ByteWriter::AppendLE(uint64_t value, size_t width) {
    for (size_t i = 0; i < width; ++i) {
        out_.push_back(static_cast<char>(value & 0xff));
        value >>= 8;
    }
}

void ByteWriter::WriteLength(uint64_t length) {
    do {
        uint8_t group = length & 0x7f;
        length >>= 7;
        out_.push_back(static_cast<char>(length != 0 ? group | 0x80 : group));
    } while (length != 0);
}

ByteWriter& ByteWriter::operator<<(uint8_t value) {
    AppendLE(value, 1);
    return *this;
}

ByteWriter& ByteWriter::operator<<(bool value) {
    AppendLE(value ? 1 : 0, 1);
    return *this;
}

ByteWriter& ByteWriter::operator<<(uint32_t value) {
    AppendLE(value, 4);
    return *this;
}

ByteWriter& ByteWriter::operator<<(uint64_t value) {
    AppendLE(value, 8);
    return *this;
}

ByteWriter& ByteWriter::operator<<(int64_t value) {
    AppendLE(static_cast<uint64_t>(value), 8);
    return *this;
}

ByteWriter& ByteWriter::operator<<(const std::string& value) {
    WriteLength(value.size());
    Append(value.data(), value.size());
    return *this;
}

ByteWriter& ByteWriter::operator<<(const std::vector<Byte>& value) {
    WriteLength(value.size());
    Append(value.data(), value.size());
    return *this;
}

// ============================================================================
// ByteReader
// ============================================================================

void ByteReader::Take(void* out, size_t len) {
    if (len > Remaining()) {
        throw std::ios_base::failure("record truncated: need " + std::to_string(len) +
                                     " bytes, " + std::to_string(Remaining()) + " left");
    }
    if (len > 0) {
        std::memcpy(out, data_.data() + pos_, len);
    }
    pos_ += len;
}

uint64_t ByteReader::TakeLE(size_t width) {
    uint8_t raw[8];
    Take(raw, width);
    uint64_t value = 0;
    for (size_t i = width; i > 0; --i) {
        value = (value << 8) | raw[i - 1];
    }
    return value;
}

uint64_t ByteReader::ReadLength() {
    uint64_t length = 0;
    for (unsigned shift = 0;; shift += 7) {
        uint8_t group = 0;
        Take(&group, 1);
        if (shift > 56) {
            throw std::ios_base::failure("length prefix too long");
        }
        length |= static_cast<uint64_t>(group & 0x7f) << shift;
        if ((group & 0x80) == 0) {
            break;
        }
    }
    if (length > MAX_FIELD_LENGTH) {
        throw std::ios_base::failure("field length " + std::to_string(length) +
                                     " exceeds limit");
    }
    return length;
}

ByteReader& ByteReader::operator>>(uint8_t& value) {
    value = static_cast<uint8_t>(TakeLE(1));
    return *this;
}

ByteReader& ByteReader::operator>>(bool& value) {
    uint8_t raw = static_cast<uint8_t>(TakeLE(1));
    if (raw > 1) {
        throw std::ios_base::failure("invalid boolean byte " + std::to_string(raw));
    }
    value = raw == 1;
    return *this;
}

ByteReader& ByteReader::operator>>(uint32_t& value) {
    value = static_cast<uint32_t>(TakeLE(4));
    return *this;
}

ByteReader& ByteReader::operator>>(uint64_t& value) {
    value = TakeLE(8);
    return *this;
}

ByteReader& ByteReader::operator>>(int64_t& value) {
    value = static_cast<int64_t>(TakeLE(8));
    return *this;
}

ByteReader& ByteReader::operator>>(std::string& value) {
    uint64_t length = ReadLength();
    value.assign(static_cast<size_t>(length), '\0');
    Take(&value[0], static_cast<size_t>(length));
    return *this;
}

ByteReader& ByteReader::operator>>(std::vector<Byte>& value) {
    uint64_t length = ReadLength();
    value.assign(static_cast<size_t>(length), 0);
    Take(value.data(), static_cast<size_t>(length));
    return *this;
}

} // namespace liquidstake
