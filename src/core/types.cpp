// LIQUIDSTAKE - Core Types Implementation
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License

#include "liquidstake/core/types.h"
#include "liquidstake/core/hex.h"

#include <vector>

namespace liquidstake {

// ============================================================================
// BaseHash Implementation
// ============================================================================

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    return BytesToHex(data_.data(), SIZE);
}

template<size_t BITS>
BaseHash<BITS> BaseHash<BITS>::FromHex(const std::string& hex) {
    std::vector<uint8_t> bytes = HexToBytes(hex);
    if (bytes.size() != SIZE) {
        throw std::invalid_argument("Invalid hex string length for " +
                                    std::to_string(SIZE) + "-byte value");
    }
    return BaseHash(bytes.data(), bytes.size());
}

// Explicit template instantiations
template class BaseHash<256>;
template class BaseHash<160>;

} // namespace liquidstake
