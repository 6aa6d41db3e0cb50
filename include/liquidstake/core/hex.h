// LIQUIDSTAKE - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License

#ifndef LIQUIDSTAKE_CORE_HEX_H
#define LIQUIDSTAKE_CORE_HEX_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace liquidstake {

/// Convert bytes to lowercase hex string
std::string BytesToHex(const uint8_t* data, size_t len);
std::string BytesToHex(const std::vector<uint8_t>& data);

/// Convert hex string to bytes. A leading "0x" is stripped.
/// @throws std::invalid_argument on odd length or non-hex characters
std::vector<uint8_t> HexToBytes(const std::string& hex);

/// True if the string is non-empty, even-length hex (optional "0x" prefix)
bool IsValidHex(const std::string& str);

/// Hex of the raw bytes of a text string
std::string StringToHex(const std::string& str);

} // namespace liquidstake

#endif // LIQUIDSTAKE_CORE_HEX_H
