// LIQUIDSTAKE - State Database
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License

#include "liquidstake/db/database.h"

namespace liquidstake {
namespace db {

std::string Status::ToString() const {
    static const char* const NAMES[] = {
        "OK", "NotFound", "Corruption", "InvalidArgument", "IOError",
    };
    std::string text = NAMES[code_];
    if (code_ != OK && !message_.empty()) {
        text += ": " + message_;
    }
    return text;
}

} // namespace db
} // namespace liquidstake
