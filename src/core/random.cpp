// VFACE - Secure Random Number Generation Implementation
// Copyright (c) 2024 VFACE Developers
// MIT License

#include "vface/core/random.h"
#include "vface/core/hex.h"

#include <cerrno>
#include <stdexcept>

#include <sys/random.h>

namespace vface {

void GetRandBytes(uint8_t* buf, size_t len) {
    size_t filled = 0;
    while (filled < len) {
        ssize_t ret = getrandom(buf + filled, len - filled, 0);
        if (ret < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw std::runtime_error("Failed to get random bytes from OS");
        }
        filled += static_cast<size_t>(ret);
    }
}

std::vector<uint8_t> GetRandBytes(size_t len) {
    std::vector<uint8_t> out(len);
    GetRandBytes(out.data(), len);
    return out;
}

uint64_t GetRandUint64() {
    uint64_t result;
    GetRandBytes(reinterpret_cast<uint8_t*>(&result), sizeof(result));
    return result;
}

std::string GetRandHex(size_t len) {
    return BytesToHex(GetRandBytes(len));
}

std::string GenerateUUID() {
    uint8_t b[16];
    GetRandBytes(b, sizeof(b));
    b[6] = static_cast<uint8_t>((b[6] & 0x0F) | 0x40);  // version 4
    b[8] = static_cast<uint8_t>((b[8] & 0x3F) | 0x80);  // RFC 4122 variant

    std::string hex = BytesToHex(b, sizeof(b));
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) +
           "-" + hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

} // namespace vface
