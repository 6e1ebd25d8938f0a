/**
 * @file id_utils.cpp
 * @brief UUID generation on top of OpenSSL RAND_bytes
 *
 * @date 2025
 */

#include "codebox/utils/id_utils.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace codebox {
namespace utils {

std::vector<uint8_t> RandomBytes(std::size_t count) {
    std::vector<uint8_t> bytes(count);
    if (count == 0) {
        return bytes;
    }

    if (RAND_bytes(bytes.data(), static_cast<int>(count)) != 1) {
        char reason[256];
        ERR_error_string_n(ERR_get_error(), reason, sizeof(reason));
        throw std::runtime_error(std::string("RAND_bytes failed: ") + reason);
    }

    return bytes;
}

std::string ToHex(const std::vector<uint8_t>& bytes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (uint8_t byte : bytes) {
        oss << std::setw(2) << static_cast<int>(byte);
    }

    return oss.str();
}

std::string GenerateUUID() {
    auto bytes = RandomBytes(16);

    // Version 4, variant 10xx
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

    std::string hex = ToHex(bytes);
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) +
           "-" + hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

bool IsUUID(const std::string& str) {
    if (str.size() != 36) {
        return false;
    }

    for (std::size_t i = 0; i < str.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (str[i] != '-') return false;
        } else if (!std::isxdigit(static_cast<unsigned char>(str[i]))) {
            return false;
        }
    }

    return true;
}

} // namespace utils
} // namespace codebox
