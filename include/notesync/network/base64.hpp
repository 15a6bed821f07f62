#pragma once

#include <cstdint>
#include <string>

namespace notesync {
namespace network {

/**
 * @brief Standard Base64 (RFC 4648, with '=' padding).
 *
 * Every 3 input bytes become 4 output characters, 6 bits each:
 * - "M"   -> "TQ=="
 * - "Ma"  -> "TWE="
 * - "Man" -> "TWFu"
 *
 * Used to embed the document in the HTML view, where it is decoded again by
 * the browser's atob().
 */
class Base64 {
public:
    static std::string encode(const std::string& in) {
        static constexpr char kAlphabet[] =
            "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

        std::string out;
        out.reserve(encodedSize(in.size()));

        uint32_t buffer = 0;
        int bits_collected = 0;
        for (unsigned char c : in) {
            buffer = (buffer << 8) | c;
            bits_collected += 8;
            while (bits_collected >= 6) {
                bits_collected -= 6;
                out.push_back(kAlphabet[(buffer >> bits_collected) & 0x3F]);
            }
        }

        // Flush the remaining 2 or 4 bits, zero padded
        if (bits_collected > 0) {
            out.push_back(kAlphabet[(buffer << (6 - bits_collected)) & 0x3F]);
        }
        while (out.size() % 4 != 0) {
            out.push_back('=');
        }
        return out;
    }

    static size_t encodedSize(size_t n) {
        return ((n + 2) / 3) * 4;
    }
};

} // namespace network
} // namespace notesync
