#pragma once
// Base64 (RFC 4648, standard alphabet, padded)
// HBase REST encodes row keys, column names and cell values this way;
// Avatica uses it for BINARY/VARBINARY values in JSON frames.
#include <cstdint>
#include <string>
#include <vector>

namespace phxgw {

class Base64 {
public:
    static std::string encode(const void* data, size_t len) {
        static constexpr char ALPHABET[] =
            "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
        auto* p = static_cast<const uint8_t*>(data);

        std::string out;
        out.reserve(((len + 2) / 3) * 4);

        size_t i = 0;
        for (; i + 2 < len; i += 3) {
            uint32_t v = (uint32_t(p[i]) << 16) | (uint32_t(p[i + 1]) << 8) | p[i + 2];
            out += ALPHABET[(v >> 18) & 0x3F];
            out += ALPHABET[(v >> 12) & 0x3F];
            out += ALPHABET[(v >> 6) & 0x3F];
            out += ALPHABET[v & 0x3F];
        }

        size_t rest = len - i;
        if (rest == 1) {
            uint32_t v = uint32_t(p[i]) << 16;
            out += ALPHABET[(v >> 18) & 0x3F];
            out += ALPHABET[(v >> 12) & 0x3F];
            out += "==";
        } else if (rest == 2) {
            uint32_t v = (uint32_t(p[i]) << 16) | (uint32_t(p[i + 1]) << 8);
            out += ALPHABET[(v >> 18) & 0x3F];
            out += ALPHABET[(v >> 12) & 0x3F];
            out += ALPHABET[(v >> 6) & 0x3F];
            out += '=';
        }
        return out;
    }

    static std::string encode(const std::string& s) {
        return encode(s.data(), s.size());
    }

    static std::string encode(const std::vector<uint8_t>& bytes) {
        return encode(bytes.data(), bytes.size());
    }

    // Returns false on characters outside the alphabet or bad padding.
    // Whitespace is skipped (some servers wrap long values).
    static bool decode(const std::string& in, std::vector<uint8_t>& out) {
        out.clear();
        out.reserve(in.size() / 4 * 3);

        uint32_t acc = 0;
        int bits = 0;
        int pad = 0;
        for (char c : in) {
            if (c == ' ' || c == '\n' || c == '\r' || c == '\t') continue;
            if (c == '=') {
                ++pad;
                continue;
            }
            if (pad > 0) return false;  // data after padding
            int v = value_of(c);
            if (v < 0) return false;
            acc = (acc << 6) | static_cast<uint32_t>(v);
            bits += 6;
            if (bits >= 8) {
                bits -= 8;
                out.push_back(static_cast<uint8_t>((acc >> bits) & 0xFF));
            }
        }
        return pad <= 2;
    }

private:
    static int value_of(char c) noexcept {
        if (c >= 'A' && c <= 'Z') return c - 'A';
        if (c >= 'a' && c <= 'z') return c - 'a' + 26;
        if (c >= '0' && c <= '9') return c - '0' + 52;
        if (c == '+') return 62;
        if (c == '/') return 63;
        return -1;
    }
};

} // namespace phxgw
