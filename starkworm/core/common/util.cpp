// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "util.hpp"

#include <algorithm>
#include <stdexcept>

namespace starkworm {

namespace {
    //! The Starknet field prime P = 2^251 + 17 * 2^192 + 1 in big-endian form
    constexpr uint8_t kFieldPrime[kHashLength]{
        0x08, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x11, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
        0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x01};

    constexpr const char* kHexDigits{"0123456789abcdef"};

    bool has_hex_prefix(std::string_view s) {
        return s.length() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X');
    }
}  // namespace

std::string to_hex(ByteView bytes, bool with_prefix) {
    std::string out(bytes.size() * 2 + (with_prefix ? 2 : 0), '\0');
    char* dest{&out[0]};
    if (with_prefix) {
        *dest++ = '0';
        *dest++ = 'x';
    }
    for (const auto& b : bytes) {
        *dest++ = kHexDigits[b >> 4];    // Hi
        *dest++ = kHexDigits[b & 0x0f];  // Lo
    }
    return out;
}

std::string to_hex_no_leading_zeros(ByteView bytes) {
    std::string out{};
    out.reserve(2 * bytes.size());

    bool found_nonzero{false};
    for (const auto b : bytes) {
        const char hi{kHexDigits[b >> 4]};
        if (found_nonzero || hi != '0') {
            out.push_back(hi);
            found_nonzero = true;
        }
        const char lo{kHexDigits[b & 0x0f]};
        if (found_nonzero || lo != '0') {
            out.push_back(lo);
            found_nonzero = true;
        }
    }
    if (out.empty()) {
        out.push_back('0');
    }
    return out;
}

std::optional<uint8_t> decode_hex_digit(char ch) noexcept {
    if (ch >= '0' && ch <= '9') return static_cast<uint8_t>(ch - '0');
    if (ch >= 'a' && ch <= 'f') return static_cast<uint8_t>(ch - 'a' + 10);
    if (ch >= 'A' && ch <= 'F') return static_cast<uint8_t>(ch - 'A' + 10);
    return std::nullopt;
}

std::optional<Bytes> from_hex(std::string_view hex) noexcept {
    if (has_hex_prefix(hex)) {
        hex.remove_prefix(2);
    }
    if (hex.empty()) {
        return Bytes{};
    }

    const size_t pos{hex.length() & 1};  // "[0x]1" is legit and has to be treated as "[0x]01"
    Bytes out((hex.length() + pos) / 2, 0);
    auto dst{out.begin()};
    size_t i{0};
    if (pos) {
        const auto lo{decode_hex_digit(hex[0])};
        if (!lo) return std::nullopt;
        *dst++ = *lo;
        i = 1;
    }
    for (; i < hex.length(); i += 2) {
        const auto hi{decode_hex_digit(hex[i])};
        const auto lo{decode_hex_digit(hex[i + 1])};
        if (!hi || !lo) return std::nullopt;
        *dst++ = static_cast<uint8_t>((*hi << 4) | *lo);
    }
    return out;
}

bool is_valid_felt(const evmc::bytes32& value) noexcept {
    return std::lexicographical_compare(std::begin(value.bytes), std::end(value.bytes),
                                        std::begin(kFieldPrime), std::end(kFieldPrime));
}

std::optional<Felt> felt_from_hex(std::string_view hex) noexcept {
    if (!has_hex_prefix(hex)) {
        return std::nullopt;
    }
    const auto digits{hex.substr(2)};
    if (digits.empty() || digits.length() > 2 * kHashLength) {
        return std::nullopt;
    }
    const auto bytes{from_hex(digits)};
    if (!bytes) {
        return std::nullopt;
    }
    Felt felt{};
    std::copy(bytes->begin(), bytes->end(), felt.bytes + (kHashLength - bytes->size()));
    if (!is_valid_felt(felt)) {
        return std::nullopt;
    }
    return felt;
}

std::string felt_to_hex(const Felt& felt) {
    return "0x" + to_hex_no_leading_zeros(ByteView{felt.bytes});
}

Felt felt_from_u64(uint64_t value) noexcept {
    Felt felt{};
    for (size_t i{0}; i < sizeof(uint64_t); ++i) {
        felt.bytes[kHashLength - 1 - i] = static_cast<uint8_t>(value >> (8 * i));
    }
    return felt;
}

Felt felt_from_bytes(std::string_view bytes) {
    if (bytes.length() >= kHashLength) {
        throw std::invalid_argument{"felt_from_bytes: too many bytes: " + std::to_string(bytes.length())};
    }
    Felt felt{};
    std::copy(bytes.begin(), bytes.end(), felt.bytes + (kHashLength - bytes.length()));
    return felt;
}

}  // namespace starkworm
