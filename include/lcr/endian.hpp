#pragma once

#include <cstdint>
#include <cstddef>


// -------------------------------------------------------------
// Network byte order helpers for binary frame headers
// -------------------------------------------------------------
// Wire format: BIG-ENDIAN
// Use store_be32() when encoding a header, load_be32() when decoding.
// -------------------------------------------------------------

#if defined(__BYTE_ORDER__) && defined(__ORDER_LITTLE_ENDIAN__) && defined(__ORDER_BIG_ENDIAN__)
#  define LCR_HOST_IS_LITTLE_ENDIAN (__BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__)
#else
#  error "Cannot determine host endianness"
#endif


namespace lcr {

inline constexpr uint16_t to_be16(uint16_t x) noexcept {
#if LCR_HOST_IS_LITTLE_ENDIAN
    return __builtin_bswap16(x);
#else
    return x;
#endif
}

inline constexpr uint32_t to_be32(uint32_t x) noexcept {
#if LCR_HOST_IS_LITTLE_ENDIAN
    return __builtin_bswap32(x);
#else
    return x;
#endif
}

// Symmetric
inline constexpr uint16_t from_be16(uint16_t x) noexcept { return to_be16(x); }
inline constexpr uint32_t from_be32(uint32_t x) noexcept { return to_be32(x); }

// Byte-wise store/load (alignment independent)
inline void store_be32(std::byte* out, uint32_t v) noexcept {
    out[0] = static_cast<std::byte>((v >> 24) & 0xFF);
    out[1] = static_cast<std::byte>((v >> 16) & 0xFF);
    out[2] = static_cast<std::byte>((v >> 8) & 0xFF);
    out[3] = static_cast<std::byte>(v & 0xFF);
}

[[nodiscard]]
inline uint32_t load_be32(const std::byte* in) noexcept {
    return (static_cast<uint32_t>(in[0]) << 24) |
           (static_cast<uint32_t>(in[1]) << 16) |
           (static_cast<uint32_t>(in[2]) << 8)  |
            static_cast<uint32_t>(in[3]);
}

} // namespace lcr
