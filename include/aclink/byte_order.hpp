#pragma once
/**
 * @file byte_order.hpp
 * @brief Big-endian put/get helpers for the aclink wire format.
 *
 * Every multi-byte field on the acoustic link is written most significant byte
 * first (network order), independent of the host. Floats are IEEE-754 and are
 * moved through an integer of the same width with memcpy, so a value decodes
 * bit-exact on any host.
 *
 * The put_* helpers append to a std::vector<uint8_t>. The get_* helpers read
 * from a raw pointer; callers check the length first.
 */

#include <cstdint>
#include <cstring>
#include <vector>

namespace aclink {
namespace wire {

static_assert(sizeof(float)  == 4, "aclink requires 32-bit IEEE-754 float");
static_assert(sizeof(double) == 8, "aclink requires 64-bit IEEE-754 double");

inline void put_u8(std::vector<uint8_t>& b, uint8_t v) {
    b.push_back(v);
}

inline void put_u16(std::vector<uint8_t>& b, uint16_t v) {
    b.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));   // high byte first
    b.push_back(static_cast<uint8_t>(v & 0xFF));
}

inline void put_u32(std::vector<uint8_t>& b, uint32_t v) {
    b.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
    b.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    b.push_back(static_cast<uint8_t>((v >> 8)  & 0xFF));
    b.push_back(static_cast<uint8_t>(v & 0xFF));
}

inline void put_u64(std::vector<uint8_t>& b, uint64_t v) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        b.push_back(static_cast<uint8_t>((v >> shift) & 0xFF));
    }
}

inline void put_f32(std::vector<uint8_t>& b, float v) {
    uint32_t bits = 0;
    std::memcpy(&bits, &v, sizeof(bits));
    put_u32(b, bits);
}

inline void put_f64(std::vector<uint8_t>& b, double v) {
    uint64_t bits = 0;
    std::memcpy(&bits, &v, sizeof(bits));
    put_u64(b, bits);
}

inline uint16_t get_u16(const uint8_t* p) {
    return static_cast<uint16_t>((static_cast<uint16_t>(p[0]) << 8) | p[1]);
}

inline uint32_t get_u32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) |
           (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8)  |
            static_cast<uint32_t>(p[3]);
}

inline uint64_t get_u64(const uint8_t* p) {
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i) v = (v << 8) | p[i];
    return v;
}

inline float get_f32(const uint8_t* p) {
    const uint32_t bits = get_u32(p);
    float v = 0.0f;
    std::memcpy(&v, &bits, sizeof(v));
    return v;
}

inline double get_f64(const uint8_t* p) {
    const uint64_t bits = get_u64(p);
    double v = 0.0;
    std::memcpy(&v, &bits, sizeof(v));
    return v;
}

} // namespace wire
} // namespace aclink
