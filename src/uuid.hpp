// src/uuid.hpp
// Random v4 UUID in canonical 8-4-4-4-12 form.

#pragma once

#include <cstdint>
#include <cstdio>
#include <cstring>
#include <random>
#include <string>

namespace beacon {

inline std::string generate_uuid() {
    static thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dist;

    uint8_t bytes[16];
    uint64_t a = dist(gen);
    uint64_t b = dist(gen);
    std::memcpy(bytes, &a, 8);
    std::memcpy(bytes + 8, &b, 8);

    bytes[6] = (bytes[6] & 0x0F) | 0x40; // version 4
    bytes[8] = (bytes[8] & 0x3F) | 0x80; // variant 1

    char out[37];
    std::snprintf(out, sizeof(out),
        "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
        bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5], bytes[6], bytes[7],
        bytes[8], bytes[9], bytes[10], bytes[11], bytes[12], bytes[13], bytes[14], bytes[15]);
    return std::string(out, 36);
}

} // namespace beacon
