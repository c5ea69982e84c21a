/**
 * @file Random.cpp
 * @brief Random number generation implementation
 */

#include <LookForge/Platform/Random.h>

#include <chrono>
#include <functional>
#include <thread>

namespace Look::Forge::Platform {

Random& Random::Instance() {
    thread_local Random instance;
    return instance;
}

Random::Random() {
    // Time combined with thread ID so concurrent threads diverge
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::high_resolution_clock::now().time_since_epoch()).count();
    uint64_t threadHash = std::hash<std::thread::id>{}(std::this_thread::get_id());

    seed_ = static_cast<uint64_t>(nanos) ^ threadHash ^ std::random_device{}();
    gen_.seed(seed_);
}

void Random::SetSeed(uint64_t seed) {
    seed_ = seed;
    gen_.seed(seed);
}

uint64_t Random::Uint64() {
    return gen_();
}

double Random::Double() {
    return std::uniform_real_distribution<double>(0.0, 1.0)(gen_);
}

std::string Random::Uuid4(bool upperCase, bool withHyphens) {
    uint8_t bytes[16];
    uint64_t hi = gen_();
    uint64_t lo = gen_();
    for (int i = 0; i < 8; ++i) {
        bytes[i] = static_cast<uint8_t>(hi >> (56 - 8 * i));
        bytes[8 + i] = static_cast<uint8_t>(lo >> (56 - 8 * i));
    }

    // Version 4, variant 10xx
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

    const char* digits = upperCase ? "0123456789ABCDEF" : "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (int i = 0; i < 16; ++i) {
        if (withHyphens && (i == 4 || i == 6 || i == 8 || i == 10)) {
            out.push_back('-');
        }
        out.push_back(digits[bytes[i] >> 4]);
        out.push_back(digits[bytes[i] & 0x0F]);
    }
    return out;
}

} // namespace Look::Forge::Platform
