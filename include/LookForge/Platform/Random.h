#pragma once

/**
 * @file Random.h
 * @brief Random number generation for identifiers
 *
 * Used to stamp exported presets with an RFC 4122 version-4 UUID. Color
 * transforms themselves never draw random numbers.
 */

#include <LookForge/Core/Export.h>

#include <cstdint>
#include <random>
#include <string>

namespace Look::Forge::Platform {

/**
 * @brief Thread-local random generator (MT19937-64)
 */
class LOOKFORGE_API Random {
public:
    /// Thread-local instance
    static Random& Instance();

    /// Reseed the current thread's generator
    void SetSeed(uint64_t seed);

    uint64_t GetSeed() const { return seed_; }

    /// Random 64-bit unsigned integer
    uint64_t Uint64();

    /// Random double in [0, 1)
    double Double();

    /**
     * @brief Random version-4 UUID
     * @param upperCase Emit A-F instead of a-f
     * @param withHyphens Emit 8-4-4-4-12 grouping (otherwise 32 hex digits)
     */
    std::string Uuid4(bool upperCase = false, bool withHyphens = true);

private:
    Random();

    uint64_t seed_ = 0;
    std::mt19937_64 gen_;
};

} // namespace Look::Forge::Platform
