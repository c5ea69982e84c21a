#pragma once

/**
 * @file LutGenerator.h
 * @brief Bake a color transfer into a 3D LUT
 *
 * The identity lattice of the requested size is run through the transfer
 * pipeline against the reference; the resulting colors (never quantized)
 * become the LUT nodes.
 */

#include <LookForge/Core/Export.h>
#include <LookForge/Core/LImage.h>
#include <LookForge/Lut/Lut3D.h>
#include <LookForge/Transfer/TransferEngine.h>

#include <cstdint>
#include <string>

namespace Look::Forge::Lut {

/// Lattice size used when none is given
constexpr int32_t DEFAULT_LUT_SIZE = 33;

/**
 * @brief LUT generation parameters
 */
struct LutParams {
    Transfer::TransferParams transfer;      ///< Method, strength, luminance
    int32_t size = DEFAULT_LUT_SIZE;        ///< Nodes per axis (17, 33 and 65 are usual)

    static LutParams Default() { return LutParams(); }
};

/**
 * @brief Generate a LUT reproducing the transfer of reference's look
 *
 * @throws InvalidArgumentException if size < 2 or strength outside [0, 1]
 */
LOOKFORGE_API Lut3D GenerateLut(const LImage& reference, const LutParams& params = LutParams::Default());

/**
 * @brief Load the reference, then GenerateLut
 * @throws IOException if the reference cannot be read
 */
LOOKFORGE_API Lut3D GenerateLutFromFile(const std::string& referencePath,
                                        const LutParams& params = LutParams::Default());

} // namespace Look::Forge::Lut
