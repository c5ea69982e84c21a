#pragma once

/**
 * @file TransferEngine.h
 * @brief Color transfer pipeline: method dispatch, luminance, strength
 *
 * @code
 * auto params = Transfer::TransferParams::Default();
 * params.method = Transfer::TransferMethod::Improved;
 * params.strength = 0.8;
 * auto result = Transfer::TransferFiles("ref.jpg", "target.jpg", params);
 * IO::WriteImage(result.image, "out.png");
 * @endcode
 */

#include <LookForge/Color/ColorStatistics.h>
#include <LookForge/Core/Export.h>
#include <LookForge/Core/LImage.h>
#include <LookForge/Core/LabImage.h>

#include <string>
#include <vector>

namespace Look::Forge::Transfer {

// =============================================================================
// Parameters
// =============================================================================

/**
 * @brief Transfer algorithm
 */
enum class TransferMethod {
    GlobalLab,      ///< Per-channel mean/std matching
    ZoneBased,      ///< Zone chroma matching with soft transitions
    Histogram,      ///< Per-channel CDF matching
    Improved        ///< Histogram matching, then zone chroma matching
};

/**
 * @brief Parse "global_lab", "zone_based", "histogram" or "improved"
 * @throws ConfigurationException listing the valid names otherwise
 */
LOOKFORGE_API TransferMethod ParseTransferMethod(const std::string& name);

/// Canonical name of a method (inverse of ParseTransferMethod)
LOOKFORGE_API const char* TransferMethodName(TransferMethod method);

/// All canonical method names, in enum order
LOOKFORGE_API std::vector<std::string> TransferMethodNames();

/**
 * @brief Transfer parameters
 */
struct TransferParams {
    TransferMethod method = TransferMethod::ZoneBased;
    double strength = 1.0;              ///< Blend toward the result, [0, 1]
    bool preserveLuminance = false;     ///< Keep the target's L channel

    static TransferParams Default() { return TransferParams(); }
};

/**
 * @brief Transfer output
 */
struct TransferResult {
    LImage image;                           ///< UInt8 RGB, same size as target
    Color::LookStatistics referenceStats;   ///< Statistics of the reference
    TransferMethod method = TransferMethod::ZoneBased;
    double elapsedSeconds = 0;
};

// =============================================================================
// Functions
// =============================================================================

/**
 * @brief Run the Lab part of the pipeline
 *
 * Dispatches on params.method, copies the target's L when preserveLuminance
 * is set, then blends target * (1 - strength) + result * strength when
 * strength < 1. No quantization.
 *
 * @throws InvalidArgumentException if strength is outside [0, 1]
 */
LOOKFORGE_API LabImage ApplyTransferLab(const LabImage& reference, const LabImage& target,
                                        const TransferParams& params);

/**
 * @brief Transfer the look of reference onto target
 *
 * Inputs may be UInt8 or Float32, Gray, RGB or RGBA; they are converted to
 * RGB first. The output is quantized to 8 bits once, at the end.
 */
LOOKFORGE_API TransferResult Transfer(const LImage& reference, const LImage& target,
                                      const TransferParams& params = TransferParams::Default());

/**
 * @brief Load both images, then Transfer
 * @throws IOException if either file is missing or unreadable (before any computation)
 */
LOOKFORGE_API TransferResult TransferFiles(const std::string& referencePath,
                                           const std::string& targetPath,
                                           const TransferParams& params = TransferParams::Default());

} // namespace Look::Forge::Transfer
