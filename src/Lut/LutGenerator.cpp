/**
 * @file LutGenerator.cpp
 * @brief Transfer-to-LUT baking
 */

#include <LookForge/Lut/LutGenerator.h>
#include <LookForge/Color/ColorConvert.h>
#include <LookForge/Core/Validate.h>
#include <LookForge/IO/ImageIO.h>
#include <LookForge/Platform/Logger.h>
#include <LookForge/Platform/Timer.h>

namespace Look::Forge::Lut {

Lut3D GenerateLut(const LImage& reference, const LutParams& params) {
    Validate::RequireImageNonEmpty(reference, "GenerateLut");
    Validate::RequireMin(params.size, LUT_MIN_SIZE, "size", "GenerateLut");
    Validate::RequireRange(params.transfer.strength, 0.0, 1.0, "strength", "GenerateLut");

    Platform::ScopedTimer timer("GenerateLut");
    const int32_t n = params.size;
    Log::Debug("GenerateLut: {}^3, method={}", n, Transfer::TransferMethodName(params.transfer.method));

    LabImage refLab = Color::RgbToLab(reference.ToRgb());
    LabImage latticeLab = Color::RgbToLab(CreateIdentityLattice(n));

    LabImage resultLab = Transfer::ApplyTransferLab(refLab, latticeLab, params.transfer);

    // Lattice row-major order matches the LUT layout (R fastest)
    Lut3D lut(n);
    std::vector<double>& data = lut.Data();
    for (size_t i = 0; i < resultLab.PixelCount(); ++i) {
        double r, g, b;
        Color::LabToRgb(resultLab.At(i, 0), resultLab.At(i, 1), resultLab.At(i, 2), r, g, b);
        data[i * 3 + 0] = r;
        data[i * 3 + 1] = g;
        data[i * 3 + 2] = b;
    }

    return lut;
}

Lut3D GenerateLutFromFile(const std::string& referencePath, const LutParams& params) {
    return GenerateLut(IO::ReadRgbImage(referencePath), params);
}

} // namespace Look::Forge::Lut
