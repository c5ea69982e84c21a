/**
 * @file TransferEngine.cpp
 * @brief Color transfer pipeline implementation
 */

#include <LookForge/Transfer/TransferEngine.h>
#include <LookForge/Transfer/TransferAlgorithms.h>
#include <LookForge/Color/ColorConvert.h>
#include <LookForge/Core/Exception.h>
#include <LookForge/Core/Validate.h>
#include <LookForge/IO/ImageIO.h>
#include <LookForge/Platform/Logger.h>
#include <LookForge/Platform/Timer.h>

namespace Look::Forge::Transfer {

namespace {

struct MethodEntry {
    TransferMethod method;
    const char* name;
};

constexpr MethodEntry METHODS[] = {
    {TransferMethod::GlobalLab, "global_lab"},
    {TransferMethod::ZoneBased, "zone_based"},
    {TransferMethod::Histogram, "histogram"},
    {TransferMethod::Improved,  "improved"},
};

LabImage Dispatch(const LabImage& reference, const LabImage& target, TransferMethod method) {
    switch (method) {
        case TransferMethod::GlobalLab: return TransferGlobalLab(reference, target);
        case TransferMethod::ZoneBased: return TransferZoneBased(reference, target);
        case TransferMethod::Histogram: return TransferHistogram(reference, target);
        case TransferMethod::Improved:  return TransferImproved(reference, target);
    }
    throw InvalidArgumentException("ApplyTransferLab: unknown transfer method");
}

} // namespace

// =============================================================================
// Method names
// =============================================================================

TransferMethod ParseTransferMethod(const std::string& name) {
    for (const auto& entry : METHODS) {
        if (name == entry.name) {
            return entry.method;
        }
    }

    std::string valid;
    for (const auto& entry : METHODS) {
        if (!valid.empty()) valid += ", ";
        valid += entry.name;
    }
    throw ConfigurationException("unknown transfer method '" + name + "' (valid: " + valid + ")");
}

const char* TransferMethodName(TransferMethod method) {
    for (const auto& entry : METHODS) {
        if (entry.method == method) {
            return entry.name;
        }
    }
    return "unknown";
}

std::vector<std::string> TransferMethodNames() {
    std::vector<std::string> names;
    for (const auto& entry : METHODS) {
        names.emplace_back(entry.name);
    }
    return names;
}

// =============================================================================
// Pipeline
// =============================================================================

LabImage ApplyTransferLab(const LabImage& reference, const LabImage& target,
                          const TransferParams& params) {
    Validate::RequireRange(params.strength, 0.0, 1.0, "strength", "ApplyTransferLab");

    LabImage result = Dispatch(reference, target, params.method);

    const size_t n = target.PixelCount();
    if (params.preserveLuminance) {
        for (size_t i = 0; i < n; ++i) {
            result.At(i, Color::LAB_L) = target.At(i, Color::LAB_L);
        }
    }

    if (params.strength < 1.0) {
        const double s = params.strength;
        std::vector<double>& out = result.Values();
        const std::vector<double>& orig = target.Values();
        for (size_t i = 0; i < out.size(); ++i) {
            out[i] = orig[i] * (1.0 - s) + out[i] * s;
        }
    }

    return result;
}

TransferResult Transfer(const LImage& reference, const LImage& target,
                        const TransferParams& params) {
    Validate::RequireImageNonEmpty(reference, "Transfer");
    Validate::RequireImageNonEmpty(target, "Transfer");
    Validate::RequireRange(params.strength, 0.0, 1.0, "strength", "Transfer");

    Platform::Timer timer(true);
    Log::Debug("Transfer: method={} strength={:.2f} preserveLuminance={}",
               TransferMethodName(params.method), params.strength, params.preserveLuminance);

    LabImage refLab = Color::RgbToLab(reference.ToRgb());
    LabImage tgtLab = Color::RgbToLab(target.ToRgb());

    TransferResult result;
    result.referenceStats = Color::ExtractStatistics(refLab);

    LabImage outLab = ApplyTransferLab(refLab, tgtLab, params);
    result.image = Color::QuantizeToU8(Color::LabToRgb(outLab));
    result.method = params.method;

    timer.Stop();
    result.elapsedSeconds = timer.ElapsedSeconds();
    Log::Debug("Transfer finished in {:.3f} s", result.elapsedSeconds);
    return result;
}

TransferResult TransferFiles(const std::string& referencePath, const std::string& targetPath,
                             const TransferParams& params) {
    LImage reference = IO::ReadRgbImage(referencePath);
    LImage target = IO::ReadRgbImage(targetPath);
    return Transfer(reference, target, params);
}

} // namespace Look::Forge::Transfer
