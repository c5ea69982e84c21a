/**
 * @file lookforge_preset.cpp
 * @brief Derive an XMP preset from a reference photo
 *
 * Usage:
 *   lookforge_preset --ref ref.jpg --output look.xmp [--name "My Look"]
 */

#include <LookForge/LookForge.h>

#include <CLI/CLI.hpp>

#include <cstdio>
#include <iostream>
#include <string>

using namespace Look::Forge;

int main(int argc, char** argv) {
    CLI::App app{"Derive an XMP develop preset from a reference image"};
    app.set_version_flag("--version", GetVersion());

    std::string refPath;
    std::string outputPath;
    std::string name;
    std::string logLevel = "info";

    app.add_option("--ref", refPath, "Reference image carrying the look")->required();
    app.add_option("-o,--output", outputPath, "Output .xmp path")->required();
    app.add_option("--name", name, "Preset name (default: \"Color Transfer from <stem>\")");
    app.add_option("--log-level", logLevel, "trace, debug, info, warn, error or off")
        ->capture_default_str();

    CLI11_PARSE(app, argc, argv);

    try {
        Platform::SetLogLevel(Platform::ParseLogLevel(logLevel));

        Preset::Preset preset = Preset::DerivePresetFromFile(refPath, name);
        Preset::WritePreset(preset, outputPath);

        const Preset::ToneParams& tone = preset.tone;
        const Preset::SplitToningParams& st = preset.splitToning;
        std::printf("Preset:     %s\n", preset.name.c_str());
        std::printf("Exposure:   %+.2f\n", tone.exposure);
        std::printf("Contrast:   %+.2f\n", tone.contrast);
        std::printf("Highlights: %+.2f\n", tone.highlights);
        std::printf("Shadows:    %+.2f\n", tone.shadows);
        std::printf("Vibrance:   %+.2f\n", tone.vibrance);
        std::printf("Shadow tint:    hue %d, saturation %d\n", st.shadowHue, st.shadowSaturation);
        std::printf("Highlight tint: hue %d, saturation %d\n", st.highlightHue, st.highlightSaturation);
        std::printf("Output:     %s\n", outputPath.c_str());
    } catch (const Exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
