/**
 * @file lookforge_transfer.cpp
 * @brief Transfer the color look of a reference photo onto a target photo
 *
 * Usage:
 *   lookforge_transfer --ref ref.jpg --target photo.jpg --output out.png
 *                      [--method zone_based] [--strength 1.0] [--preserve-luminance]
 */

#include <LookForge/LookForge.h>

#include <CLI/CLI.hpp>

#include <cstdio>
#include <iostream>
#include <string>

using namespace Look::Forge;

int main(int argc, char** argv) {
    CLI::App app{"Transfer the color look of a reference image onto a target image"};
    app.set_version_flag("--version", GetVersion());

    std::string refPath;
    std::string targetPath;
    std::string outputPath;
    std::string method = "zone_based";
    double strength = 1.0;
    bool preserveLuminance = false;
    std::string logLevel = "info";

    app.add_option("--ref", refPath, "Reference image carrying the look")->required();
    app.add_option("--target", targetPath, "Image to recolor")->required();
    app.add_option("-o,--output", outputPath, "Output image path")->required();
    app.add_option("-m,--method", method, "Transfer method")
        ->check(CLI::IsMember(Transfer::TransferMethodNames()))
        ->capture_default_str();
    app.add_option("-s,--strength", strength, "Transfer strength")
        ->check(CLI::Range(0.0, 1.0))
        ->capture_default_str();
    app.add_flag("--preserve-luminance", preserveLuminance, "Keep the target's lightness");
    app.add_option("--log-level", logLevel, "trace, debug, info, warn, error or off")
        ->capture_default_str();

    CLI11_PARSE(app, argc, argv);

    try {
        Platform::SetLogLevel(Platform::ParseLogLevel(logLevel));

        Transfer::TransferParams params;
        params.method = Transfer::ParseTransferMethod(method);
        params.strength = strength;
        params.preserveLuminance = preserveLuminance;

        Transfer::TransferResult result = Transfer::TransferFiles(refPath, targetPath, params);
        IO::WriteImage(result.image, outputPath);

        std::printf("Method:   %s\n", Transfer::TransferMethodName(result.method));
        std::printf("Strength: %.2f\n", params.strength);
        std::printf("Size:     %dx%d\n", result.image.Width(), result.image.Height());
        std::printf("Time:     %.3f s\n", result.elapsedSeconds);
        std::printf("Output:   %s\n", outputPath.c_str());
    } catch (const Exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
