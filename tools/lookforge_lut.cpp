/**
 * @file lookforge_lut.cpp
 * @brief 3D LUT generation, application and Hald CLUT conversion
 *
 * Subcommands:
 *   generate       --ref ref.jpg --output look.cube [--method] [--strength] [--size 33]
 *   apply          --lut look.cube --target photo.jpg --output out.png
 *   hald-identity  --level 8 --output identity.png
 *   hald-to-cube   --hald processed.png --output look.cube
 *   cube-to-hald   --lut look.cube --output hald.png
 */

#include <LookForge/LookForge.h>

#include <CLI/CLI.hpp>

#include <cstdio>
#include <iostream>
#include <string>

using namespace Look::Forge;

int main(int argc, char** argv) {
    CLI::App app{"3D LUT tools: generate from a reference look, apply, convert to/from Hald CLUT"};
    app.set_version_flag("--version", GetVersion());
    app.require_subcommand(1);

    std::string logLevel = "info";
    app.add_option("--log-level", logLevel, "trace, debug, info, warn, error or off")
        ->capture_default_str();

    // generate
    CLI::App* generate = app.add_subcommand("generate", "Bake a reference look into a .cube LUT");
    std::string genRef;
    std::string genOutput;
    std::string genMethod = "zone_based";
    double genStrength = 1.0;
    int genSize = Lut::DEFAULT_LUT_SIZE;
    std::string genTitle = Lut::DEFAULT_LUT_TITLE;
    bool genPreserveLuminance = false;
    generate->add_option("--ref", genRef, "Reference image carrying the look")->required();
    generate->add_option("-o,--output", genOutput, "Output .cube path")->required();
    generate->add_option("-m,--method", genMethod, "Transfer method")
        ->check(CLI::IsMember(Transfer::TransferMethodNames()))
        ->capture_default_str();
    generate->add_option("-s,--strength", genStrength, "Transfer strength")
        ->check(CLI::Range(0.0, 1.0))
        ->capture_default_str();
    generate->add_option("--size", genSize, "Lattice size")
        ->check(CLI::IsMember({17, 33, 65}))
        ->capture_default_str();
    generate->add_option("--title", genTitle, "LUT title")->capture_default_str();
    generate->add_flag("--preserve-luminance", genPreserveLuminance, "Keep input lightness");

    // apply
    CLI::App* apply = app.add_subcommand("apply", "Apply a .cube LUT to an image");
    std::string applyLut;
    std::string applyTarget;
    std::string applyOutput;
    std::string applyInterp = "auto";
    apply->add_option("--lut", applyLut, "Input .cube path")->required();
    apply->add_option("--target", applyTarget, "Image to recolor")->required();
    apply->add_option("-o,--output", applyOutput, "Output image path")->required();
    apply->add_option("--interpolation", applyInterp, "auto, trilinear or tricubic")
        ->check(CLI::IsMember({"auto", "trilinear", "tricubic"}))
        ->capture_default_str();

    // hald-identity
    CLI::App* haldIdentity = app.add_subcommand("hald-identity", "Write an identity Hald CLUT image");
    int haldLevel = Lut::HALD_LEVEL_8;
    std::string haldIdentityOutput;
    haldIdentity->add_option("--level", haldLevel, "Hald level (8: 512x512, 12: 1728x1728)")
        ->check(CLI::IsMember({Lut::HALD_LEVEL_8, Lut::HALD_LEVEL_12}))
        ->capture_default_str();
    haldIdentity->add_option("-o,--output", haldIdentityOutput, "Output image path (PNG)")->required();

    // hald-to-cube
    CLI::App* haldToCube = app.add_subcommand("hald-to-cube", "Convert a processed Hald CLUT to .cube");
    std::string h2cInput;
    std::string h2cOutput;
    std::string h2cTitle = Lut::DEFAULT_LUT_TITLE;
    haldToCube->add_option("--hald", h2cInput, "Processed Hald image")->required();
    haldToCube->add_option("-o,--output", h2cOutput, "Output .cube path")->required();
    haldToCube->add_option("--title", h2cTitle, "LUT title")->capture_default_str();

    // cube-to-hald
    CLI::App* cubeToHald = app.add_subcommand("cube-to-hald", "Convert a .cube LUT (64 or 144) to a Hald CLUT");
    std::string c2hInput;
    std::string c2hOutput;
    cubeToHald->add_option("--lut", c2hInput, "Input .cube path")->required();
    cubeToHald->add_option("-o,--output", c2hOutput, "Output image path (PNG)")->required();

    CLI11_PARSE(app, argc, argv);

    try {
        Platform::SetLogLevel(Platform::ParseLogLevel(logLevel));

        if (*generate) {
            Lut::LutParams params;
            params.transfer.method = Transfer::ParseTransferMethod(genMethod);
            params.transfer.strength = genStrength;
            params.transfer.preserveLuminance = genPreserveLuminance;
            params.size = genSize;

            Platform::Timer timer(true);
            Lut::Lut3D lut = Lut::GenerateLutFromFile(genRef, params);
            Lut::WriteCube(lut, genOutput, genTitle);
            std::printf("Generated %dx%dx%d LUT (%s) in %.2f s: %s\n",
                        genSize, genSize, genSize, genMethod.c_str(),
                        timer.ElapsedSeconds(), genOutput.c_str());
        } else if (*apply) {
            Lut::Lut3D lut = Lut::ReadCube(applyLut);
            LImage target = IO::ReadRgbImage(applyTarget);
            LImage result = Lut::ApplyLut(target, lut, Lut::ParseLutInterpolation(applyInterp));
            IO::WriteImage(result, applyOutput);
            std::printf("Applied %d^3 LUT: %s\n", lut.Size(), applyOutput.c_str());
        } else if (*haldIdentity) {
            LImage hald = Lut::GenerateHaldIdentity(haldLevel);
            Lut::WriteHald(hald, haldIdentityOutput);
            std::printf("Identity Hald level %d (%dx%d): %s\n", haldLevel,
                        hald.Width(), hald.Height(), haldIdentityOutput.c_str());
        } else if (*haldToCube) {
            Lut::Lut3D lut = Lut::ReadHald(h2cInput);
            Lut::WriteCube(lut, h2cOutput, h2cTitle);
            std::printf("Hald -> %d^3 LUT: %s\n", lut.Size(), h2cOutput.c_str());
        } else if (*cubeToHald) {
            Lut::Lut3D lut = Lut::ReadCube(c2hInput);
            LImage hald = Lut::LutToHald(lut);
            Lut::WriteHald(hald, c2hOutput);
            std::printf("%d^3 LUT -> Hald %dx%d: %s\n", lut.Size(),
                        hald.Width(), hald.Height(), c2hOutput.c_str());
        }
    } catch (const Exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
