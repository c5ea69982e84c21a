#pragma once

/**
 * @file LookForge.h
 * @brief Main header file for LookForge library
 *
 * LookForge extracts the color look of a reference photograph, transfers it
 * onto other images and exports it as a 3D LUT (.cube, Hald CLUT) or an
 * editing-application preset (XMP).
 *
 * @version 0.1.0
 */

// Configuration and export macros
#include <LookForge/LookForgeConfig.h>
#include <LookForge/Core/Export.h>

// Core types and utilities
#include <LookForge/Core/Types.h>
#include <LookForge/Core/Constants.h>
#include <LookForge/Core/Exception.h>

// Core data structures
#include <LookForge/Core/LImage.h>
#include <LookForge/Core/LabImage.h>

// Platform abstraction
#include <LookForge/Platform/Logger.h>

// Feature modules
#include <LookForge/IO/ImageIO.h>
#include <LookForge/Color/ColorConvert.h>
#include <LookForge/Color/ColorStatistics.h>
#include <LookForge/Transfer/TransferAlgorithms.h>
#include <LookForge/Transfer/TransferEngine.h>
#include <LookForge/Lut/Lut3D.h>
#include <LookForge/Lut/CubeFile.h>
#include <LookForge/Lut/HaldClut.h>
#include <LookForge/Lut/LutGenerator.h>
#include <LookForge/Preset/Preset.h>
#include <LookForge/Preset/PresetExport.h>

namespace Look::Forge {

/**
 * @brief Get library version string
 * @return Version string in format "major.minor.patch"
 */
inline const char* GetVersion() {
    return LOOKFORGE_VERSION_STRING;
}

/**
 * @brief Get library version as integers
 */
inline void GetVersion(int& major, int& minor, int& patch) {
    major = LOOKFORGE_VERSION_MAJOR;
    minor = LOOKFORGE_VERSION_MINOR;
    patch = LOOKFORGE_VERSION_PATCH;
}

} // namespace Look::Forge
