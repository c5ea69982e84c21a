#pragma once

/**
 * @file CubeFile.h
 * @brief .cube 3D LUT text format
 *
 * Layout written:
 * @code
 * TITLE "<title>"
 * LUT_3D_SIZE N
 *
 * DOMAIN_MIN 0.0 0.0 0.0
 * DOMAIN_MAX 1.0 1.0 1.0
 *
 * r g b        (N^3 rows, "%.6f", B outermost, R innermost)
 * @endcode
 */

#include <LookForge/Core/Export.h>
#include <LookForge/Lut/Lut3D.h>

#include <string>

namespace Look::Forge::Lut {

/// Title used when none is given
constexpr const char* DEFAULT_LUT_TITLE = "LookForge Filter";

/**
 * @brief Render a LUT as .cube text
 * @throws InvalidArgumentException if lut is empty
 */
LOOKFORGE_API std::string FormatCube(const Lut3D& lut, const std::string& title = DEFAULT_LUT_TITLE);

/**
 * @brief Write a .cube file (parent directories created)
 *
 * The text is fully formatted before the file is touched.
 * @throws IOException on write failure
 */
LOOKFORGE_API void WriteCube(const Lut3D& lut, const std::string& path,
                             const std::string& title = DEFAULT_LUT_TITLE);

/**
 * @brief Parse .cube text
 *
 * Blank lines, '#' comments, TITLE and DOMAIN_* lines are skipped.
 * @throws FormatException if LUT_3D_SIZE is missing or invalid, a data row is
 *         not three numbers, or the row count is not N^3
 * @throws UnsupportedException for 1D LUTs (LUT_1D_SIZE)
 */
LOOKFORGE_API Lut3D ParseCube(const std::string& text);

/**
 * @brief Read and parse a .cube file
 * @throws IOException if the file cannot be read
 */
LOOKFORGE_API Lut3D ReadCube(const std::string& path);

} // namespace Look::Forge::Lut
