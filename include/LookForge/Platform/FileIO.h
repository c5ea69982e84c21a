#pragma once

#include <LookForge/Core/Export.h>

/**
 * @file FileIO.h
 * @brief Cross-platform file utilities
 *
 * Provides:
 * - Path utilities (extension, stem, parent directory)
 * - File/directory existence checks and directory creation
 * - Text file read/write; writes go through a temporary file so a failed
 *   write never leaves a truncated target behind
 *
 * Note: Image I/O is handled by LImage / IO::ReadImage using stb_image.
 */

#include <string>

namespace Look::Forge::Platform {

// ============================================================================
// Path Utilities
// ============================================================================

/// Check if a regular file (or anything) exists at path
LOOKFORGE_API bool FileExists(const std::string& path);

/**
 * @brief Get file extension (including dot), lower-cased
 * @return Extension like ".png", or empty string if none
 */
LOOKFORGE_API std::string GetExtension(const std::string& path);

/// Get filename without directory and extension ("a/b/photo.jpg" -> "photo")
LOOKFORGE_API std::string GetStem(const std::string& path);

/**
 * @brief Create directory (and parents if needed)
 * @return true if created or already exists
 */
LOOKFORGE_API bool CreateDirectory(const std::string& path);

/**
 * @brief Create the parent directory of a file path if missing
 * @return true if the parent exists afterwards (or path has no parent)
 */
LOOKFORGE_API bool EnsureParentDirectory(const std::string& path);

/// Delete file; true if it no longer exists
LOOKFORGE_API bool DeleteFile(const std::string& path);

// ============================================================================
// Text File I/O
// ============================================================================

/**
 * @brief Read entire text file
 * @return false if the file cannot be opened
 */
LOOKFORGE_API bool ReadTextFile(const std::string& path, std::string& content);

/**
 * @brief Write text file via "<path>.tmp" + rename
 *
 * Parent directories are created. On failure the temporary file is removed
 * and the previous content of path (if any) is untouched.
 * @return false on any failure
 */
LOOKFORGE_API bool WriteTextFile(const std::string& path, const std::string& content);

} // namespace Look::Forge::Platform
