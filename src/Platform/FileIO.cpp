/**
 * @file FileIO.cpp
 * @brief File utilities implementation
 */

#include <LookForge/Platform/FileIO.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <sstream>

// Platform-specific includes
#ifdef _WIN32
#include <direct.h>
#include <io.h>
#define ACCESS _access
#define MKDIR(path) _mkdir(path)
#else
#include <sys/stat.h>
#include <unistd.h>
#define ACCESS access
#define MKDIR(path) mkdir(path, 0755)
#endif

namespace Look::Forge::Platform {

namespace {

bool DirectoryExists(const std::string& path) {
    if (path.empty()) return false;

#ifdef _WIN32
    struct _stat info;
    if (_stat(path.c_str(), &info) != 0) return false;
    return (info.st_mode & _S_IFDIR) != 0;
#else
    struct stat info;
    if (stat(path.c_str(), &info) != 0) return false;
    return S_ISDIR(info.st_mode);
#endif
}

std::string GetFileName(const std::string& path) {
    size_t pos = path.find_last_of("/\\");
    if (pos == std::string::npos) {
        return path;
    }
    return path.substr(pos + 1);
}

std::string GetDirectory(const std::string& path) {
    size_t pos = path.find_last_of("/\\");
    if (pos == std::string::npos) {
        return "";
    }
    return path.substr(0, pos);
}

} // namespace

// ============================================================================
// Path Utilities
// ============================================================================

bool FileExists(const std::string& path) {
    if (path.empty()) return false;
    return ACCESS(path.c_str(), 0) == 0;
}

std::string GetExtension(const std::string& path) {
    std::string name = GetFileName(path);
    size_t dotPos = name.rfind('.');
    if (dotPos == std::string::npos || dotPos == 0) {
        return "";
    }

    std::string ext = name.substr(dotPos);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::string GetStem(const std::string& path) {
    std::string name = GetFileName(path);
    size_t dotPos = name.rfind('.');
    if (dotPos == std::string::npos || dotPos == 0) {
        return name;
    }
    return name.substr(0, dotPos);
}

bool CreateDirectory(const std::string& path) {
    if (path.empty()) return false;
    if (DirectoryExists(path)) return true;

    // Create parent directories first
    std::string parent = GetDirectory(path);
    if (!parent.empty() && !DirectoryExists(parent)) {
        if (!CreateDirectory(parent)) {
            return false;
        }
    }

    return MKDIR(path.c_str()) == 0 || DirectoryExists(path);
}

bool EnsureParentDirectory(const std::string& path) {
    std::string parent = GetDirectory(path);
    if (parent.empty()) return true;
    return CreateDirectory(parent);
}

bool DeleteFile(const std::string& path) {
    if (!FileExists(path)) return true;
    return std::remove(path.c_str()) == 0;
}

// ============================================================================
// Text File I/O
// ============================================================================

bool ReadTextFile(const std::string& path, std::string& content) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    content = buffer.str();

    return !file.bad();
}

bool WriteTextFile(const std::string& path, const std::string& content) {
    if (path.empty() || !EnsureParentDirectory(path)) {
        return false;
    }

    const std::string tmpPath = path + ".tmp";
    {
        std::ofstream file(tmpPath, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            return false;
        }
        file << content;
        file.flush();
        if (!file.good()) {
            file.close();
            DeleteFile(tmpPath);
            return false;
        }
    }

#ifdef _WIN32
    // rename() does not replace an existing file on Windows
    std::remove(path.c_str());
#endif
    if (std::rename(tmpPath.c_str(), path.c_str()) != 0) {
        DeleteFile(tmpPath);
        return false;
    }
    return true;
}

} // namespace Look::Forge::Platform
