/**
 * @file CubeFile.cpp
 * @brief .cube read/write
 */

#include <LookForge/Lut/CubeFile.h>
#include <LookForge/Core/Exception.h>
#include <LookForge/Platform/FileIO.h>
#include <LookForge/Platform/Logger.h>

#include <array>
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <vector>

namespace Look::Forge::Lut {

namespace {

bool StartsWith(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

std::string Trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return std::string();
    }
    size_t end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

bool ParseDouble(const std::string& token, double& value) {
    const char* begin = token.c_str();
    char* end = nullptr;
    value = std::strtod(begin, &end);
    return end != begin && *end == '\0';
}

int32_t ParseSize(const std::string& line, int lineNo) {
    std::istringstream iss(line);
    std::string keyword, token, extra;
    iss >> keyword >> token;
    if (token.empty() || (iss >> extra)) {
        throw FormatException("line " + std::to_string(lineNo) + ": malformed LUT_3D_SIZE");
    }

    char* end = nullptr;
    long size = std::strtol(token.c_str(), &end, 10);
    if (*end != '\0' || size < LUT_MIN_SIZE || size > 256) {
        throw FormatException("line " + std::to_string(lineNo) +
                              ": invalid LUT_3D_SIZE '" + token + "'");
    }
    return static_cast<int32_t>(size);
}

} // namespace

// =============================================================================
// Write
// =============================================================================

std::string FormatCube(const Lut3D& lut, const std::string& title) {
    if (lut.Empty()) {
        throw InvalidArgumentException("FormatCube: LUT is empty");
    }

    const int32_t n = lut.Size();
    std::string text;
    text.reserve(static_cast<size_t>(n) * n * n * 27 + 128);

    text += "TITLE \"" + title + "\"\n";
    text += "LUT_3D_SIZE " + std::to_string(n) + "\n";
    text += "\n";
    text += "DOMAIN_MIN 0.0 0.0 0.0\n";
    text += "DOMAIN_MAX 1.0 1.0 1.0\n";
    text += "\n";

    char line[96];
    for (int32_t b = 0; b < n; ++b) {
        for (int32_t g = 0; g < n; ++g) {
            for (int32_t r = 0; r < n; ++r) {
                std::snprintf(line, sizeof(line), "%.6f %.6f %.6f\n",
                              lut.At(r, g, b, 0), lut.At(r, g, b, 1), lut.At(r, g, b, 2));
                text += line;
            }
        }
    }

    return text;
}

void WriteCube(const Lut3D& lut, const std::string& path, const std::string& title) {
    std::string text = FormatCube(lut, title);
    if (!Platform::WriteTextFile(path, text)) {
        throw IOException("failed to write LUT file: " + path);
    }
    Log::Info("LUT written: {} ({}x{}x{})", path, lut.Size(), lut.Size(), lut.Size());
}

// =============================================================================
// Read
// =============================================================================

Lut3D ParseCube(const std::string& text) {
    int32_t size = 0;
    std::vector<std::array<double, 3>> rows;

    std::istringstream stream(text);
    std::string raw;
    int lineNo = 0;
    while (std::getline(stream, raw)) {
        ++lineNo;
        std::string line = Trim(raw);
        if (line.empty() || line[0] == '#') continue;
        if (StartsWith(line, "TITLE")) continue;
        if (StartsWith(line, "DOMAIN_MIN") || StartsWith(line, "DOMAIN_MAX")) continue;
        if (StartsWith(line, "LUT_1D_SIZE")) {
            throw UnsupportedException("1D LUTs are not supported (line " +
                                       std::to_string(lineNo) + ")");
        }
        if (StartsWith(line, "LUT_3D_SIZE")) {
            size = ParseSize(line, lineNo);
            continue;
        }

        std::istringstream fields(line);
        std::array<double, 3> row{};
        std::string token;
        int count = 0;
        while (fields >> token) {
            if (count >= 3 || !ParseDouble(token, row[count])) {
                throw FormatException("line " + std::to_string(lineNo) +
                                      ": expected three numbers, got '" + line + "'");
            }
            ++count;
        }
        if (count != 3) {
            throw FormatException("line " + std::to_string(lineNo) +
                                  ": expected three numbers, got '" + line + "'");
        }
        rows.push_back(row);
    }

    if (size == 0) {
        throw FormatException("missing LUT_3D_SIZE");
    }

    const size_t expected = static_cast<size_t>(size) * size * size;
    if (rows.size() != expected) {
        throw FormatException("data row count " + std::to_string(rows.size()) +
                              " != expected " + std::to_string(expected));
    }

    Lut3D lut(size);
    size_t idx = 0;
    for (int32_t b = 0; b < size; ++b) {
        for (int32_t g = 0; g < size; ++g) {
            for (int32_t r = 0; r < size; ++r) {
                const auto& row = rows[idx++];
                lut.Set(r, g, b, row[0], row[1], row[2]);
            }
        }
    }

    return lut;
}

Lut3D ReadCube(const std::string& path) {
    if (!Platform::FileExists(path)) {
        throw IOException("file not found: " + path);
    }
    std::string text;
    if (!Platform::ReadTextFile(path, text)) {
        throw IOException("failed to read LUT file: " + path);
    }
    Lut3D lut = ParseCube(text);
    Log::Debug("LUT read: {} (size {})", path, lut.Size());
    return lut;
}

} // namespace Look::Forge::Lut
