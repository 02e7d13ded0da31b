/**
 * @file BotRecord.cpp
 * @brief Runtime/extension mapping for bot scripts
 * @version 1.0
 * @date 2025-01-01
 */

#include "BotRecord.hpp"

#include <algorithm>
#include <cctype>

std::optional<FileType> fileTypeFromExtension(const std::string& extension) {
    std::string ext = extension;
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == "py") {
        return FileType::Python;
    }
    if (ext == "js") {
        return FileType::JavaScript;
    }
    return std::nullopt;
}

const char* fileTypeExtension(FileType type) {
    switch (type) {
        case FileType::Python:     return "py";
        case FileType::JavaScript: return "js";
    }
    return "";
}
