#include "blobup/upload/mime.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <unordered_map>

namespace blobup {

namespace {

const std::unordered_map<std::string, std::string>& extension_table() {
    static const std::unordered_map<std::string, std::string> table = {
        // Images
        {"png", "image/png"},
        {"jpg", "image/jpeg"},
        {"jpeg", "image/jpeg"},
        {"gif", "image/gif"},
        {"webp", "image/webp"},
        // Audio
        {"wav", "audio/wav"},
        {"mp3", "audio/mp3"},
        {"flac", "audio/flac"},
        {"ogg", "audio/ogg"},
        {"m4a", "audio/mp4"},
        {"aac", "audio/aac"},
        // Video
        {"mp4", "video/mp4"},
        {"webm", "video/webm"},
        {"mov", "video/quicktime"},
        {"avi", "video/x-msvideo"},
        {"mkv", "video/x-matroska"},
    };
    return table;
}

bool is_token_char(unsigned char c) {
    if (std::isalnum(c)) return true;
    return std::strchr("!#$%&'*+-.^_`|~", c) != nullptr && c != '\0';
}

bool is_token(const std::string& s) {
    if (s.empty()) return false;
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return is_token_char(c); });
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

} // namespace

std::string mime_type_for_extension(const std::string& extension) {
    std::string ext = extension;
    if (!ext.empty() && ext.front() == '.') {
        ext.erase(0, 1);
    }
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    const auto& table = extension_table();
    auto it = table.find(ext);
    if (it != table.end()) {
        return it->second;
    }
    return "application/octet-stream";
}

std::string mime_type_for_path(const std::string& path) {
    return mime_type_for_extension(std::filesystem::path(path).extension().string());
}

bool is_valid_mime_type(const std::string& mime) {
    std::string essence = mime;
    size_t semi = mime.find(';');
    if (semi != std::string::npos) {
        essence = mime.substr(0, semi);
        // Parameters must still be printable ASCII
        for (size_t i = semi; i < mime.size(); ++i) {
            unsigned char c = static_cast<unsigned char>(mime[i]);
            if ((c < 0x20 && c != '\t') || c > 0x7E) return false;
        }
    }
    essence = trim(essence);

    size_t slash = essence.find('/');
    if (slash == std::string::npos) return false;
    return is_token(essence.substr(0, slash)) && is_token(essence.substr(slash + 1));
}

} // namespace blobup
