#include "dash/content_types.h"

#include <algorithm>
#include <cctype>
#include <utility>

namespace dash {

ContentTypeTable::ContentTypeTable(std::map<std::string, std::string> types, std::string fallback)
    : _types(std::move(types)), _fallback(std::move(fallback)) {}

ContentTypeTable ContentTypeTable::default_table() {
    return ContentTypeTable(
        {
            {"", "application/octet-stream"},
            {".manifest", "text/cache-manifest"},
            {".html", "text/html"},
            {".png", "image/png"},
            {".jpg", "image/jpg"},
            {".jpeg", "image/jpeg"},
            {".svg", "image/svg+xml"},
            {".css", "text/css"},
            {".js", "application/x-javascript"},
            {".mpd", "application/dash+xml"}, // MPEG-DASH manifest
        },
        "application/octet-stream");
}

std::string ContentTypeTable::extension_of(const std::string& path) {
    std::string::size_type slash = path.find_last_of('/');
    std::string::size_type start = (slash == std::string::npos) ? 0 : slash + 1;

    // skip leading dots of the file name
    while (start < path.size() && path[start] == '.') ++start;

    std::string::size_type dot = path.rfind('.');
    if (dot == std::string::npos || dot < start) return "";
    return path.substr(dot);
}

const std::string& ContentTypeTable::lookup(const std::string& path) const {
    std::string ext = extension_of(path);

    auto it = _types.find(ext);
    if (it != _types.end()) return it->second;

    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    it = _types.find(ext);
    if (it != _types.end()) return it->second;

    return _fallback;
}

} // namespace dash
