#pragma once
#include <map>
#include <string>

namespace dash {

// Immutable extension -> MIME type table with a fallback for unmatched
// extensions. Extensions include the leading dot; "" names files without one.
class ContentTypeTable {
public:
    ContentTypeTable(std::map<std::string, std::string> types, std::string fallback);

    // The table served by dash_server: DASH manifests plus common web assets.
    static ContentTypeTable default_table();

    // Extension of the final path component, e.g. ".mpd". Leading dots do
    // not start an extension, so ".hidden" has none.
    static std::string extension_of(const std::string& path);

    // Exact match first, then the lower-cased extension, then the fallback.
    const std::string& lookup(const std::string& path) const;

    const std::string& fallback() const { return _fallback; }
    size_t size() const { return _types.size(); }

private:
    std::map<std::string, std::string> _types;
    std::string _fallback;
};

} // namespace dash
