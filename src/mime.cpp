#include "pulse/mime.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <map>

namespace Pulse {

namespace {

const std::map<std::string, std::string>& mime_table() {
    static const std::map<std::string, std::string> table = {
        {".avif", "image/avif"},
        {".bmp", "image/bmp"},
        {".css", "text/css; charset=utf-8"},
        {".csv", "text/csv; charset=utf-8"},
        {".doc", "application/msword"},
        {".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
        {".gif", "image/gif"},
        {".gz", "application/gzip"},
        {".heic", "image/heic"},
        {".htm", "text/html; charset=utf-8"},
        {".html", "text/html; charset=utf-8"},
        {".ico", "image/vnd.microsoft.icon"},
        {".jpeg", "image/jpeg"},
        {".jpg", "image/jpeg"},
        {".js", "text/javascript; charset=utf-8"},
        {".json", "application/json"},
        {".m4a", "audio/mp4"},
        {".md", "text/markdown; charset=utf-8"},
        {".mjs", "text/javascript; charset=utf-8"},
        {".mov", "video/quicktime"},
        {".mp3", "audio/mpeg"},
        {".mp4", "video/mp4"},
        {".ogg", "audio/ogg"},
        {".pdf", "application/pdf"},
        {".png", "image/png"},
        {".svg", "image/svg+xml"},
        {".tar", "application/x-tar"},
        {".txt", "text/plain; charset=utf-8"},
        {".wasm", "application/wasm"},
        {".wav", "audio/wav"},
        {".webm", "video/webm"},
        {".webp", "image/webp"},
        {".xml", "text/xml; charset=utf-8"},
        {".yaml", "application/yaml"},
        {".yml", "application/yaml"},
        {".zip", "application/zip"},
    };
    return table;
}

} // namespace

std::string mime_type_for(const std::string& filename) {
    std::string ext = std::filesystem::path(filename).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    const auto& table = mime_table();
    auto it = table.find(ext);
    if (it == table.end()) {
        return DEFAULT_MIME_TYPE;
    }
    return it->second;
}

} // namespace Pulse
