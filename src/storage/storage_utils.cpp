/**
 * @file storage_utils.cpp
 * @brief Shared helpers for the object storage backend
 */

#include "kcenon/cloud_upload/storage/storage_utils.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <iomanip>
#include <random>
#include <sstream>
#include <unordered_map>

namespace kcenon::cloud_upload::storage_utils {

// ============================================================================
// Encoding Utilities
// ============================================================================

namespace {
constexpr const char* BASE64_CHARS =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
}  // namespace

auto base64_encode(const std::vector<uint8_t>& data) -> std::string {
    std::string result;
    result.reserve(((data.size() + 2) / 3) * 4);

    for (std::size_t i = 0; i < data.size(); i += 3) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        if (i + 1 < data.size()) n |= static_cast<uint32_t>(data[i + 1]) << 8;
        if (i + 2 < data.size()) n |= static_cast<uint32_t>(data[i + 2]);

        result += BASE64_CHARS[(n >> 18) & 0x3F];
        result += BASE64_CHARS[(n >> 12) & 0x3F];
        result += (i + 1 < data.size()) ? BASE64_CHARS[(n >> 6) & 0x3F] : '=';
        result += (i + 2 < data.size()) ? BASE64_CHARS[n & 0x3F] : '=';
    }

    return result;
}

auto base64_encode(const std::string& data) -> std::string {
    std::vector<uint8_t> bytes(data.begin(), data.end());
    return base64_encode(bytes);
}

auto base64url_encode(const std::vector<uint8_t>& data) -> std::string {
    std::string result = base64_encode(data);

    for (auto& c : result) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }

    while (!result.empty() && result.back() == '=') {
        result.pop_back();
    }

    return result;
}

auto base64url_encode(const std::string& data) -> std::string {
    std::vector<uint8_t> bytes(data.begin(), data.end());
    return base64url_encode(bytes);
}

auto url_encode(const std::string& value, bool encode_slash) -> std::string {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex;

    for (char c : value) {
        if (std::isalnum(static_cast<unsigned char>(c)) ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else if (c == '/' && !encode_slash) {
            escaped << c;
        } else {
            escaped << '%' << std::setw(2) << std::uppercase
                    << static_cast<int>(static_cast<unsigned char>(c));
        }
    }

    return escaped.str();
}

auto json_escape(std::string_view value) -> std::string {
    std::string output;
    output.reserve(value.size() + 8);
    for (char c : value) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    std::ostringstream oss;
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(static_cast<unsigned char>(c));
                    output += oss.str();
                } else {
                    output += c;
                }
        }
    }
    return output;
}

// ============================================================================
// JSON Utilities
// ============================================================================

namespace {

auto unescape_json_string(std::string_view raw) -> std::string {
    std::string out;
    out.reserve(raw.size());
    for (std::size_t i = 0; i < raw.size(); ++i) {
        char c = raw[i];
        if (c != '\\' || i + 1 >= raw.size()) {
            out += c;
            continue;
        }
        char next = raw[++i];
        switch (next) {
            case 'n': out += '\n'; break;
            case 'r': out += '\r'; break;
            case 't': out += '\t'; break;
            case 'b': out += '\b'; break;
            case 'f': out += '\f'; break;
            case '/': out += '/'; break;
            case '\\': out += '\\'; break;
            case '"': out += '"'; break;
            case 'u':
                if (i + 4 < raw.size()) {
                    unsigned int code = 0;
                    auto hex = raw.substr(i + 1, 4);
                    auto [ptr, ec] = std::from_chars(hex.data(), hex.data() + hex.size(), code, 16);
                    // Service-account files only escape ASCII characters
                    if (ec == std::errc{} && ptr == hex.data() + hex.size() && code < 0x80) {
                        out += static_cast<char>(code);
                    }
                    i += 4;
                }
                break;
            default:
                out += next;
        }
    }
    return out;
}

}  // namespace

auto extract_json_value(const std::string& json,
                        const std::string& key) -> std::optional<std::string> {
    std::string search = "\"" + key + "\"";
    auto pos = json.find(search);
    if (pos == std::string::npos) {
        return std::nullopt;
    }

    pos = json.find_first_not_of(" \t\n\r", pos + search.length());
    if (pos == std::string::npos || json[pos] != ':') {
        return std::nullopt;
    }

    pos = json.find_first_not_of(" \t\n\r", pos + 1);
    if (pos == std::string::npos) {
        return std::nullopt;
    }

    if (json[pos] == '"') {
        auto end_pos = pos + 1;
        while (end_pos < json.size()) {
            if (json[end_pos] == '\\') {
                end_pos += 2;
                continue;
            }
            if (json[end_pos] == '"') {
                break;
            }
            ++end_pos;
        }
        if (end_pos >= json.size()) {
            return std::nullopt;
        }
        return unescape_json_string(std::string_view(json).substr(pos + 1, end_pos - pos - 1));
    }

    auto end_pos = json.find_first_of(",}\n", pos);
    if (end_pos == std::string::npos) {
        end_pos = json.size();
    }
    auto value = json.substr(pos, end_pos - pos);
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
        value.pop_back();
    }
    return value;
}

// ============================================================================
// Time Utilities
// ============================================================================

auto get_unix_timestamp() -> int64_t {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::seconds>(
        now.time_since_epoch()).count();
}

// ============================================================================
// Random Utilities
// ============================================================================

auto generate_random_hex(std::size_t byte_count) -> std::string {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 255);

    std::ostringstream oss;
    for (std::size_t i = 0; i < byte_count; ++i) {
        oss << std::hex << std::setfill('0') << std::setw(2) << dis(gen);
    }
    return oss.str();
}

// ============================================================================
// Content Type Detection
// ============================================================================

auto detect_content_type(std::string_view path) -> std::string {
    static const std::unordered_map<std::string, std::string> mime_types = {
        {".tif", "image/tiff"},
        {".tiff", "image/tiff"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".json", "application/json"},
        {".xml", "application/xml"},
        {".zip", "application/zip"},
        {".las", "application/octet-stream"},
        {".laz", "application/octet-stream"},
        {".ply", "application/octet-stream"},
        {".obj", "model/obj"},
        {".mtl", "model/mtl"},
        {".glb", "model/gltf-binary"},
        {".pdf", "application/pdf"},
        {".txt", "text/plain"},
        {".csv", "text/csv"},
        {".geojson", "application/geo+json"},
        {".gpkg", "application/geopackage+sqlite3"},
        {".mbtiles", "application/x-sqlite3"},
        {".kmz", "application/vnd.google-earth.kmz"},
    };

    auto slash_pos = path.find_last_of("/\\");
    auto dot_pos = path.rfind('.');
    if (dot_pos == std::string_view::npos ||
        (slash_pos != std::string_view::npos && dot_pos < slash_pos)) {
        return "application/octet-stream";
    }

    std::string ext(path.substr(dot_pos));
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = mime_types.find(ext);
    if (it != mime_types.end()) {
        return it->second;
    }

    return "application/octet-stream";
}

}  // namespace kcenon::cloud_upload::storage_utils
