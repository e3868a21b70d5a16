// Filters out traffic that never carries authentication state

#include "auth_relevance.h"
#include "core/http_message.h"
#include <array>

namespace diagnostics {

static const std::array<const char*, 19> STATIC_EXTENSIONS = {
    ".css", ".js", ".map", ".png", ".jpg", ".jpeg", ".gif", ".bmp", ".svg", ".ico", ".webp",
    ".woff", ".woff2", ".ttf", ".otf", ".eot", ".mp3", ".mp4", ".webm"
};

static const std::array<const char*, 7> STATIC_CONTENT_TYPES = {
    "image/", "font/", "audio/", "video/", "text/css", "javascript", "ecmascript"
};

bool is_relevant_to_auth_diagnostics(const Transaction& tx) {
    if (http::iequals(tx.method, "OPTIONS")) {
        return false;
    }

    if (auto url = http::parse_url(tx.uri)) {
        std::string path = http::to_lower(url->path);
        for (const char* ext : STATIC_EXTENSIONS) {
            std::string e(ext);
            if (path.size() >= e.size() && path.compare(path.size() - e.size(), e.size(), e) == 0) {
                return false;
            }
        }
    }

    std::string content_type = http::response_content_type(tx);
    for (const char* marker : STATIC_CONTENT_TYPES) {
        if (content_type.find(marker) != std::string::npos) {
            return false;
        }
    }
    return true;
}

} // namespace diagnostics
