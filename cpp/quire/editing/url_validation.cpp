#include "quire/editing/url_validation.h"
#include "quire/core/string_utils.h"

namespace quire {

namespace {

bool startsWith(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

std::optional<std::string> normalizeUrl(std::string_view url) {
    url = trimAscii(url);
    if (url.empty() || url.find('.') == std::string_view::npos) {
        return std::nullopt;
    }
    if (startsWith(url, "http://") || startsWith(url, "https://")) {
        return std::string(url);
    }
    std::string out = "http://";
    out.append(url.data(), url.size());
    return out;
}

} // namespace quire
