#ifndef QUIRE_EDITING_URL_VALIDATION_H
#define QUIRE_EDITING_URL_VALIDATION_H

#include <optional>
#include <string>
#include <string_view>

namespace quire {

/**
 * Validate a user-entered link or image URL.
 * The URL must contain a '.'; "http://" is prefixed unless it already
 * starts with "http://" or "https://". Surrounding whitespace is ignored.
 * @return Normalized URL, or std::nullopt when invalid
 */
std::optional<std::string> normalizeUrl(std::string_view url);

} // namespace quire

#endif // QUIRE_EDITING_URL_VALIDATION_H
