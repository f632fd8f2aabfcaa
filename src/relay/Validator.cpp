#include "relay/Validator.h"

#include <algorithm>

namespace photorelay::relay {

bool Validator::is_allowed_type(std::string_view mime_type) noexcept {
    return std::find(kAllowedTypes.begin(), kAllowedTypes.end(), mime_type) != kAllowedTypes.end();
}

std::optional<std::string> Validator::validate(std::string_view mime_type,
                                               std::int64_t declared_size) {
    if (!is_allowed_type(mime_type)) {
        return "Invalid file type: " + std::string(mime_type);
    }
    if (declared_size > kMaxFileSize) {
        return std::string("File too large (max 10MB)");
    }
    return std::nullopt;
}

} // namespace photorelay::relay
