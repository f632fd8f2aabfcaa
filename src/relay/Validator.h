#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace photorelay::relay {

class Validator {
public:
    static constexpr std::int64_t kMaxFileSize = 10 * 1024 * 1024;
    static constexpr std::array<std::string_view, 4> kAllowedTypes{
        "image/jpeg", "image/jpg", "image/png", "image/webp"};

    // Returns the rejection reason, or nothing if the upload may be forwarded.
    // The size is the sender's declared size; the payload is not measured.
    static std::optional<std::string> validate(std::string_view mime_type,
                                               std::int64_t declared_size);

    static bool is_allowed_type(std::string_view mime_type) noexcept;
};

} // namespace photorelay::relay
