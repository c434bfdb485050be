#pragma once

#include <util/error.hpp>

#include <optional>
#include <string>

namespace snapgate::storage {

// Point lookup against the allow-list. Returns the display name, or nullopt
// when (uid, room) is not authorized.
class AuthorizationSource {
public:
    virtual ~AuthorizationSource() = default;

    [[nodiscard]] virtual auto lookup_authorization(const std::string& uid,
                                                    const std::string& room)
        -> Result<std::optional<std::string>> = 0;
};

} // namespace snapgate::storage
