#pragma once

#include <string>
#include <string_view>

namespace sqlgate {

/**
 * @brief Query fingerprinter - content hash of the raw SQL text
 *
 * The fingerprint is the lowercase hex MD5 of the exact bytes received. No
 * normalization is applied: "SELECT 1" and "select 1" are distinct cache keys.
 */
class QueryFingerprinter {
public:
    static constexpr size_t kHexLength = 32;

    /**
     * @brief Compute fingerprint of SQL query
     * @param sql Raw SQL query string
     * @return 32-char lowercase hex digest
     * @throws std::runtime_error if the digest cannot be computed
     */
    [[nodiscard]] static std::string fingerprint(std::string_view sql);
};

} // namespace sqlgate
