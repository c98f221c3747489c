#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "remote/remote_types.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace sqlgate {

class IRemoteSqlClient;
class ICredentialStore;
class ErrorClassifier;

/**
 * @brief Paginated table browsing
 *
 * plan_and_execute():
 * 1. limit ∈ [1, max_limit], offset ≥ 0, else VALIDATION (no remote call)
 * 2. Borrow the active credential
 * 3. Fetch the live schema; the table must appear with kind "table"
 *    (TABLE_NOT_FOUND otherwise, no SELECT issued)
 * 4. SELECT * FROM "<name>" LIMIT n OFFSET m, where <name> is the schema's
 *    spelling with embedded quotes doubled
 * 5. Execute and classify failures. Rows are never cached.
 */
class TableBrowsePlanner {
public:
    struct Config {
        int64_t max_limit = 100;
    };

    TableBrowsePlanner(std::shared_ptr<IRemoteSqlClient> client,
                       std::shared_ptr<ICredentialStore> credentials,
                       std::shared_ptr<ErrorClassifier> classifier);

    TableBrowsePlanner(std::shared_ptr<IRemoteSqlClient> client,
                       std::shared_ptr<ICredentialStore> credentials,
                       std::shared_ptr<ErrorClassifier> classifier,
                       Config config);

    [[nodiscard]] Result<BrowsePage> plan_and_execute(const TableBrowseRequest& request);

    /// "users" → "\"users\"", "a\"b" → "\"a\"\"b\""
    [[nodiscard]] static std::string quote_identifier(std::string_view name);

    [[nodiscard]] static std::string build_select(std::string_view table_name,
                                                  int64_t limit, int64_t offset);

    /// nullopt when the paging window is acceptable
    [[nodiscard]] static std::optional<GatewayError> validate_paging(
        int64_t limit, int64_t offset, int64_t max_limit);

    struct Stats {
        uint64_t requests;
        uint64_t validation_rejections;
        uint64_t tables_not_found;
        uint64_t remote_calls;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    [[nodiscard]] GatewayError classify_failure(const RemoteFailure& failure) const;

    std::shared_ptr<IRemoteSqlClient> client_;
    std::shared_ptr<ICredentialStore> credentials_;
    std::shared_ptr<ErrorClassifier> classifier_;
    Config config_;

    std::atomic<uint64_t> requests_{0};
    std::atomic<uint64_t> validation_rejections_{0};
    std::atomic<uint64_t> tables_not_found_{0};
    std::atomic<uint64_t> remote_calls_{0};
};

} // namespace sqlgate
