/**
 * @file policy_engine.hpp
 * @brief Wires the policy database, stores, role graph and delegate together
 */

#pragma once

#include <rbac/config/engine_config.hpp>
#include <rbac/core/result.hpp>
#include <rbac/di/ilogger.hpp>
#include <rbac/security/in_memory_role_graph.hpp>
#include <rbac/security/policy_delegate.hpp>
#include <rbac/storage/policy_database.hpp>
#include <rbac/storage/sqlite_policy_adapter.hpp>
#include <rbac/storage/sqlite_role_metadata_storage.hpp>

#include <memory>

namespace rbac {

/**
 * @brief Ready-to-use policy engine on a SQLite database
 *
 * open() initializes logging from the configuration, opens and migrates the
 * database and replays stored grouping rules into the role graph.
 *
 * @code
 * auto config = config::engine_config::load_from_file("rbac.json");
 * auto engine = policy_engine::open(config.value());
 * auto& delegate = engine.value()->delegate();
 * @endcode
 */
class policy_engine {
public:
    /**
     * @brief Open an engine for config
     *
     * @param config Validated configuration
     * @param logger Logger for the delegate; logger_adapter when null
     */
    [[nodiscard]] static auto open(const config::engine_config& config,
                                   std::shared_ptr<di::ILogger> logger = nullptr)
        -> Result<std::unique_ptr<policy_engine>>;

    ~policy_engine();

    policy_engine(const policy_engine&) = delete;
    auto operator=(const policy_engine&) -> policy_engine& = delete;

    [[nodiscard]] auto delegate() noexcept -> security::policy_delegate& {
        return *delegate_;
    }

    [[nodiscard]] auto role_graph() noexcept -> security::in_memory_role_graph& {
        return *graph_;
    }

    [[nodiscard]] auto database() noexcept -> storage::policy_database& {
        return *database_;
    }

    [[nodiscard]] auto metadata() noexcept
        -> storage::sqlite_role_metadata_storage& {
        return *metadata_;
    }

    /**
     * @brief Rebuild role graph edges from the stored grouping rules
     */
    [[nodiscard]] auto reload_role_graph() -> VoidResult;

private:
    policy_engine() = default;

    std::shared_ptr<storage::policy_database> database_;
    std::shared_ptr<storage::sqlite_policy_adapter> adapter_;
    std::shared_ptr<storage::sqlite_role_metadata_storage> metadata_;
    std::shared_ptr<security::in_memory_role_graph> graph_;
    std::unique_ptr<security::policy_delegate> delegate_;
    std::shared_ptr<di::ILogger> logger_;
    security::subscription_id audit_subscription_{0};
};

}  // namespace rbac
