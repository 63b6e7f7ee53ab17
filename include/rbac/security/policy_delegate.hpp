/**
 * @file policy_delegate.hpp
 * @brief Transactional reads, writes and point checks over RBAC policy state
 *
 * The delegate keeps three stores consistent: permission and grouping rules
 * (policy_adapter), the derived role graph (role_graph) and per-role
 * metadata (role_metadata_storage). Reads use server-side filtered loads so
 * no operation pulls the full rule set into memory. Checks are evaluated by
 * a throwaway evaluation_context built from the filtered rules.
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include "evaluation_context.hpp"
#include "policy_adapter.hpp"
#include "policy_types.hpp"
#include "role_graph.hpp"
#include "role_metadata.hpp"
#include "role_metadata_storage.hpp"
#include "transaction.hpp"

#include <rbac/core/result.hpp>
#include <rbac/di/ilogger.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace rbac::security {

/**
 * @brief Role whose metadata survives removal of its last member
 */
inline constexpr std::string_view default_admin_role = "role:default/rbac_admin";

struct delegate_options {
  std::string admin_role_ref{default_admin_role};
};

/**
 * @brief Published after a transaction that created role metadata commits
 */
struct role_added_event {
  std::vector<std::string> role_entity_refs;
  std::chrono::system_clock::time_point timestamp;
};

using role_added_callback = std::function<void(const role_added_event &)>;
using subscription_id = std::uint64_t;

/**
 * @brief Single point of truth for policy and role state
 *
 * Every mutating operation takes an optional caller transaction. When it is
 * null the operation opens its own transaction, commits it on success and
 * rolls it back on failure. A supplied transaction is never committed or
 * rolled back here; errors are returned so its owner can abort it.
 *
 * Role graph edges are changed immediately and undone by rollback hooks
 * registered on the transaction.
 *
 * @code
 * policy_delegate delegate(adapter, graph, metadata, database);
 * role_metadata meta{"role:default/dev", role_source::rest, "user:default/admin"};
 * delegate.add_grouping_policy({"user:default/alice", "role:default/dev"}, meta);
 * delegate.add_policy({"role:default/dev", "catalog-entity", "read", "allow"});
 *
 * auto roles = delegate.get_roles_for_user("user:default/alice");
 * auto allowed = delegate.enforce("user:default/alice", "catalog-entity",
 *                                 "read", roles.value());
 * @endcode
 */
class policy_delegate {
public:
  policy_delegate(std::shared_ptr<policy_adapter> adapter,
                  std::shared_ptr<role_graph> graph,
                  std::shared_ptr<role_metadata_storage> metadata,
                  std::shared_ptr<transaction_provider> transactions,
                  delegate_options options = {},
                  std::shared_ptr<di::ILogger> logger = nullptr);

  policy_delegate(const policy_delegate &) = delete;
  policy_delegate &operator=(const policy_delegate &) = delete;

  // ========================================================================
  // Reads
  // ========================================================================

  /**
   * @brief True if exactly this permission rule is stored
   */
  [[nodiscard]] auto has_policy(const policy_tuple &rule) -> Result<bool>;

  /**
   * @brief True if exactly this grouping rule is stored
   */
  [[nodiscard]] auto has_grouping_policy(const policy_tuple &rule)
      -> Result<bool>;

  [[nodiscard]] auto get_policy() -> Result<std::vector<policy_tuple>>;

  [[nodiscard]] auto get_grouping_policy() -> Result<std::vector<policy_tuple>>;

  /**
   * @brief Permission rules whose fields from field_index on equal values
   *
   * An empty values list returns every permission rule.
   */
  [[nodiscard]] auto get_filtered_policy(std::size_t field_index,
                                         const std::vector<std::string> &values)
      -> Result<std::vector<policy_tuple>>;

  [[nodiscard]] auto
  get_filtered_grouping_policy(std::size_t field_index,
                               const std::vector<std::string> &values)
      -> Result<std::vector<policy_tuple>>;

  /**
   * @brief Roles reachable from principal through the role graph
   */
  [[nodiscard]] auto get_roles_for_user(std::string_view principal)
      -> Result<std::vector<std::string>>;

  /**
   * @brief Permission rules of every role the principal holds
   *
   * Rules granted by more than one role appear once per role.
   */
  [[nodiscard]] auto get_implicit_permissions_for_user(std::string_view principal)
      -> Result<std::vector<policy_tuple>>;

  // ========================================================================
  // Permission rule mutations
  // ========================================================================

  /**
   * @brief Store a permission rule; a no-op if it is already stored
   */
  [[nodiscard]] auto add_policy(const policy_tuple &rule,
                                policy_transaction *tx = nullptr) -> VoidResult;

  [[nodiscard]] auto add_policies(const std::vector<policy_tuple> &rules,
                                  policy_transaction *tx = nullptr)
      -> VoidResult;

  [[nodiscard]] auto remove_policy(const policy_tuple &rule,
                                   policy_transaction *tx = nullptr)
      -> VoidResult;

  [[nodiscard]] auto remove_policies(const std::vector<policy_tuple> &rules,
                                     policy_transaction *tx = nullptr)
      -> VoidResult;

  /**
   * @brief Replace old_rules with new_rules atomically
   */
  [[nodiscard]] auto update_policies(const std::vector<policy_tuple> &old_rules,
                                     const std::vector<policy_tuple> &new_rules,
                                     policy_transaction *tx = nullptr)
      -> VoidResult;

  // ========================================================================
  // Grouping rule mutations
  // ========================================================================

  /**
   * @brief Add a member to a role and create or merge its metadata
   *
   * rule[1] must equal metadata.role_entity_ref. Emits role_added after
   * commit when the metadata record is new.
   */
  [[nodiscard]] auto add_grouping_policy(const policy_tuple &rule,
                                         const role_metadata &metadata,
                                         policy_transaction *tx = nullptr)
      -> VoidResult;

  /**
   * @brief Add several members to the role named by metadata
   */
  [[nodiscard]] auto add_grouping_policies(const std::vector<policy_tuple> &rules,
                                           const role_metadata &metadata,
                                           policy_transaction *tx = nullptr)
      -> VoidResult;

  /**
   * @brief Remove a member from a role
   *
   * Unless is_update is set, metadata of a role left without members is
   * deleted (except for the admin role) and otherwise merged with metadata.
   */
  [[nodiscard]] auto remove_grouping_policy(const policy_tuple &rule,
                                            const role_metadata &metadata,
                                            bool is_update = false,
                                            policy_transaction *tx = nullptr)
      -> VoidResult;

  [[nodiscard]] auto
  remove_grouping_policies(const std::vector<policy_tuple> &rules,
                           const role_metadata &metadata, bool is_update = false,
                           policy_transaction *tx = nullptr) -> VoidResult;

  /**
   * @brief Replace the members of one role atomically
   *
   * old_rules must be non-empty and target a single role whose metadata
   * exists; new_rules are added with new_metadata. If the old role ends up
   * with no members its metadata is deleted after the add phase.
   */
  [[nodiscard]] auto
  update_grouping_policies(const std::vector<policy_tuple> &old_rules,
                           const std::vector<policy_tuple> &new_rules,
                           const role_metadata &new_metadata,
                           policy_transaction *tx = nullptr) -> VoidResult;

  // ========================================================================
  // Evaluation
  // ========================================================================

  /**
   * @brief Decide whether subject may perform action on resource_type
   *
   * Only rules for the given roles are loaded. With no roles, only rules
   * whose subject is a user or group apply.
   */
  [[nodiscard]] auto enforce(std::string_view subject,
                             std::string_view resource_type,
                             std::string_view action,
                             const std::vector<std::string> &roles)
      -> Result<bool>;

  // ========================================================================
  // Notifications
  // ========================================================================

  /**
   * @brief Register a role_added observer
   * @return Id for unsubscribe()
   */
  subscription_id subscribe_role_added(role_added_callback callback);

  /**
   * @brief Remove an observer; unknown ids are ignored
   */
  void unsubscribe(subscription_id id);

  [[nodiscard]] const delegate_options &options() const noexcept {
    return options_;
  }

private:
  [[nodiscard]] auto load_filtered(const std::vector<policy_filter> &filters)
      -> Result<policy_model>;

  [[nodiscard]] auto filtered_rules(policy_section section,
                                    std::size_t field_index,
                                    const std::vector<std::string> &values)
      -> Result<std::vector<policy_tuple>>;

  [[nodiscard]] auto exact_match(policy_section section,
                                 const policy_tuple &rule) -> Result<bool>;

  /**
   * @brief Write permission rules; joins the open transaction through the
   * adapter's connection
   */
  [[nodiscard]] auto add_policies_in(const std::vector<policy_tuple> &rules)
      -> VoidResult;

  [[nodiscard]] auto remove_policies_in(const std::vector<policy_tuple> &rules)
      -> VoidResult;

  [[nodiscard]] auto add_grouping_in(const std::vector<policy_tuple> &rules,
                                     const role_metadata &metadata,
                                     policy_transaction &tx) -> VoidResult;

  [[nodiscard]] auto remove_grouping_in(const std::vector<policy_tuple> &rules,
                                        const role_metadata &metadata,
                                        std::string_view role_ref,
                                        bool is_update, policy_transaction &tx)
      -> VoidResult;

  /**
   * @brief Delete the metadata of a non-admin role no rule references
   * @return True if the record was deleted
   */
  [[nodiscard]] auto remove_metadata_if_unused(std::string_view role_ref,
                                               policy_transaction &tx)
      -> Result<bool>;

  /**
   * @brief Create or merge metadata for a role target
   * @return True if a new record was created
   */
  [[nodiscard]] auto upsert_role_metadata(const role_metadata &metadata,
                                          policy_transaction &tx)
      -> Result<bool>;

  [[nodiscard]] auto link(const policy_tuple &rule, policy_transaction &tx)
      -> VoidResult;

  [[nodiscard]] auto unlink(const policy_tuple &rule, policy_transaction &tx)
      -> VoidResult;

  /**
   * @brief Commit an owned transaction, or roll it back on error
   */
  [[nodiscard]] auto finish(transaction_scope &scope, VoidResult result,
                            std::string_view operation) -> VoidResult;

  /**
   * @brief role_added observers
   *
   * Shared with pending commit hooks, which may run after the delegate is
   * gone when a caller-supplied transaction outlives it.
   */
  struct subscriber_registry {
    std::map<subscription_id, role_added_callback> callbacks;
    subscription_id next_id{1};
    std::mutex mutex;

    void publish(std::vector<std::string> role_refs);
  };

  std::shared_ptr<policy_adapter> adapter_;
  std::shared_ptr<role_graph> graph_;
  std::shared_ptr<role_metadata_storage> metadata_;
  std::shared_ptr<transaction_provider> transactions_;
  delegate_options options_;
  std::shared_ptr<di::ILogger> logger_;
  std::shared_ptr<subscriber_registry> subscribers_;
};

} // namespace rbac::security
