/**
 * @file policy_delegate.cpp
 * @brief Implementation of the policy delegate
 *
 * @copyright Copyright (c) 2025
 */

#include <rbac/security/policy_delegate.hpp>

#include <rbac/compat/format.hpp>
#include <rbac/security/entity_ref.hpp>

namespace rbac::security {

namespace {
constexpr const char *kModule = "policy_delegate";
constexpr std::string_view kPolicyType = "p";
constexpr std::string_view kGroupingType = "g";

using tuple_validator = VoidResult (*)(const policy_tuple &);

auto validate_rules(const std::vector<policy_tuple> &rules,
                    tuple_validator validate) -> VoidResult {
  for (const auto &rule : rules) {
    auto result = validate(rule);
    if (result.is_err()) {
      return result;
    }
  }
  return ok();
}

/**
 * @brief Every grouping rule must target role_ref
 */
auto check_role_targets(const std::vector<policy_tuple> &rules,
                        std::string_view role_ref) -> VoidResult {
  auto valid = validate_rules(rules, &validate_grouping_tuple);
  if (valid.is_err()) {
    return valid;
  }
  for (const auto &rule : rules) {
    if (rule[1] != role_ref) {
      return rbac_void_error(
          error_codes::role_mismatch,
          compat::format("Grouping rule [{}] does not target role {}",
                         to_string(rule), role_ref),
          kModule);
    }
  }
  return ok();
}

auto exact_filter(std::string_view ptype, const policy_tuple &rule)
    -> policy_filter {
  auto filter = policy_filter::all(ptype);
  for (std::size_t i = 0; i < rule.size(); ++i) {
    filter.fields.emplace(i, rule[i]);
  }
  return filter;
}
} // namespace

policy_delegate::policy_delegate(
    std::shared_ptr<policy_adapter> adapter, std::shared_ptr<role_graph> graph,
    std::shared_ptr<role_metadata_storage> metadata,
    std::shared_ptr<transaction_provider> transactions,
    delegate_options options, std::shared_ptr<di::ILogger> logger)
    : adapter_(std::move(adapter)), graph_(std::move(graph)),
      metadata_(std::move(metadata)), transactions_(std::move(transactions)),
      options_(std::move(options)),
      logger_(logger ? std::move(logger) : di::null_logger()),
      subscribers_(std::make_shared<subscriber_registry>()) {}

// ============================================================================
// Reads
// ============================================================================

auto policy_delegate::has_policy(const policy_tuple &rule) -> Result<bool> {
  auto valid = validate_policy_tuple(rule);
  if (valid.is_err()) {
    return Result<bool>(valid.error());
  }
  return exact_match(policy_section::policy, rule);
}

auto policy_delegate::has_grouping_policy(const policy_tuple &rule)
    -> Result<bool> {
  auto valid = validate_grouping_tuple(rule);
  if (valid.is_err()) {
    return Result<bool>(valid.error());
  }
  return exact_match(policy_section::grouping, rule);
}

auto policy_delegate::get_policy() -> Result<std::vector<policy_tuple>> {
  return filtered_rules(policy_section::policy, 0, {});
}

auto policy_delegate::get_grouping_policy()
    -> Result<std::vector<policy_tuple>> {
  return filtered_rules(policy_section::grouping, 0, {});
}

auto policy_delegate::get_filtered_policy(std::size_t field_index,
                                          const std::vector<std::string> &values)
    -> Result<std::vector<policy_tuple>> {
  return filtered_rules(policy_section::policy, field_index, values);
}

auto policy_delegate::get_filtered_grouping_policy(
    std::size_t field_index, const std::vector<std::string> &values)
    -> Result<std::vector<policy_tuple>> {
  return filtered_rules(policy_section::grouping, field_index, values);
}

auto policy_delegate::get_roles_for_user(std::string_view principal)
    -> Result<std::vector<std::string>> {
  return graph_->get_roles(principal);
}

auto policy_delegate::get_implicit_permissions_for_user(
    std::string_view principal) -> Result<std::vector<policy_tuple>> {
  auto roles = get_roles_for_user(principal);
  if (roles.is_err()) {
    return Result<std::vector<policy_tuple>>(roles.error());
  }

  std::vector<policy_tuple> permissions;
  for (const auto &role : roles.value()) {
    auto granted = get_filtered_policy(0, {role});
    if (granted.is_err()) {
      return granted;
    }
    const auto &rules = granted.value();
    permissions.insert(permissions.end(), rules.begin(), rules.end());
  }
  return permissions;
}

// ============================================================================
// Permission rule mutations
// ============================================================================

auto policy_delegate::add_policy(const policy_tuple &rule,
                                 policy_transaction *tx) -> VoidResult {
  auto valid = validate_policy_tuple(rule);
  if (valid.is_err()) {
    return valid;
  }

  auto scope = transaction_scope::open(*transactions_, tx);
  if (scope.is_err()) {
    return VoidResult(scope.error());
  }

  auto exists = exact_match(policy_section::policy, rule);
  if (exists.is_err()) {
    return finish(scope.value(), VoidResult(exists.error()), "add_policy");
  }
  if (exists.value()) {
    return finish(scope.value(), ok(), "add_policy");
  }

  logger_->debug_fmt("Adding policy [{}]", to_string(rule));
  return finish(scope.value(), add_policies_in({rule}), "add_policy");
}

auto policy_delegate::add_policies(const std::vector<policy_tuple> &rules,
                                   policy_transaction *tx) -> VoidResult {
  if (rules.empty()) {
    return ok();
  }
  auto valid = validate_rules(rules, &validate_policy_tuple);
  if (valid.is_err()) {
    return valid;
  }

  auto scope = transaction_scope::open(*transactions_, tx);
  if (scope.is_err()) {
    return VoidResult(scope.error());
  }

  logger_->debug_fmt("Adding {} policies", rules.size());
  return finish(scope.value(), add_policies_in(rules), "add_policies");
}

auto policy_delegate::remove_policy(const policy_tuple &rule,
                                    policy_transaction *tx) -> VoidResult {
  return remove_policies({rule}, tx);
}

auto policy_delegate::remove_policies(const std::vector<policy_tuple> &rules,
                                      policy_transaction *tx) -> VoidResult {
  auto valid = validate_rules(rules, &validate_policy_tuple);
  if (valid.is_err()) {
    return valid;
  }

  auto scope = transaction_scope::open(*transactions_, tx);
  if (scope.is_err()) {
    return VoidResult(scope.error());
  }

  logger_->debug_fmt("Removing {} policies", rules.size());
  return finish(scope.value(), remove_policies_in(rules),
                "remove_policies");
}

auto policy_delegate::update_policies(const std::vector<policy_tuple> &old_rules,
                                      const std::vector<policy_tuple> &new_rules,
                                      policy_transaction *tx) -> VoidResult {
  auto valid = validate_rules(old_rules, &validate_policy_tuple);
  if (valid.is_ok()) {
    valid = validate_rules(new_rules, &validate_policy_tuple);
  }
  if (valid.is_err()) {
    return valid;
  }

  auto scope = transaction_scope::open(*transactions_, tx);
  if (scope.is_err()) {
    return VoidResult(scope.error());
  }

  logger_->debug_fmt("Replacing {} policies with {}", old_rules.size(),
                     new_rules.size());
  auto result = remove_policies_in(old_rules);
  if (result.is_ok()) {
    result = add_policies_in(new_rules);
  }
  return finish(scope.value(), std::move(result), "update_policies");
}

// ============================================================================
// Grouping rule mutations
// ============================================================================

auto policy_delegate::add_grouping_policy(const policy_tuple &rule,
                                          const role_metadata &metadata,
                                          policy_transaction *tx)
    -> VoidResult {
  auto valid = check_role_targets({rule}, metadata.role_entity_ref);
  if (valid.is_err()) {
    return valid;
  }

  auto scope = transaction_scope::open(*transactions_, tx);
  if (scope.is_err()) {
    return VoidResult(scope.error());
  }

  auto exists = exact_match(policy_section::grouping, rule);
  if (exists.is_err()) {
    return finish(scope.value(), VoidResult(exists.error()),
                  "add_grouping_policy");
  }
  if (exists.value()) {
    return finish(scope.value(), ok(), "add_grouping_policy");
  }

  logger_->debug_fmt("Adding grouping policy [{}]", to_string(rule));
  return finish(scope.value(),
                add_grouping_in({rule}, metadata, scope.value().tx()),
                "add_grouping_policy");
}

auto policy_delegate::add_grouping_policies(
    const std::vector<policy_tuple> &rules, const role_metadata &metadata,
    policy_transaction *tx) -> VoidResult {
  if (rules.empty()) {
    return ok();
  }
  auto valid = check_role_targets(rules, metadata.role_entity_ref);
  if (valid.is_err()) {
    return valid;
  }

  auto scope = transaction_scope::open(*transactions_, tx);
  if (scope.is_err()) {
    return VoidResult(scope.error());
  }

  logger_->debug_fmt("Adding {} members to {}", rules.size(),
                     metadata.role_entity_ref);
  return finish(scope.value(),
                add_grouping_in(rules, metadata, scope.value().tx()),
                "add_grouping_policies");
}

auto policy_delegate::remove_grouping_policy(const policy_tuple &rule,
                                             const role_metadata &metadata,
                                             bool is_update,
                                             policy_transaction *tx)
    -> VoidResult {
  return remove_grouping_policies({rule}, metadata, is_update, tx);
}

auto policy_delegate::remove_grouping_policies(
    const std::vector<policy_tuple> &rules, const role_metadata &metadata,
    bool is_update, policy_transaction *tx) -> VoidResult {
  auto valid = check_role_targets(rules, metadata.role_entity_ref);
  if (valid.is_err()) {
    return valid;
  }

  auto scope = transaction_scope::open(*transactions_, tx);
  if (scope.is_err()) {
    return VoidResult(scope.error());
  }

  logger_->debug_fmt("Removing {} members from {}", rules.size(),
                     metadata.role_entity_ref);
  return finish(scope.value(),
                remove_grouping_in(rules, metadata, metadata.role_entity_ref,
                                   is_update, scope.value().tx()),
                "remove_grouping_policies");
}

auto policy_delegate::update_grouping_policies(
    const std::vector<policy_tuple> &old_rules,
    const std::vector<policy_tuple> &new_rules,
    const role_metadata &new_metadata, policy_transaction *tx) -> VoidResult {
  if (old_rules.empty()) {
    return rbac_void_error(error_codes::role_update_precondition,
                           "Cannot update a role without its current members",
                           kModule);
  }
  auto valid = validate_rules(old_rules, &validate_grouping_tuple);
  if (valid.is_err()) {
    return valid;
  }
  const auto old_role = old_rules.front()[1];
  for (const auto &rule : old_rules) {
    if (rule[1] != old_role) {
      return rbac_void_error(
          error_codes::role_update_precondition,
          compat::format("Current members span roles {} and {}", old_role,
                         rule[1]),
          kModule);
    }
  }
  valid = check_role_targets(new_rules, new_metadata.role_entity_ref);
  if (valid.is_err()) {
    return valid;
  }

  auto scope = transaction_scope::open(*transactions_, tx);
  if (scope.is_err()) {
    return VoidResult(scope.error());
  }
  auto &trx = scope.value().tx();

  auto current = metadata_->find_role_metadata(old_role, trx);
  if (current.is_err()) {
    return finish(scope.value(), VoidResult(current.error()),
                  "update_grouping_policies");
  }
  if (!current.value()) {
    return finish(scope.value(),
                  rbac_void_error(error_codes::role_metadata_not_found,
                                  compat::format("Role metadata {} was not found",
                                                 old_role),
                                  kModule),
                  "update_grouping_policies");
  }

  logger_->debug_fmt("Replacing members of {} with members of {}", old_role,
                     new_metadata.role_entity_ref);
  auto result = remove_grouping_in(old_rules, *current.value(), old_role,
                                   /*is_update=*/true, trx);
  if (result.is_ok() && !new_rules.empty()) {
    result = add_grouping_in(new_rules, new_metadata, trx);
  }
  // The old role is settled once the new members are in place
  if (result.is_ok() &&
      (new_rules.empty() || new_metadata.role_entity_ref != old_role)) {
    auto dropped = remove_metadata_if_unused(old_role, trx);
    if (dropped.is_err()) {
      result = VoidResult(dropped.error());
    }
  }
  return finish(scope.value(), std::move(result), "update_grouping_policies");
}

// ============================================================================
// Evaluation
// ============================================================================

auto policy_delegate::enforce(std::string_view subject,
                              std::string_view resource_type,
                              std::string_view action,
                              const std::vector<std::string> &roles)
    -> Result<bool> {
  std::vector<policy_filter> filters;
  if (!roles.empty()) {
    for (const auto &role : roles) {
      auto filter = policy_filter::all(kPolicyType);
      filter.fields = {{0, role},
                       {1, std::string(resource_type)},
                       {2, std::string(action)}};
      filters.push_back(std::move(filter));
    }
  } else {
    auto filter = policy_filter::all(kPolicyType);
    filter.fields = {{1, std::string(resource_type)},
                     {2, std::string(action)}};
    filters.push_back(std::move(filter));
  }

  auto loaded = load_filtered(filters);
  if (loaded.is_err()) {
    return Result<bool>(loaded.error());
  }

  policy_model model;
  if (roles.empty()) {
    // Role-assigned rules only apply through resolved roles
    for (auto &rule : loaded.value().get_policy(policy_section::policy,
                                                kPolicyType)) {
      if (is_principal_ref(rule[0])) {
        model.add_policy(policy_section::policy, kPolicyType, std::move(rule));
      }
    }
  } else {
    model = std::move(loaded.value());
  }

  evaluation_context context(std::move(model), *graph_);
  context.enable_auto_build_role_links(false);
  context.build_role_links();

  auto decision = context.enforce(subject, resource_type, action);
  if (decision.is_ok()) {
    logger_->debug_fmt("enforce({}, {}, {}) with {} roles -> {}", subject,
                       resource_type, action, roles.size(),
                       decision.value() ? "allow" : "deny");
  }
  return decision;
}

// ============================================================================
// Notifications
// ============================================================================

subscription_id policy_delegate::subscribe_role_added(
    role_added_callback callback) {
  std::lock_guard<std::mutex> lock(subscribers_->mutex);
  auto id = subscribers_->next_id++;
  subscribers_->callbacks.emplace(id, std::move(callback));
  return id;
}

void policy_delegate::unsubscribe(subscription_id id) {
  std::lock_guard<std::mutex> lock(subscribers_->mutex);
  subscribers_->callbacks.erase(id);
}

void policy_delegate::subscriber_registry::publish(
    std::vector<std::string> role_refs) {
  role_added_event event{std::move(role_refs), std::chrono::system_clock::now()};

  std::vector<role_added_callback> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex);
    for (const auto &[id, callback] : callbacks) {
      snapshot.push_back(callback);
    }
  }
  for (const auto &callback : snapshot) {
    callback(event);
  }
}

// ============================================================================
// Internal
// ============================================================================

auto policy_delegate::load_filtered(const std::vector<policy_filter> &filters)
    -> Result<policy_model> {
  policy_model model;
  auto loaded = adapter_->load_filtered_policy(model, filters);
  if (loaded.is_err()) {
    return Result<policy_model>(loaded.error());
  }
  return model;
}

auto policy_delegate::filtered_rules(policy_section section,
                                     std::size_t field_index,
                                     const std::vector<std::string> &values)
    -> Result<std::vector<policy_tuple>> {
  auto ptype = section == policy_section::policy ? kPolicyType : kGroupingType;

  auto filter = values.empty()
                    ? Result<policy_filter>(policy_filter::all(ptype))
                    : policy_filter::from_values(ptype, field_index, values);
  if (filter.is_err()) {
    return Result<std::vector<policy_tuple>>(filter.error());
  }

  auto model = load_filtered({filter.value()});
  if (model.is_err()) {
    return Result<std::vector<policy_tuple>>(model.error());
  }
  return model.value().get_policy(section, ptype);
}

auto policy_delegate::exact_match(policy_section section,
                                  const policy_tuple &rule) -> Result<bool> {
  auto ptype = section == policy_section::policy ? kPolicyType : kGroupingType;

  auto model = load_filtered({exact_filter(ptype, rule)});
  if (model.is_err()) {
    return Result<bool>(model.error());
  }
  return model.value().has_policy(section, ptype, rule);
}

auto policy_delegate::add_policies_in(const std::vector<policy_tuple> &rules)
    -> VoidResult {
  for (const auto &rule : rules) {
    auto added = adapter_->add_policy(policy_section::policy, kPolicyType, rule);
    if (added.is_err()) {
      return added;
    }
  }
  return ok();
}

auto policy_delegate::remove_policies_in(const std::vector<policy_tuple> &rules)
    -> VoidResult {
  for (const auto &rule : rules) {
    auto removed =
        adapter_->remove_policy(policy_section::policy, kPolicyType, rule);
    if (removed.is_err()) {
      return removed;
    }
  }
  return ok();
}

auto policy_delegate::add_grouping_in(const std::vector<policy_tuple> &rules,
                                      const role_metadata &metadata,
                                      policy_transaction &tx) -> VoidResult {
  auto created = upsert_role_metadata(metadata, tx);
  if (created.is_err()) {
    return VoidResult(created.error());
  }

  for (const auto &rule : rules) {
    auto added =
        adapter_->add_policy(policy_section::grouping, kGroupingType, rule);
    if (added.is_err()) {
      return added;
    }
    auto linked = link(rule, tx);
    if (linked.is_err()) {
      return linked;
    }
  }

  if (created.value()) {
    tx.on_commit([logger = logger_, subscribers = subscribers_,
                  role = metadata.role_entity_ref] {
      logger->info_fmt("Role {} created", role);
      subscribers->publish({role});
    });
  }
  return ok();
}

auto policy_delegate::remove_grouping_in(const std::vector<policy_tuple> &rules,
                                         const role_metadata &metadata,
                                         std::string_view role_ref,
                                         bool is_update,
                                         policy_transaction &tx) -> VoidResult {
  for (const auto &rule : rules) {
    auto removed =
        adapter_->remove_policy(policy_section::grouping, kGroupingType, rule);
    if (removed.is_err()) {
      return removed;
    }
    auto unlinked = unlink(rule, tx);
    if (unlinked.is_err()) {
      return unlinked;
    }
  }

  if (is_update) {
    return ok();
  }

  auto current = metadata_->find_role_metadata(role_ref, tx);
  if (current.is_err()) {
    return VoidResult(current.error());
  }
  if (!current.value()) {
    return ok();
  }

  auto dropped = remove_metadata_if_unused(role_ref, tx);
  if (dropped.is_err()) {
    return VoidResult(dropped.error());
  }
  if (dropped.value()) {
    return ok();
  }
  return metadata_->update_role_metadata(
      merge_role_metadata(*current.value(), metadata), role_ref, tx);
}

auto policy_delegate::remove_metadata_if_unused(std::string_view role_ref,
                                                policy_transaction &tx)
    -> Result<bool> {
  if (role_ref == options_.admin_role_ref) {
    return false;
  }
  auto remaining =
      filtered_rules(policy_section::grouping, 1, {std::string(role_ref)});
  if (remaining.is_err()) {
    return Result<bool>(remaining.error());
  }
  if (!remaining.value().empty()) {
    return false;
  }

  auto deleted = metadata_->remove_role_metadata(role_ref, tx);
  if (deleted.is_err()) {
    return Result<bool>(deleted.error());
  }
  tx.on_commit([logger = logger_, role = std::string(role_ref)] {
    logger->info_fmt("Role {} removed", role);
  });
  return true;
}

auto policy_delegate::upsert_role_metadata(const role_metadata &metadata,
                                           policy_transaction &tx)
    -> Result<bool> {
  const auto &role_ref = metadata.role_entity_ref;
  if (!is_role_ref(role_ref)) {
    return false;
  }

  auto current = metadata_->find_role_metadata(role_ref, tx);
  if (current.is_err()) {
    return Result<bool>(current.error());
  }

  if (current.value()) {
    auto updated = metadata_->update_role_metadata(
        merge_role_metadata(*current.value(), metadata), role_ref, tx);
    if (updated.is_err()) {
      return Result<bool>(updated.error());
    }
    return false;
  }

  auto record = metadata;
  stamp_new_role_metadata(record);
  auto created = metadata_->create_role_metadata(record, tx);
  if (created.is_err()) {
    return Result<bool>(created.error());
  }
  return true;
}

auto policy_delegate::link(const policy_tuple &rule, policy_transaction &tx)
    -> VoidResult {
  const auto &member = rule[0];
  const auto &role = rule[1];

  bool existed = graph_->has_edge(member, role);
  auto added = graph_->add_link(member, role);
  if (added.is_err() || existed) {
    return added;
  }

  tx.on_rollback([graph = graph_, logger = logger_, member, role] {
    auto undone = graph->delete_link(member, role);
    if (undone.is_err()) {
      logger->error_fmt("Failed to undo link {} -> {}: {}", member, role,
                        undone.error().message);
    }
  });
  return added;
}

auto policy_delegate::unlink(const policy_tuple &rule, policy_transaction &tx)
    -> VoidResult {
  const auto &member = rule[0];
  const auto &role = rule[1];

  bool existed = graph_->has_edge(member, role);
  auto deleted = graph_->delete_link(member, role);
  if (deleted.is_err() || !existed) {
    return deleted;
  }

  tx.on_rollback([graph = graph_, logger = logger_, member, role] {
    auto restored = graph->add_link(member, role);
    if (restored.is_err()) {
      logger->error_fmt("Failed to restore link {} -> {}: {}", member, role,
                        restored.error().message);
    }
  });
  return deleted;
}

auto policy_delegate::finish(transaction_scope &scope, VoidResult result,
                             std::string_view operation) -> VoidResult {
  if (result.is_ok()) {
    auto committed = scope.commit_if_owned();
    if (committed.is_ok()) {
      return committed;
    }
    logger_->warn_fmt("{}: commit failed, rolling back: {}", operation,
                      committed.error().message);
    auto rolled_back = scope.rollback_if_owned();
    if (rolled_back.is_err()) {
      logger_->error_fmt("{}: rollback failed: {}", operation,
                         rolled_back.error().message);
    }
    return committed;
  }

  if (scope.owned()) {
    logger_->warn_fmt("{} failed, rolling back: {}", operation,
                      result.error().message);
    auto rolled_back = scope.rollback_if_owned();
    if (rolled_back.is_err()) {
      logger_->error_fmt("{}: rollback failed: {}", operation,
                         rolled_back.error().message);
    }
  }
  return result;
}

} // namespace rbac::security
