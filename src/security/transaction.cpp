/**
 * @file transaction.cpp
 * @brief Transaction hooks and ownership handling
 *
 * @copyright Copyright (c) 2025
 */

#include <rbac/security/transaction.hpp>

#include <utility>

namespace rbac::security {

auto policy_transaction::commit() -> VoidResult {
  auto result = do_commit();
  if (result.is_err()) {
    return result;
  }

  rollback_hooks_.clear();
  auto hooks = std::move(commit_hooks_);
  commit_hooks_.clear();
  for (auto &fn : hooks) {
    fn();
  }
  return result;
}

auto policy_transaction::rollback() -> VoidResult {
  auto result = do_rollback();

  // In-memory state is restored even if the database reported a failure
  commit_hooks_.clear();
  auto hooks = std::move(rollback_hooks_);
  rollback_hooks_.clear();
  for (auto it = hooks.rbegin(); it != hooks.rend(); ++it) {
    (*it)();
  }
  return result;
}

void policy_transaction::on_commit(hook fn) {
  commit_hooks_.push_back(std::move(fn));
}

void policy_transaction::on_rollback(hook fn) {
  rollback_hooks_.push_back(std::move(fn));
}

transaction_scope::transaction_scope(std::unique_ptr<policy_transaction> owned,
                                     policy_transaction *tx,
                                     transaction_ownership ownership)
    : owned_(std::move(owned)), tx_(tx), ownership_(ownership) {}

auto transaction_scope::open(transaction_provider &provider,
                             policy_transaction *external)
    -> Result<transaction_scope> {
  if (external) {
    if (!external->is_active()) {
      return rbac_error<transaction_scope>(
          error_codes::transaction_not_active,
          "Supplied transaction is no longer active", "transaction");
    }
    return transaction_scope(nullptr, external,
                             transaction_ownership::supplied_by_caller);
  }

  auto begun = provider.begin();
  if (begun.is_err()) {
    return Result<transaction_scope>(begun.error());
  }
  auto owned = std::move(begun.value());
  auto *raw = owned.get();
  return transaction_scope(std::move(owned), raw,
                           transaction_ownership::owned_by_callee);
}

auto transaction_scope::commit_if_owned() -> VoidResult {
  if (!owned()) {
    return ok();
  }
  return owned_->commit();
}

auto transaction_scope::rollback_if_owned() -> VoidResult {
  if (!owned() || !owned_->is_active()) {
    return ok();
  }
  return owned_->rollback();
}

} // namespace rbac::security
