/**
 * @file transaction.hpp
 * @brief Transaction handles spanning the tuple store and metadata store
 *
 * A policy_transaction groups writes to the policy adapter and the role
 * metadata storage into one atomic unit. Work that lives outside the
 * database (role graph edges, notifications) is attached to the
 * transaction as hooks: commit hooks run after a successful commit,
 * rollback hooks undo in-memory changes in reverse order.
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <rbac/core/result.hpp>

#include <functional>
#include <memory>
#include <vector>

namespace rbac::security {

/**
 * @brief Who is responsible for committing or rolling back a transaction
 */
enum class transaction_ownership {
  owned_by_callee,   ///< Opened by the operation, finished by it
  supplied_by_caller ///< Passed in; never committed or rolled back by callee
};

/**
 * @brief One unit of atomic work against the policy stores
 *
 * Concrete transactions roll back on destruction if still active.
 */
class policy_transaction {
public:
  using hook = std::function<void()>;

  virtual ~policy_transaction() = default;

  /**
   * @brief Commit, then run commit hooks in registration order
   *
   * On failure the transaction stays active and its hooks are kept, so a
   * following rollback() still undoes in-memory changes.
   */
  [[nodiscard]] auto commit() -> VoidResult;

  /**
   * @brief Roll back, then run rollback hooks in reverse order
   */
  [[nodiscard]] auto rollback() -> VoidResult;

  [[nodiscard]] virtual bool is_active() const noexcept = 0;

  /**
   * @brief Run after the transaction commits; dropped on rollback
   */
  void on_commit(hook fn);

  /**
   * @brief Run if the transaction rolls back; dropped on commit
   */
  void on_rollback(hook fn);

protected:
  policy_transaction() = default;
  policy_transaction(const policy_transaction &) = delete;
  policy_transaction &operator=(const policy_transaction &) = delete;

  [[nodiscard]] virtual auto do_commit() -> VoidResult = 0;
  [[nodiscard]] virtual auto do_rollback() -> VoidResult = 0;

private:
  std::vector<hook> commit_hooks_;
  std::vector<hook> rollback_hooks_;
};

/**
 * @brief Opens transactions on the shared policy store
 */
class transaction_provider {
public:
  virtual ~transaction_provider() = default;

  [[nodiscard]] virtual auto begin()
      -> Result<std::unique_ptr<policy_transaction>> = 0;

protected:
  transaction_provider() = default;
  transaction_provider(const transaction_provider &) = delete;
  transaction_provider &operator=(const transaction_provider &) = delete;
};

/**
 * @brief Transaction used by one operation, either owned or borrowed
 *
 * Owned transactions are rolled back on destruction unless committed.
 */
class transaction_scope {
public:
  /**
   * @brief Borrow external, or begin a new owned transaction if null
   */
  [[nodiscard]] static auto open(transaction_provider &provider,
                                 policy_transaction *external)
      -> Result<transaction_scope>;

  transaction_scope(transaction_scope &&) noexcept = default;
  transaction_scope &operator=(transaction_scope &&) noexcept = default;

  [[nodiscard]] policy_transaction &tx() noexcept { return *tx_; }

  [[nodiscard]] transaction_ownership ownership() const noexcept {
    return ownership_;
  }

  [[nodiscard]] bool owned() const noexcept {
    return ownership_ == transaction_ownership::owned_by_callee;
  }

  /**
   * @brief Commit when owned; no-op for a caller supplied transaction
   */
  [[nodiscard]] auto commit_if_owned() -> VoidResult;

  /**
   * @brief Roll back when owned; no-op for a caller supplied transaction
   */
  [[nodiscard]] auto rollback_if_owned() -> VoidResult;

private:
  transaction_scope(std::unique_ptr<policy_transaction> owned,
                    policy_transaction *tx, transaction_ownership ownership);

  std::unique_ptr<policy_transaction> owned_;
  policy_transaction *tx_;
  transaction_ownership ownership_;
};

} // namespace rbac::security
