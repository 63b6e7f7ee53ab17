/**
 * @file evaluation_context.hpp
 * @brief Disposable in-memory evaluator for one authorization decision
 *
 * Evaluates the model
 *
 *   r = sub, obj, act
 *   p = sub, obj, act, eft
 *   e = some(allow) && !some(deny)
 *   m = g(r.sub, p.sub) && r.obj == p.obj && r.act == p.act
 *
 * over a small rule set. Role inheritance is resolved through the grouping
 * rules of the context and through a borrowed role graph, which is read but
 * never modified.
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include "policy_model.hpp"
#include "role_graph.hpp"

#include <rbac/core/result.hpp>

#include <map>
#include <set>
#include <string>
#include <string_view>

namespace rbac::security {

/**
 * @brief Rule evaluator built per enforce call
 *
 * @code
 * evaluation_context ctx(std::move(model), graph);
 * ctx.enable_auto_build_role_links(false);
 * ctx.build_role_links();
 * auto allowed = ctx.enforce("user:default/alice", "catalog-entity", "read");
 * @endcode
 */
class evaluation_context {
public:
  evaluation_context(policy_model model, role_graph &graph);

  evaluation_context(const evaluation_context &) = delete;
  evaluation_context &operator=(const evaluation_context &) = delete;
  evaluation_context(evaluation_context &&) = default;

  /**
   * @brief Build role links lazily on the first enforce (default on)
   */
  void enable_auto_build_role_links(bool enabled) noexcept {
    auto_build_ = enabled;
  }

  /**
   * @brief Refresh the graph's derived state and index local grouping rules
   */
  void build_role_links();

  /**
   * @brief Decide whether sub may perform act on obj
   *
   * @return The decision, or the role graph error that prevented it
   */
  [[nodiscard]] auto enforce(std::string_view sub, std::string_view obj,
                             std::string_view act) -> Result<bool>;

  [[nodiscard]] const policy_model &model() const noexcept { return model_; }

private:
  /**
   * @brief sub plus every role it reaches through local rules or the graph
   */
  [[nodiscard]] auto subject_closure(std::string_view sub) const
      -> Result<std::set<std::string, std::less<>>>;

  policy_model model_;
  role_graph &graph_;
  std::map<std::string, std::set<std::string>, std::less<>> local_links_;
  bool auto_build_{true};
  bool links_built_{false};
};

} // namespace rbac::security
