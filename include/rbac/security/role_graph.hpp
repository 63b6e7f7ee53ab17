/**
 * @file role_graph.hpp
 * @brief Role hierarchy interface shared by the delegate and evaluations
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <rbac/core/result.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace rbac::security {

/**
 * @brief Directed membership / inheritance edges between principals and roles
 *
 * An edge member -> role mirrors a stored grouping rule. Resolution is
 * transitive: a principal holds every role reachable from it. Derived
 * lookup state may be cached; rebuild() discards it without touching
 * edges.
 *
 * Implementations must be safe for concurrent use. The graph is injected
 * into the policy delegate and shared, not owned, by evaluation contexts.
 */
class role_graph {
public:
  virtual ~role_graph() = default;

  /**
   * @brief Add the edge member -> role
   */
  [[nodiscard]] virtual auto add_link(std::string_view member,
                                      std::string_view role) -> VoidResult = 0;

  /**
   * @brief Remove the edge member -> role (no-op if absent)
   */
  [[nodiscard]] virtual auto delete_link(std::string_view member,
                                         std::string_view role)
      -> VoidResult = 0;

  /**
   * @brief True if the direct edge member -> role is stored
   */
  [[nodiscard]] virtual bool has_edge(std::string_view member,
                                      std::string_view role) const = 0;

  /**
   * @brief True if member reaches role directly or transitively
   */
  [[nodiscard]] virtual auto has_link(std::string_view member,
                                      std::string_view role) const
      -> Result<bool> = 0;

  /**
   * @brief Every role reachable from a principal, nearest first
   */
  [[nodiscard]] virtual auto get_roles(std::string_view principal) const
      -> Result<std::vector<std::string>> = 0;

  /**
   * @brief Direct members of a role
   */
  [[nodiscard]] virtual auto get_users(std::string_view role) const
      -> Result<std::vector<std::string>> = 0;

  /**
   * @brief Discard derived lookup state; edges are kept
   */
  virtual void rebuild() = 0;

  /**
   * @brief Remove every edge
   */
  virtual void clear() = 0;

protected:
  role_graph() = default;
  role_graph(const role_graph &) = delete;
  role_graph &operator=(const role_graph &) = delete;
  role_graph(role_graph &&) = default;
  role_graph &operator=(role_graph &&) = default;
};

} // namespace rbac::security
