/**
 * @file in_memory_role_graph.hpp
 * @brief Default role_graph with bounded transitive resolution
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include "role_graph.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace rbac::security {

/**
 * @brief Supplies extra direct parents for a principal
 *
 * Used for memberships derived outside the policy store, e.g. catalog
 * groups of a user. Parents returned here are resolved like edges but are
 * never stored. The resolver runs without the graph lock held, so it may
 * query the graph.
 */
using membership_resolver =
    std::function<Result<std::vector<std::string>>(std::string_view principal)>;

/**
 * @brief Adjacency-set role graph with a rebuild-on-demand resolution cache
 *
 * Resolved role sets are computed lazily per principal and cached until
 * an edge changes or rebuild() is called. The cache holds at most
 * cache_limit principals and is emptied when it fills up. Resolution follows at most
 * max_depth edges from the principal; cycles are tolerated.
 *
 * Thread Safety: All methods are thread-safe.
 *
 * @example
 * @code
 * auto graph = std::make_shared<in_memory_role_graph>();
 * (void)graph->add_link("user:default/alice", "group:default/team");
 * (void)graph->add_link("group:default/team", "role:default/dev");
 * auto roles = graph->get_roles("user:default/alice");
 * // {"group:default/team", "role:default/dev"}
 * @endcode
 */
class in_memory_role_graph final : public role_graph {
public:
  static constexpr std::size_t default_max_depth = 10;
  static constexpr std::size_t default_cache_limit = 4096;

  explicit in_memory_role_graph(std::size_t max_depth = default_max_depth,
                                std::size_t cache_limit = default_cache_limit);
  ~in_memory_role_graph() override = default;

  [[nodiscard]] auto add_link(std::string_view member, std::string_view role)
      -> VoidResult override;
  [[nodiscard]] auto delete_link(std::string_view member, std::string_view role)
      -> VoidResult override;
  [[nodiscard]] bool has_edge(std::string_view member,
                              std::string_view role) const override;
  [[nodiscard]] auto has_link(std::string_view member,
                              std::string_view role) const
      -> Result<bool> override;
  [[nodiscard]] auto get_roles(std::string_view principal) const
      -> Result<std::vector<std::string>> override;
  [[nodiscard]] auto get_users(std::string_view role) const
      -> Result<std::vector<std::string>> override;
  void rebuild() override;
  void clear() override;

  /**
   * @brief Install a resolver for externally derived memberships
   */
  void set_membership_resolver(membership_resolver resolver);

  [[nodiscard]] std::size_t edge_count() const;
  [[nodiscard]] std::size_t cached_principals() const;

private:
  [[nodiscard]] auto resolve(const std::string &principal) const
      -> Result<std::vector<std::string>>;
  [[nodiscard]] auto direct_parents(const std::string &node) const
      -> std::vector<std::string>;
  void invalidate_locked();

  std::size_t max_depth_;
  std::size_t cache_limit_;
  std::uint64_t generation_{0};
  membership_resolver resolver_;
  std::map<std::string, std::set<std::string>, std::less<>> parents_;
  std::map<std::string, std::set<std::string>, std::less<>> members_;
  mutable std::map<std::string, std::vector<std::string>, std::less<>> cache_;
  mutable std::mutex mutex_;
};

} // namespace rbac::security
