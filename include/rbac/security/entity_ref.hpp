/**
 * @file entity_ref.hpp
 * @brief Entity reference parsing ("<kind>:<namespace>/<name>")
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace rbac::security {

/**
 * @brief Kinds of entities that appear as rule subjects
 */
enum class entity_kind {
  user,  ///< Individual principal
  group, ///< Principal group, usually catalog derived
  role,  ///< RBAC role
  other  ///< Any other kind
};

/**
 * @brief Convert entity_kind to string
 */
constexpr std::string_view to_string(entity_kind kind) {
  switch (kind) {
  case entity_kind::user:
    return "user";
  case entity_kind::group:
    return "group";
  case entity_kind::role:
    return "role";
  case entity_kind::other:
    return "other";
  }
  return "other";
}

/**
 * @brief Parsed entity reference
 */
struct entity_ref {
  entity_kind kind{entity_kind::other};
  std::string kind_name;
  std::string ns;
  std::string name;

  [[nodiscard]] std::string str() const {
    return kind_name + ":" + ns + "/" + name;
  }
};

/**
 * @brief Parse an entity reference
 * @return The reference, or nullopt if it is not of the form kind:ns/name
 */
inline std::optional<entity_ref> parse_entity_ref(std::string_view str) {
  auto colon = str.find(':');
  if (colon == std::string_view::npos || colon == 0) {
    return std::nullopt;
  }
  auto slash = str.find('/', colon + 1);
  if (slash == std::string_view::npos || slash == colon + 1 ||
      slash + 1 == str.size()) {
    return std::nullopt;
  }

  entity_ref ref;
  ref.kind_name = std::string(str.substr(0, colon));
  ref.ns = std::string(str.substr(colon + 1, slash - colon - 1));
  ref.name = std::string(str.substr(slash + 1));
  if (ref.kind_name == "user")
    ref.kind = entity_kind::user;
  else if (ref.kind_name == "group")
    ref.kind = entity_kind::group;
  else if (ref.kind_name == "role")
    ref.kind = entity_kind::role;
  return ref;
}

/**
 * @brief True if the reference names a role ("role:...")
 */
inline bool is_role_ref(std::string_view str) {
  return str.starts_with("role:");
}

/**
 * @brief True if the reference names a user or group directly
 *
 * Rules whose subject is a principal apply without any resolved role.
 */
inline bool is_principal_ref(std::string_view str) {
  return str.starts_with("user") || str.starts_with("group");
}

} // namespace rbac::security
