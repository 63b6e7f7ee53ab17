/**
 * @file role_metadata.hpp
 * @brief Per-role metadata records used for auditing and lifecycle rules
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace rbac::security {

/**
 * @brief Provenance of a role definition
 */
enum class role_source {
  rest,          ///< Created through the REST API
  csv_file,      ///< Loaded from a policy CSV file
  configuration, ///< Declared in application configuration
  legacy         ///< Created before provenance was tracked
};

/**
 * @brief Convert role_source to its stored string
 */
constexpr std::string_view to_string(role_source source) {
  switch (source) {
  case role_source::rest:
    return "rest";
  case role_source::csv_file:
    return "csv-file";
  case role_source::configuration:
    return "configuration";
  case role_source::legacy:
    return "legacy";
  }
  return "legacy";
}

/**
 * @brief Parse role_source from its stored string
 */
inline std::optional<role_source> parse_role_source(std::string_view str) {
  if (str == "rest")
    return role_source::rest;
  if (str == "csv-file")
    return role_source::csv_file;
  if (str == "configuration")
    return role_source::configuration;
  if (str == "legacy")
    return role_source::legacy;
  return std::nullopt;
}

/**
 * @brief Metadata record of one role, keyed by role_entity_ref
 *
 * Timestamps are RFC 7231 UTC dates. Optional fields left unset on an
 * incoming record keep the stored value when merged.
 */
struct role_metadata {
  std::string role_entity_ref;
  role_source source{role_source::rest};
  std::string modified_by;
  std::optional<std::string> author;
  std::optional<std::string> description;
  std::optional<std::string> owner;
  std::optional<std::string> created_at;
  std::optional<std::string> last_modified;

  bool operator==(const role_metadata &other) const = default;
};

/**
 * @brief Merge an incoming record into the stored one
 *
 * The stored record keeps its creation time and source. modified_by comes
 * from the incoming record; author, description and owner are taken from
 * the incoming record when set. last_modified is the incoming value when
 * set, else now.
 *
 * @param current Stored record
 * @param incoming Record supplied by the caller
 * @param now Time used when incoming carries no last_modified
 * @return Merged record
 */
[[nodiscard]] role_metadata
merge_role_metadata(const role_metadata &current, const role_metadata &incoming,
                    std::chrono::system_clock::time_point now =
                        std::chrono::system_clock::now());

/**
 * @brief Stamp created_at and last_modified on a record about to be created
 */
void stamp_new_role_metadata(role_metadata &record,
                             std::chrono::system_clock::time_point now =
                                 std::chrono::system_clock::now());

} // namespace rbac::security
