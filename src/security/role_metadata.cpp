/**
 * @file role_metadata.cpp
 * @brief Role metadata merge and stamping rules
 *
 * @copyright Copyright (c) 2025
 */

#include <rbac/security/role_metadata.hpp>

#include <rbac/compat/time.hpp>

namespace rbac::security {

role_metadata merge_role_metadata(const role_metadata &current,
                                  const role_metadata &incoming,
                                  std::chrono::system_clock::time_point now) {
  role_metadata merged = current;
  merged.role_entity_ref = incoming.role_entity_ref;
  merged.modified_by = incoming.modified_by;
  if (incoming.author)
    merged.author = incoming.author;
  if (incoming.description)
    merged.description = incoming.description;
  if (incoming.owner)
    merged.owner = incoming.owner;
  merged.last_modified =
      incoming.last_modified ? *incoming.last_modified
                             : compat::utc_http_date(now);
  return merged;
}

void stamp_new_role_metadata(role_metadata &record,
                             std::chrono::system_clock::time_point now) {
  auto stamp = compat::utc_http_date(now);
  record.created_at = stamp;
  record.last_modified = stamp;
}

} // namespace rbac::security
