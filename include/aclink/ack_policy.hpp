#pragma once
/**
 * @file ack_policy.hpp
 * @brief Set of type names whose receipt triggers an automatic ack.
 *
 * Built once from configuration and then only read by Core.
 */

#include <string.h>
#include "etl/vector.h"
#include "message_type.hpp"

namespace aclink {

class AckPolicy {
public:
  static constexpr size_t MAX_ENTRIES = 32;

  /// Default policy: position_request and body_request.
  static AckPolicy defaults() {
    AckPolicy p;
    p.add(type_name::POSITION_REQUEST);
    p.add(type_name::BODY_REQUEST);
    return p;
  }

  /// false when the set is full or the name does not fit a TypeName.
  bool add(const char* name) {
    if (!name || !*name || names_.full()) return false;
    if (requires_ack(name)) return true;
    if (strlen(name) > ACLINK_NAME_MAX) return false;
    names_.push_back(TypeName(name));
    return true;
  }

  bool requires_ack(const char* name) const {
    if (!name) return false;
    for (const auto& n : names_) {
      if (n == name) return true;
    }
    return false;
  }

  bool requires_ack(const TypeName& name) const { return requires_ack(name.c_str()); }

  void clear() { names_.clear(); }
  size_t size() const { return names_.size(); }

  etl::vector<TypeName, MAX_ENTRIES>::const_iterator begin() const { return names_.begin(); }
  etl::vector<TypeName, MAX_ENTRIES>::const_iterator end()   const { return names_.end(); }

private:
  etl::vector<TypeName, MAX_ENTRIES> names_;
};

} // namespace aclink
