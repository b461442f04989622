#pragma once

#include <string>

#include "internal/identity/hash_key.hpp"
#include "internal/util/time.hpp"

namespace vault::db::model {

// Immutable identity anchor. Never updated, never deleted.
struct HubRecord {
  identity::HashKey hash_key{};
  std::string       business_key;
  identity::HashKey tenant_hk{};
  util::TimePoint   load_date{};
  std::string       record_source;
};

} // namespace vault::db::model
