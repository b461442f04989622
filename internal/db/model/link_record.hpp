#pragma once

#include <string>
#include <vector>

#include "internal/identity/hash_key.hpp"
#include "internal/util/time.hpp"

namespace vault::db::model {

struct LinkRecord {
  identity::HashKey              link_hk{};
  std::vector<identity::HashKey> members; // ordered
  identity::HashKey              tenant_hk{};
  util::TimePoint                load_date{};
  std::string                    record_source;
};

} // namespace vault::db::model
