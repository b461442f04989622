#pragma once

#include <optional>
#include <string>

#include "internal/identity/hash_key.hpp"
#include "internal/util/time.hpp"

namespace vault::db::model {

/*
  One version of a descriptive record.

  Primary key is (satellite, hash_key, load_date). At most one row per
  (satellite, hash_key) has no load_end_date.
*/
struct SatelliteRecord {
  std::string                    satellite;
  identity::HashKey              hash_key{};
  util::TimePoint                load_date{};
  std::optional<util::TimePoint> load_end_date;
  identity::HashKey              hash_diff{};
  std::string                    payload;
  std::string                    record_source;
};

} // namespace vault::db::model
