#pragma once

#include "vault/config/v1/config.pb.h"
#include "vault/core/v1/domain.pb.h"
#include "vault/core/v1/session.pb.h"

namespace vault::core::v1 {

inline constexpr const char* kApiVersion = "v1";

}  // namespace vault::core::v1
