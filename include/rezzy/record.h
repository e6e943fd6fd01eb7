#pragma once

#include "rezzy/types.h"

namespace rezzy {

// Bookkeeping shared by all persisted entities. updated_at_ is refreshed by
// the repository on every modification.
struct record {
  timestamp_t created_at_{};
  timestamp_t updated_at_{};
};

}  // namespace rezzy
