#pragma once

#include "release_accessor.h"

namespace keel {

// Persists release snapshots. update() throws on failure.
class release_store {
 public:
  virtual ~release_store() = default;

  virtual void update(release_ref rel) = 0;
};

}  // namespace keel
