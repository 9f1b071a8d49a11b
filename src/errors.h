#pragma once

#include <stdexcept>
#include <string>

namespace keel {

// Base of every error raised by the hook engine and the ordered installer.
struct error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Release or hook value is not one of the known schema variants.
struct unsupported_schema_error : error {
  using error::error;
};

// Manifest text could not be built into resource objects.
struct manifest_build_error : error {
  using error::error;
};

// Cluster rejected resource creation.
struct apply_error : error {
  using error::error;
};

// Resources did not become ready within the timeout, or reported a terminal failure.
struct readiness_error : error {
  using error::error;
};

// Deleting a hook resource failed during cleanup.
struct cleanup_error : error {
  using error::error;
};

// Sub-unit dependency graph contains a cycle.
struct cycle_error : error {
  using error::error;
};

}  // namespace keel
