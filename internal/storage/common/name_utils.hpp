#pragma once

#include <string>

#include "internal/util/errors.hpp"

namespace mapper::storage::common {

// Namespace names become part of storage keys; restrict them to a safe set.
inline void ValidateNamespaceName(const std::string& name) {
  if (name.empty()) {
    throw util::InvalidArgumentError("namespace name must not be empty");
  }
  for (char c : name) {
    const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' || c == '-' || c == '.';
    if (!ok) {
      throw util::InvalidArgumentError("namespace name '" + name + "' contains invalid character");
    }
  }
  if (name == "." || name == "..") {
    throw util::InvalidArgumentError("namespace name must not be a relative path component");
  }
}

} // namespace mapper::storage::common
