#pragma once

#include <string>
#include <vector>

#include "internal/model/schema.hpp"

namespace mapper::discovery {

/*
  Reads model definitions from YAML files.

  A file holds one model or a `models:` sequence of them:

      class: User            # or `name: users`
      timestamps: true       # optional, managed create_time / update_time
      fields:
        - { name: name,   type: text, unique: true }
        - { name: age,    type: integer }
        - { name: status, type: text, default: active }

  Only parsing happens here; ModelRegistry::Load validates the result.
*/
class ModelLoader {
 public:
  // Scans `directory` (non-recursive, by file name) for *.yaml / *.yml,
  // skipping names that start with '_'. Throws std::runtime_error if the
  // directory does not exist, SchemaError for malformed files.
  static std::vector<model::ModelDefinition> LoadDirectory(const std::string& directory);

  static std::vector<model::ModelDefinition> LoadFile(const std::string& path);

  // `origin` names the source in error messages.
  static std::vector<model::ModelDefinition> LoadString(const std::string& yaml, const std::string& origin = "<string>");
};

// Model name for a declared class: lower case plus a simple plural.
// User -> users, Company -> companies, Class -> classes.
std::string TableNameForClass(const std::string& class_name);

} // namespace mapper::discovery
