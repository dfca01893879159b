#include "internal/discovery/model_loader.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <optional>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace mapper::discovery {

namespace {

bool IsModelFile(const std::filesystem::path& path) {
  const auto ext  = path.extension().string();
  const auto name = path.filename().string();
  return (ext == ".yaml" || ext == ".yml") && !name.empty() && name.front() != '_';
}

bool FlagOr(const YAML::Node& node, const char* key, bool fallback, const std::string& where) {
  const auto value = node[key];
  if (!value) {
    return fallback;
  }
  try {
    return value.as<bool>();
  } catch (const YAML::Exception&) {
    throw util::SchemaError(where + ": '" + key + "' must be true or false");
  }
}

std::optional<model::Value> ParseDefault(const YAML::Node& node, const std::string& type_tag, const std::string& where) {
  if (node.IsNull()) {
    return model::Value{model::Null{}};
  }
  if (!node.IsScalar()) {
    throw util::SchemaError(where + ": default must be a scalar");
  }

  const auto type = model::ParseFieldType(type_tag);
  if (!type) {
    // Unsupported types are reported by schema validation.
    return model::Value{node.Scalar()};
  }
  // Quoted scalars keep their text for text fields, including "null".
  if (*type == model::FieldType::kText) {
    return model::Value{node.Scalar()};
  }
  auto value = model::ParseValue(node.Scalar(), *type);
  if (!value) {
    throw util::SchemaError(where + ": default '" + node.Scalar() + "' is not a valid " + std::string(model::ToString(*type)));
  }
  return value;
}

model::FieldDefinition ParseField(const YAML::Node& node, const std::string& where) {
  if (!node.IsMap()) {
    throw util::SchemaError(where + ": field entry must be a mapping");
  }
  if (!node["name"] || !node["type"]) {
    throw util::SchemaError(where + ": field entry needs 'name' and 'type'");
  }

  model::FieldDefinition field;
  field.name = node["name"].as<std::string>();
  field.type = node["type"].as<std::string>();

  const auto field_where = where + " field '" + field.name + "'";
  field.nullable         = FlagOr(node, "nullable", false, field_where);
  field.unique           = FlagOr(node, "unique", false, field_where);
  field.primary          = FlagOr(node, "primary", false, field_where);
  if (node["default"]) {
    field.default_value = ParseDefault(node["default"], field.type, field_where);
  }
  return field;
}

model::ModelDefinition ParseModel(const YAML::Node& node, const std::string& origin) {
  if (!node.IsMap()) {
    throw util::SchemaError(origin + ": model entry must be a mapping");
  }

  model::ModelDefinition definition;
  if (node["name"]) {
    definition.name = node["name"].as<std::string>();
  } else if (node["class"]) {
    definition.name = TableNameForClass(node["class"].as<std::string>());
  } else {
    throw util::SchemaError(origin + ": model entry needs 'name' or 'class'");
  }

  const auto where     = origin + " model '" + definition.name + "'";
  definition.timestamps = FlagOr(node, "timestamps", false, where);

  const auto fields = node["fields"];
  if (!fields || !fields.IsSequence()) {
    throw util::SchemaError(where + ": 'fields' must be a sequence");
  }
  for (const auto& field : fields) {
    definition.fields.push_back(ParseField(field, where));
  }
  return definition;
}

std::vector<model::ModelDefinition> ParseDocument(const YAML::Node& root, const std::string& origin) {
  std::vector<model::ModelDefinition> out;
  if (!root || root.IsNull()) {
    return out;
  }

  try {
    if (root.IsMap() && root["models"]) {
      const auto models = root["models"];
      if (!models.IsSequence()) {
        throw util::SchemaError(origin + ": 'models' must be a sequence");
      }
      for (const auto& model : models) {
        out.push_back(ParseModel(model, origin));
      }
    } else {
      out.push_back(ParseModel(root, origin));
    }
  } catch (const YAML::Exception& e) {
    throw util::SchemaError(origin + ": " + e.what());
  }
  return out;
}

} // namespace

std::string TableNameForClass(const std::string& class_name) {
  std::string name = class_name;
  std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (name.empty()) {
    return name;
  }
  if (name.back() == 'y') {
    return name.substr(0, name.size() - 1) + "ies";
  }
  if (name.back() == 's') {
    return name + "es";
  }
  return name + "s";
}

std::vector<model::ModelDefinition> ModelLoader::LoadString(const std::string& yaml, const std::string& origin) {
  YAML::Node root;
  try {
    root = YAML::Load(yaml);
  } catch (const YAML::Exception& e) {
    throw util::SchemaError(origin + ": " + e.what());
  }
  return ParseDocument(root, origin);
}

std::vector<model::ModelDefinition> ModelLoader::LoadFile(const std::string& path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw util::SchemaError(path + ": " + e.what());
  }
  return ParseDocument(root, path);
}

std::vector<model::ModelDefinition> ModelLoader::LoadDirectory(const std::string& directory) {
  const std::filesystem::path root(directory);
  if (!std::filesystem::is_directory(root)) {
    throw std::runtime_error("model directory does not exist: " + directory);
  }

  std::vector<std::filesystem::path> files;
  for (const auto& entry : std::filesystem::directory_iterator(root)) {
    if (entry.is_regular_file() && IsModelFile(entry.path())) {
      files.push_back(entry.path());
    }
  }
  std::sort(files.begin(), files.end());

  std::vector<model::ModelDefinition> out;
  for (const auto& file : files) {
    auto models = LoadFile(file.string());
    for (auto& model : models) {
      MAPPER_LOG_INFO("Discovered model", {observability::StringField("model", model.name), observability::StringField("file", file.filename().string())});
      out.push_back(std::move(model));
    }
  }
  return out;
}

} // namespace mapper::discovery
