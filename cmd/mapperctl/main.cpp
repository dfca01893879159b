#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/engine/data_engine.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

using mapper::engine::DataEngine;
using mapper::engine::Op;

namespace {

// Bad command line; exits with 1 rather than 2.
class UsageError : public std::runtime_error {
 public:
  explicit UsageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

void Usage() {
  std::cout << "Usage:\n"
            << "  mapperctl [--config <config.yaml>] [--models-dir <dir>] [--db <namespace>] <command> ...\n"
            << "\n"
            << "Commands:\n"
            << "  models\n"
            << "  create <model> field=value...\n"
            << "  get <model> <id>\n"
            << "  update <model> <id> field=value...\n"
            << "  delete <model> <id>\n"
            << "  query <model> [field<op>value...] [--order-by [-]<field>] [--desc] [--offset <n>] [--limit <n>]\n"
            << "        op: = != > < ~ (in-set, comma separated); a leading '-' on the order field sorts descending\n";
}

mapper::model::Identifier ParseId(const std::string& text) {
  if (text.empty() || text.size() > 19 || text.find_first_not_of("0123456789") != std::string::npos) {
    throw UsageError("invalid identifier: " + text);
  }
  return mapper::model::Identifier{std::stoull(text)};
}

std::size_t ParseCount(const std::string& flag, const std::string& text) {
  if (text.empty() || text.size() > 18 || text.find_first_not_of("0123456789") != std::string::npos) {
    throw UsageError(flag + " expects a non-negative number, got '" + text + "'");
  }
  return static_cast<std::size_t>(std::stoull(text));
}

const mapper::model::Field& FieldFor(const mapper::model::ModelSchema& schema, const std::string& name) {
  const auto* field = schema.Find(name);
  if (!field) {
    throw mapper::util::UnknownFieldError("model '" + schema.Name() + "' has no field '" + name + "'");
  }
  return *field;
}

mapper::model::Value ParseFor(const mapper::model::Field& field, const std::string& text) {
  auto value = mapper::model::ParseValue(text, field.type);
  if (!value) {
    throw mapper::util::TypeMismatchError("field '" + field.name + "' expects " + std::string(mapper::model::ToString(field.type)) + ", got '" +
                                          text + "'");
  }
  return std::move(*value);
}

mapper::model::ValueMap ParseAssignments(const mapper::model::ModelSchema& schema, const std::vector<std::string>& args) {
  mapper::model::ValueMap values;
  for (const auto& arg : args) {
    const auto eq = arg.find('=');
    if (eq == std::string::npos || eq == 0) {
      throw UsageError("expected field=value, got '" + arg + "'");
    }
    const auto& field = FieldFor(schema, arg.substr(0, eq));
    values[field.name] = ParseFor(field, arg.substr(eq + 1));
  }
  return values;
}

std::vector<std::string> SplitComma(const std::string& text) {
  std::vector<std::string> out;
  std::size_t              start = 0;
  while (true) {
    const auto comma = text.find(',', start);
    out.push_back(text.substr(start, comma - start));
    if (comma == std::string::npos) {
      return out;
    }
    start = comma + 1;
  }
}

mapper::engine::Condition ParseCondition(const mapper::model::ModelSchema& schema, const std::string& arg) {
  const auto pos = arg.find_first_of("=!<>~");
  if (pos == std::string::npos || pos == 0) {
    throw UsageError("expected field<op>value, got '" + arg + "'");
  }

  Op          op;
  std::size_t width = 1;
  switch (arg[pos]) {
    case '=':
      op = Op::kEquals;
      break;
    case '!':
      if (arg.compare(pos, 2, "!=") != 0) {
        throw UsageError("unknown operator in '" + arg + "'");
      }
      op    = Op::kNotEquals;
      width = 2;
      break;
    case '>':
      op = Op::kGreaterThan;
      break;
    case '<':
      op = Op::kLessThan;
      break;
    default:
      op = Op::kInSet;
      break;
  }

  const auto& field = FieldFor(schema, arg.substr(0, pos));
  const auto  text  = arg.substr(pos + width);

  if (op == Op::kInSet) {
    std::vector<mapper::model::Value> members;
    for (const auto& item : SplitComma(text)) {
      members.push_back(ParseFor(field, item));
    }
    return mapper::engine::WhereIn(field.name, std::move(members));
  }
  return mapper::engine::Where(field.name, op, ParseFor(field, text));
}

int Run(DataEngine& engine, const std::string& cmd, const std::vector<std::string>& args) {
  if (cmd == "models") {
    for (const auto& name : engine.Registry().ModelNames()) {
      const auto  schema = engine.Registry().Resolve(name);
      std::string line   = name + ":";
      for (const auto& field : schema->Fields()) {
        line += " " + field.name + "(" + std::string(mapper::model::ToString(field.type));
        if (field.primary) line += ",primary";
        if (field.unique && !field.primary) line += ",unique";
        if (field.nullable) line += ",nullable";
        if (field.managed) line += ",managed";
        line += ")";
      }
      std::cout << line << "\n";
    }
    return 0;
  }

  if (args.empty()) {
    throw UsageError(cmd + ": missing model name");
  }
  const auto& model  = args[0];
  const auto  schema = engine.Registry().Resolve(model);

  if (cmd == "create") {
    auto record = engine.Create(model, ParseAssignments(*schema, {args.begin() + 1, args.end()}));
    std::cout << record.ToString() << "\n";
    return 0;
  }

  if (cmd == "get" || cmd == "delete") {
    if (args.size() != 2) {
      throw UsageError(cmd + " <model> <id>");
    }
    const auto id = ParseId(args[1]);
    if (cmd == "delete") {
      std::cout << (engine.Delete(model, id) ? "deleted" : "not found") << "\n";
      return 0;
    }
    auto record = engine.Get(model, id);
    if (!record) {
      std::cout << "not found\n";
      return 0;
    }
    std::cout << record->ToString() << "\n";
    return 0;
  }

  if (cmd == "update") {
    if (args.size() < 2) {
      throw UsageError("update <model> <id> field=value...");
    }
    auto record = engine.Update(model, ParseId(args[1]), ParseAssignments(*schema, {args.begin() + 2, args.end()}));
    std::cout << record.ToString() << "\n";
    return 0;
  }

  if (cmd == "query") {
    mapper::engine::Filter       filter;
    mapper::engine::QueryOptions options;
    for (std::size_t i = 1; i < args.size(); ++i) {
      const auto& arg = args[i];
      if (arg == "--desc") {
        options.descending = true;
        continue;
      }
      if (arg == "--order-by" || arg == "--offset" || arg == "--limit") {
        if (i + 1 >= args.size()) {
          throw UsageError(arg + " needs a value");
        }
        const auto& value = args[++i];
        if (arg == "--order-by") {
          auto name = value;
          if (!name.empty() && name.front() == '-') {
            options.descending = true;
            name.erase(0, 1);
          }
          options.order_by = FieldFor(*schema, name).name;
        } else if (arg == "--offset") {
          options.offset = ParseCount(arg, value);
        } else {
          options.limit = ParseCount(arg, value);
        }
        continue;
      }
      filter.push_back(ParseCondition(*schema, arg));
    }
    std::size_t n = 0;
    for (const auto& record : engine.Query(model, filter, options)) {
      std::cout << record.ToString() << "\n";
      ++n;
    }
    std::cout << "(" << n << " records)\n";
    return 0;
  }

  throw UsageError("unknown command: " + cmd);
}

} // namespace

int main(int argc, char** argv) {
  std::string              config_path;
  std::string              models_dir;
  std::string              database;
  std::vector<std::string> positional;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if ((arg == "--config" || arg == "--models-dir" || arg == "--db") && i + 1 < argc) {
      (arg == "--config" ? config_path : arg == "--models-dir" ? models_dir : database) = argv[++i];
    } else if (arg == "-h" || arg == "--help") {
      Usage();
      return 0;
    } else {
      positional.push_back(arg);
    }
  }

  if (positional.empty()) {
    Usage();
    return 1;
  }

  try {
    auto config = config_path.empty() ? mapper::config::ConfigLoader::Defaults() : mapper::config::ConfigLoader::LoadFromYaml(config_path);
    if (!models_dir.empty()) {
      config.mutable_models()->set_directory(models_dir);
    }

    mapper::observability::InitializeLogging(config);

    auto runtime = mapper::factory::BuildRuntime(config);
    if (!database.empty()) {
      runtime.engine->Use(database);
    }

    const int rc = Run(*runtime.engine, positional[0], {positional.begin() + 1, positional.end()});
    mapper::observability::ShutdownLogging();
    return rc;
  } catch (const UsageError& e) {
    std::cerr << e.what() << "\n";
    Usage();
    mapper::observability::ShutdownLogging();
    return 1;
  } catch (const std::exception& e) {
    MAPPER_LOG_ERROR("Command failed", {mapper::observability::StringField("error", e.what())});
    std::cerr << e.what() << "\n";
    mapper::observability::ShutdownLogging();
    return 2;
  }
}
