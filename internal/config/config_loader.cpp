#include "config_loader.hpp"

#include <google/protobuf/descriptor.h>
#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>
#include <string>

namespace settle::config {

namespace rc = settle::runtime::config;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static bool IsInteger(const std::string& s) {
  std::size_t i = (!s.empty() && s[0] == '-') ? 1 : 0;
  if (i == s.size()) return false;
  for (; i < s.size(); ++i) {
    if (s[i] < '0' || s[i] > '9') return false;
  }
  return true;
}

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // quoted scalars stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  // JSON strings keep 64-bit integers exact; protobuf accepts both forms
  if (IsInteger(scalar_value)) {
    value->set_string_value(scalar_value);
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

// YAML scalars carry no schema; bool fields also take 1/0 and quoted
// forms, and anything else is reported with the key that holds it.
static void CoerceToSchema(google::protobuf::Value* value, const google::protobuf::Descriptor* descriptor, const std::string& path) {
  using google::protobuf::FieldDescriptor;

  if (descriptor == nullptr || value->kind_case() != google::protobuf::Value::kStructValue) return;

  for (auto& entry : *value->mutable_struct_value()->mutable_fields()) {
    const auto* field = descriptor->FindFieldByName(entry.first);
    if (field == nullptr || field->is_repeated()) continue;

    const auto key = path.empty() ? entry.first : path + "." + entry.first;
    auto&      v   = entry.second;
    if (field->cpp_type() == FieldDescriptor::CPPTYPE_MESSAGE) {
      CoerceToSchema(&v, field->message_type(), key);
    } else if (field->cpp_type() == FieldDescriptor::CPPTYPE_BOOL && v.kind_case() == google::protobuf::Value::kStringValue) {
      const std::string text = v.string_value();
      if (text == "true" || text == "1") {
        v.set_bool_value(true);
      } else if (text == "false" || text == "0") {
        v.set_bool_value(false);
      } else {
        throw std::runtime_error("Invalid configuration: " + key + " must be true or false, got \"" + text + "\"");
      }
    }
  }
}

static rc::RuntimeConfig FromYamlNode(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);
  CoerceToSchema(&json_value, rc::RuntimeConfig::descriptor(), "");

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  rc::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::Validate(config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

rc::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

rc::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

static void ValidateFees(const rc::FeeSchedule& fees, const char* name) {
  if (fees.dynamic_fee_bps() > 10000) {
    throw std::runtime_error(std::string("Invalid configuration: fees.") + name + ".dynamic_fee_bps exceeds 10000");
  }
}

static void ValidateLedger(const rc::LedgerConfig& ledger, const char* name) {
  // 10^18 is the widest scale that fits 64-bit base units
  if (ledger.decimals() > 18) {
    throw std::runtime_error(std::string("Invalid configuration: ") + name + ".decimals exceeds 18");
  }
}

void ConfigLoader::Validate(const rc::RuntimeConfig& config) {
  ValidateFees(config.fees().token_deposit(), "token_deposit");
  ValidateFees(config.fees().register_credit(), "register_credit");
  ValidateLedger(config.token_ledger(), "token_ledger");
  ValidateLedger(config.register_ledger(), "register_ledger");

  if (config.database().has_postgres() && config.database().postgres().connection_uri().empty()) {
    throw std::runtime_error("Invalid configuration: database.postgres.connection_uri is required");
  }
  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
  }

  for (const auto* d : {&config.retry().cooldown(), &config.timeouts().mapping_timeout(), &config.timeouts().confirmation_timeout(),
                        &config.reservations().ttl(), &config.watermark().safety_margin(), &config.watermark().max_lookback(),
                        &config.watermark().min_publish_interval()}) {
    if (d->seconds() < 0 || d->nanos() < 0) {
      throw std::runtime_error("Invalid configuration: durations must not be negative");
    }
  }
}

} // namespace settle::config
