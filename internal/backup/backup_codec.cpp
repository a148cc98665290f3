#include "backup_codec.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>
#include <stdexcept>

#include "internal/model/nutrient_catalog.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"
#include "nutrition/backup/v1/backup.pb.h"

namespace nutrition::backup {

namespace pb = nutrition::backup::v1;

using google::protobuf::FieldDescriptor;
using google::protobuf::Message;
using nutrition::db::model::AiTemplateRecord;
using nutrition::db::model::DailyLogRecord;
using nutrition::db::model::FoodEntryRecord;
using nutrition::db::model::ProductRecord;
using nutrition::db::model::SupplementEntryRecord;
using nutrition::db::model::SupplementRecord;
using nutrition::model::NutrientCatalog;
using nutrition::model::NutrientMap;
using nutrition::model::NutritionFacts;

namespace {

// Documents carry whole seconds.
google::protobuf::Timestamp ToWireTime(util::TimePoint tp) {
  return util::ToProto(std::chrono::floor<std::chrono::seconds>(tp));
}

// ------------------------------------------------------------------
// Reflection helpers for the macro and nutrient fields, which share
// their JSON names with NutritionFacts macro names and catalog keys.
// ------------------------------------------------------------------

const FieldDescriptor* DoubleField(const Message& msg, std::string_view json_name) {
  const auto* field = msg.GetDescriptor()->FindFieldByCamelcaseName(std::string(json_name));
  if (!field || field->cpp_type() != FieldDescriptor::CPPTYPE_DOUBLE) {
    throw std::logic_error(msg.GetDescriptor()->full_name() + " has no double field " + std::string(json_name));
  }
  return field;
}

void WriteNutrients(const NutrientMap& nutrients, Message& msg) {
  const auto* refl = msg.GetReflection();
  for (const auto& [id, value] : nutrients) {
    refl->SetDouble(&msg, DoubleField(msg, NutrientCatalog::Key(id)), value);
  }
}

NutrientMap ReadNutrients(const Message& msg) {
  const auto* refl = msg.GetReflection();
  NutrientMap out;
  for (const auto& def : NutrientCatalog::All()) {
    const auto* field = DoubleField(msg, def.key);
    if (refl->HasField(msg, field)) out.Set(def.id, refl->GetDouble(msg, field));
  }
  return out;
}

void WriteFacts(const NutritionFacts& facts, Message& msg) {
  const auto* refl = msg.GetReflection();
  ForEachMacro(facts, [&](const char* name, const std::optional<double>& value) {
    if (value) refl->SetDouble(&msg, DoubleField(msg, name), *value);
  });
  WriteNutrients(facts.nutrients, msg);
}

NutritionFacts ReadFacts(const Message& msg) {
  const auto*    refl = msg.GetReflection();
  NutritionFacts facts;
  ForEachMacro(facts, [&](const char* name, std::optional<double>& value) {
    const auto* field = DoubleField(msg, name);
    if (refl->HasField(msg, field)) value = refl->GetDouble(msg, field);
  });
  facts.nutrients = ReadNutrients(msg);
  return facts;
}

// ------------------------------------------------------------------
// Decode validation
// ------------------------------------------------------------------

std::string RequireId(bool present, const std::string& raw, const char* entity) {
  if (!present || raw.empty()) throw util::MalformedBackup(std::string(entity) + " is missing its id");
  if (!util::IsValidUUID(raw)) throw util::MalformedBackup(std::string(entity) + " has invalid id '" + raw + "'");
  return util::CanonicalUUID(raw);
}

std::optional<std::string> OptionalRef(bool present, const std::string& raw, const char* what) {
  if (!present || raw.empty()) return std::nullopt;
  if (!util::IsValidUUID(raw)) throw util::MalformedBackup(std::string("invalid ") + what + " '" + raw + "'");
  return util::CanonicalUUID(raw);
}

std::string RequireString(bool present, const std::string& value, const char* what, const std::string& id) {
  if (!present) throw util::MalformedBackup(std::string(what) + " missing for " + id);
  return value;
}

util::TimePoint RequireTime(bool present, const google::protobuf::Timestamp& ts, const char* what, const std::string& id) {
  if (!present) throw util::MalformedBackup(std::string(what) + " missing for " + id);
  return util::FromProto(ts);
}

double RequireDouble(bool present, double value, const char* what, const std::string& id) {
  if (!present) throw util::MalformedBackup(std::string(what) + " missing for " + id);
  return value;
}

// ------------------------------------------------------------------
// Record <-> message
// ------------------------------------------------------------------

pb::ProductBackup ToMessage(const ProductRecord& r) {
  pb::ProductBackup m;
  m.set_id(r.id);
  m.set_name(r.name);
  if (r.barcode) m.set_barcode(*r.barcode);
  if (r.brand) m.set_brand(*r.brand);
  if (r.emoji) m.set_emoji(*r.emoji);
  m.set_serving_size(r.serving_size);
  m.set_serving_size_unit(r.serving_size_unit);
  if (r.portion_size) m.set_portion_size(*r.portion_size);
  if (r.portions_per_package) m.set_portions_per_package(*r.portions_per_package);
  WriteFacts(r.per_100g, m);
  if (r.image_data) m.set_image_data_base64(*r.image_data);
  if (r.main_image_data) m.set_main_image_data_base64(*r.main_image_data);
  if (r.notes) m.set_notes(*r.notes);
  m.set_is_custom(r.is_custom);
  *m.mutable_date_added() = ToWireTime(r.date_added);
  return m;
}

ProductRecord FromMessage(const pb::ProductBackup& m, util::TimePoint fallback_time) {
  ProductRecord r;
  r.id   = RequireId(m.has_id(), m.id(), "product");
  r.name = RequireString(m.has_name(), m.name(), "product name", r.id);
  if (m.has_barcode()) r.barcode = m.barcode();
  if (m.has_brand()) r.brand = m.brand();
  if (m.has_emoji()) r.emoji = m.emoji();
  if (m.has_serving_size()) r.serving_size = m.serving_size();
  if (m.has_serving_size_unit()) r.serving_size_unit = m.serving_size_unit();
  if (m.has_portion_size()) r.portion_size = m.portion_size();
  if (m.has_portions_per_package()) r.portions_per_package = m.portions_per_package();
  r.per_100g = ReadFacts(m);
  if (m.has_image_data_base64()) r.image_data = m.image_data_base64();
  if (m.has_main_image_data_base64()) r.main_image_data = m.main_image_data_base64();
  if (m.has_notes()) r.notes = m.notes();
  r.is_custom  = m.is_custom();
  r.date_added = m.has_date_added() ? util::FromProto(m.date_added()) : fallback_time;
  return r;
}

pb::DailyLogBackup ToMessage(const DailyLogRecord& r) {
  pb::DailyLogBackup m;
  m.set_id(r.id);
  *m.mutable_date() = ToWireTime(r.date);
  m.set_calorie_target(r.calorie_target);
  m.set_protein_target(r.protein_target);
  m.set_carb_target(r.carb_target);
  m.set_fat_target(r.fat_target);
  return m;
}

DailyLogRecord FromMessage(const pb::DailyLogBackup& m) {
  DailyLogRecord r;
  r.id   = RequireId(m.has_id(), m.id(), "daily log");
  r.date = RequireTime(m.has_date(), m.date(), "daily log date", r.id);
  if (m.has_calorie_target()) r.calorie_target = m.calorie_target();
  if (m.has_protein_target()) r.protein_target = m.protein_target();
  if (m.has_carb_target()) r.carb_target = m.carb_target();
  if (m.has_fat_target()) r.fat_target = m.fat_target();
  return r;
}

pb::FoodEntryBackup ToMessage(const FoodEntryRecord& r) {
  pb::FoodEntryBackup m;
  m.set_id(r.id);
  if (r.product_id) m.set_product_id(*r.product_id);
  if (r.daily_log_id) m.set_daily_log_id(*r.daily_log_id);
  if (r.product_name) m.set_product_name(*r.product_name);
  if (r.custom_food_name) m.set_custom_food_name(*r.custom_food_name);
  m.set_amount(r.amount);
  m.set_unit(r.unit);
  *m.mutable_timestamp() = ToWireTime(r.timestamp);
  WriteFacts(r.snapshot, m);
  m.set_ai_generated(r.ai_generated);
  if (r.ai_prompt) m.set_ai_prompt(*r.ai_prompt);
  return m;
}

FoodEntryRecord FromMessage(const pb::FoodEntryBackup& m) {
  FoodEntryRecord r;
  r.id           = RequireId(m.has_id(), m.id(), "food entry");
  r.product_id   = OptionalRef(m.has_product_id(), m.product_id(), "productId");
  r.daily_log_id = OptionalRef(m.has_daily_log_id(), m.daily_log_id(), "dailyLogId");
  if (m.has_product_name()) r.product_name = m.product_name();
  if (m.has_custom_food_name()) r.custom_food_name = m.custom_food_name();
  r.amount = RequireDouble(m.has_amount(), m.amount(), "food entry amount", r.id);
  if (m.has_unit()) r.unit = m.unit();
  r.timestamp    = RequireTime(m.has_timestamp(), m.timestamp(), "food entry timestamp", r.id);
  r.snapshot     = ReadFacts(m);
  r.ai_generated = m.ai_generated();
  if (m.has_ai_prompt()) r.ai_prompt = m.ai_prompt();
  return r;
}

pb::AiTemplateBackup ToMessage(const AiTemplateRecord& r) {
  pb::AiTemplateBackup m;
  m.set_id(r.id);
  m.set_name(r.name);
  m.set_amount(r.amount);
  m.set_unit(r.unit);
  m.set_weight_in_grams(r.weight_in_grams);
  WriteFacts(r.snapshot, m);
  if (r.ai_prompt) m.set_ai_prompt(*r.ai_prompt);
  *m.mutable_date_created() = ToWireTime(r.date_created);
  *m.mutable_last_used()    = ToWireTime(r.last_used);
  m.set_use_count(r.use_count);
  return m;
}

AiTemplateRecord FromMessage(const pb::AiTemplateBackup& m, util::TimePoint fallback_time) {
  AiTemplateRecord r;
  r.id              = RequireId(m.has_id(), m.id(), "AI template");
  r.name            = RequireString(m.has_name(), m.name(), "AI template name", r.id);
  r.amount          = RequireDouble(m.has_amount(), m.amount(), "AI template amount", r.id);
  r.weight_in_grams = RequireDouble(m.has_weight_in_grams(), m.weight_in_grams(), "AI template weightInGrams", r.id);
  if (m.has_unit()) r.unit = m.unit();
  r.snapshot = ReadFacts(m);
  if (m.has_ai_prompt()) r.ai_prompt = m.ai_prompt();
  r.date_created = m.has_date_created() ? util::FromProto(m.date_created()) : fallback_time;
  r.last_used    = m.has_last_used() ? util::FromProto(m.last_used()) : r.date_created;
  if (m.has_use_count()) r.use_count = m.use_count();
  return r;
}

pb::SupplementBackup ToMessage(const SupplementRecord& r) {
  pb::SupplementBackup m;
  m.set_id(r.id);
  m.set_name(r.name);
  if (r.brand) m.set_brand(*r.brand);
  m.set_dosage_form(r.dosage_form);
  m.set_serving_size(r.serving_size);
  m.set_serving_size_unit(r.serving_size_unit);
  WriteNutrients(r.nutrients, m);
  if (r.notes) m.set_notes(*r.notes);
  if (r.image_data) m.set_image_data_base64(*r.image_data);
  *m.mutable_date_added() = ToWireTime(r.date_added);
  return m;
}

SupplementRecord FromMessage(const pb::SupplementBackup& m, util::TimePoint fallback_time) {
  SupplementRecord r;
  r.id   = RequireId(m.has_id(), m.id(), "supplement");
  r.name = RequireString(m.has_name(), m.name(), "supplement name", r.id);
  if (m.has_brand()) r.brand = m.brand();
  if (m.has_dosage_form()) r.dosage_form = m.dosage_form();
  if (m.has_serving_size()) r.serving_size = m.serving_size();
  if (m.has_serving_size_unit()) r.serving_size_unit = m.serving_size_unit();
  r.nutrients = ReadNutrients(m);
  if (m.has_notes()) r.notes = m.notes();
  if (m.has_image_data_base64()) r.image_data = m.image_data_base64();
  r.date_added = m.has_date_added() ? util::FromProto(m.date_added()) : fallback_time;
  return r;
}

pb::SupplementEntryBackup ToMessage(const SupplementEntryRecord& r) {
  pb::SupplementEntryBackup m;
  m.set_id(r.id);
  if (r.supplement_id) m.set_supplement_id(*r.supplement_id);
  if (r.daily_log_id) m.set_daily_log_id(*r.daily_log_id);
  if (r.supplement_name) m.set_supplement_name(*r.supplement_name);
  m.set_amount(r.amount);
  m.set_unit(r.unit);
  *m.mutable_timestamp() = ToWireTime(r.timestamp);
  WriteNutrients(r.nutrients, m);
  return m;
}

SupplementEntryRecord FromMessage(const pb::SupplementEntryBackup& m) {
  SupplementEntryRecord r;
  r.id            = RequireId(m.has_id(), m.id(), "supplement entry");
  r.supplement_id = OptionalRef(m.has_supplement_id(), m.supplement_id(), "supplementId");
  r.daily_log_id  = OptionalRef(m.has_daily_log_id(), m.daily_log_id(), "dailyLogId");
  if (m.has_supplement_name()) r.supplement_name = m.supplement_name();
  if (m.has_amount()) r.amount = m.amount();
  if (m.has_unit()) r.unit = m.unit();
  r.timestamp = RequireTime(m.has_timestamp(), m.timestamp(), "supplement entry timestamp", r.id);
  r.nutrients = ReadNutrients(m);
  return r;
}

template <typename Record>
std::vector<const Record*> SortedById(const std::vector<Record>& records) {
  std::vector<const Record*> out;
  out.reserve(records.size());
  for (const auto& r : records) out.push_back(&r);
  std::sort(out.begin(), out.end(), [](const Record* a, const Record* b) { return a->id < b->id; });
  return out;
}

// The version is checked on a schema-less parse first so that documents
// from a newer schema report UnsupportedVersion instead of a type error.
int ReadVersion(const std::string& json) {
  google::protobuf::Struct                  root;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  const auto status = google::protobuf::util::JsonStringToMessage(json, &root, options);
  if (!status.ok()) {
    throw util::MalformedBackup("backup is not a JSON object: " + status.ToString());
  }

  const auto it = root.fields().find("version");
  if (it == root.fields().end()) throw util::MalformedBackup("backup has no version");
  if (it->second.kind_case() != google::protobuf::Value::kNumberValue) {
    throw util::MalformedBackup("backup version is not a number");
  }

  const double version = it->second.number_value();
  if (std::floor(version) != version || version < std::numeric_limits<int>::min() ||
      version > std::numeric_limits<int>::max()) {
    throw util::MalformedBackup("backup version is not an integer");
  }
  return static_cast<int>(version);
}

} // namespace

std::string BackupCodec::Encode(const EntityGraph& graph, util::TimePoint export_date) {
  pb::BackupDocument doc;
  doc.set_version(kSchemaVersion);
  *doc.mutable_export_date() = ToWireTime(export_date);

  for (const auto* r : SortedById(graph.products)) *doc.add_products() = ToMessage(*r);
  for (const auto* r : SortedById(graph.daily_logs)) *doc.add_daily_logs() = ToMessage(*r);
  for (const auto* r : SortedById(graph.food_entries)) *doc.add_food_entries() = ToMessage(*r);
  for (const auto* r : SortedById(graph.ai_templates)) *doc.add_ai_templates() = ToMessage(*r);
  for (const auto* r : SortedById(graph.supplements)) *doc.add_supplements() = ToMessage(*r);
  for (const auto* r : SortedById(graph.supplement_entries)) *doc.add_supplement_entries() = ToMessage(*r);

  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  // empty entity lists still print as []; unset optional scalars stay out
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names    = false;

  std::string json;
  const auto  status = google::protobuf::util::MessageToJsonString(doc, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("failed to encode backup: " + status.ToString());
  }
  return json;
}

DecodedGraph BackupCodec::Decode(std::string_view json_view) {
  const std::string json(json_view);

  const int version = ReadVersion(json);
  if (version != kSchemaVersion) {
    throw util::UnsupportedVersion("unsupported backup version " + std::to_string(version), version);
  }

  pb::BackupDocument                        doc;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  const auto status = google::protobuf::util::JsonStringToMessage(json, &doc, options);
  if (!status.ok()) {
    throw util::MalformedBackup("invalid backup document: " + status.ToString());
  }

  DecodedGraph decoded;
  decoded.version = version;
  if (doc.has_export_date()) decoded.export_date = util::FromProto(doc.export_date());
  const util::TimePoint fallback_time = decoded.export_date.value_or(util::TimePoint{});

  auto& g = decoded.graph;
  for (const auto& m : doc.products()) g.products.push_back(FromMessage(m, fallback_time));
  for (const auto& m : doc.daily_logs()) g.daily_logs.push_back(FromMessage(m));
  for (const auto& m : doc.food_entries()) g.food_entries.push_back(FromMessage(m));
  for (const auto& m : doc.ai_templates()) g.ai_templates.push_back(FromMessage(m, fallback_time));
  for (const auto& m : doc.supplements()) g.supplements.push_back(FromMessage(m, fallback_time));
  for (const auto& m : doc.supplement_entries()) g.supplement_entries.push_back(FromMessage(m));
  return decoded;
}

} // namespace nutrition::backup
