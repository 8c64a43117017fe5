#include "cataphract/util/audit_export.h"

#include <cstdint>
#include <string>
#include <vector>

#include "cataphract/util/strings.h"

namespace cataphract {
namespace {

std::string modifiers_text(const AuditEntry& e) {
  std::vector<std::string> parts;
  for (const auto& [name, v] : e.modifiers) parts.push_back(name + ":" + (v >= 0 ? "+" : "") + std::to_string(v));
  return join_strings(parts, ";");
}

std::string faces_text(const AuditEntry& e) {
  std::vector<std::string> parts;
  for (int f : e.faces) parts.push_back(std::to_string(f));
  return join_strings(parts, ";");
}

double num(std::uint64_t v) { return static_cast<double>(v); }

} // namespace

json::Value audit_entry_to_json(const AuditEntry& e) {
  json::Object obj;
  obj["seq"] = num(e.seq);
  obj["day"] = static_cast<double>(e.tick.day);
  obj["part"] = std::string(day_part_label(e.tick.part));
  obj["tick"] = e.tick.to_string();
  obj["subsystem"] = e.subsystem;
  obj["context"] = e.context;
  obj["order_id"] = num(e.order_id);
  obj["subject_id"] = num(e.subject_id);
  // Seeds are full 64-bit; a double would lose precision.
  obj["seed"] = std::to_string(e.seed);
  obj["dice"] = e.dice_notation();

  json::Array mods;
  for (const auto& [name, v] : e.modifiers) {
    json::Object m;
    m["name"] = name;
    m["value"] = static_cast<double>(v);
    mods.emplace_back(std::move(m));
  }
  obj["modifiers"] = std::move(mods);

  if (e.fixed_override) {
    obj["fixed_override"] = static_cast<double>(*e.fixed_override);
  } else {
    obj["fixed_override"] = nullptr;
  }

  json::Array faces;
  for (int f : e.faces) faces.emplace_back(static_cast<double>(f));
  obj["faces"] = std::move(faces);
  obj["raw"] = static_cast<double>(e.raw);
  obj["total"] = static_cast<double>(e.total);
  obj["effect"] = e.effect;
  return json::Value(std::move(obj));
}

std::string audit_to_csv(const std::vector<AuditEntry>& entries) {
  std::string csv;
  csv += "seq,day,part,subsystem,context,order_id,subject_id,seed,dice,modifiers,fixed_override,faces,raw,total,"
         "effect\n";
  csv.reserve(csv.size() + entries.size() * 96);

  for (const auto& e : entries) {
    csv += std::to_string(static_cast<unsigned long long>(e.seq));
    csv += ",";
    csv += std::to_string(e.tick.day);
    csv += ",";
    csv += day_part_label(e.tick.part);
    csv += ",";
    csv += csv_escape(e.subsystem);
    csv += ",";
    csv += csv_escape(e.context);
    csv += ",";
    csv += std::to_string(static_cast<unsigned long long>(e.order_id));
    csv += ",";
    csv += std::to_string(static_cast<unsigned long long>(e.subject_id));
    csv += ",";
    csv += std::to_string(static_cast<unsigned long long>(e.seed));
    csv += ",";
    csv += e.dice_notation();
    csv += ",";
    csv += csv_escape(modifiers_text(e));
    csv += ",";
    if (e.fixed_override) csv += std::to_string(*e.fixed_override);
    csv += ",";
    csv += faces_text(e);
    csv += ",";
    csv += std::to_string(e.raw);
    csv += ",";
    csv += std::to_string(e.total);
    csv += ",";
    csv += csv_escape(e.effect);
    csv += "\n";
  }
  return csv;
}

std::string audit_to_json(const std::vector<AuditEntry>& entries) {
  json::Array out;
  out.reserve(entries.size());
  for (const auto& e : entries) out.push_back(audit_entry_to_json(e));

  std::string text = json::stringify(json::Value(std::move(out)), 2);
  text += "\n";
  return text;
}

std::string audit_to_jsonl(const std::vector<AuditEntry>& entries) {
  std::string out;
  out.reserve(entries.size() * 160);
  for (const auto& e : entries) {
    out += json::stringify(audit_entry_to_json(e), 0);
    out.push_back('\n');
  }
  if (out.empty()) out.push_back('\n');
  return out;
}

} // namespace cataphract
