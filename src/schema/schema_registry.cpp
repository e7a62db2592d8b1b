#include "fec_scanner/schema_registry.hpp"

#include <cctype>
#include <charconv>
#include <stdexcept>
#include <unordered_set>

namespace fec {

static bool ieq(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i)
    if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
  return true;
}

std::optional<FilingVersion> FilingVersion::parse(std::string_view s) {
  while (!s.empty() && std::isspace((unsigned char)s.front())) s.remove_prefix(1);
  while (!s.empty() && std::isspace((unsigned char)s.back()))  s.remove_suffix(1);
  if (!s.empty() && (s.front() == 'v' || s.front() == 'V')) s.remove_prefix(1);
  if (s.empty()) return std::nullopt;

  FilingVersion v;
  const char* b = s.data();
  const char* e = b + s.size();
  auto [p, ec] = std::from_chars(b, e, v.major);
  if (ec != std::errc() || p == b || v.major < 0) return std::nullopt;
  if (p == e) return v;
  if (*p != '.') return std::nullopt;
  ++p;
  if (p == e) return v; // "8." reads as 8.0
  auto [q, ec2] = std::from_chars(p, e, v.minor);
  if (ec2 != std::errc() || q != e || v.minor < 0) return std::nullopt;
  return v;
}

std::string FilingVersion::str() const {
  return std::to_string(major) + "." + std::to_string(minor);
}

const char* column_kind_name(ColumnKind k) noexcept {
  switch (k) {
    case ColumnKind::Text:       return "text";
    case ColumnKind::Integer:    return "integer";
    case ColumnKind::Decimal:    return "decimal";
    case ColumnKind::Date:       return "date";
    case ColumnKind::Boolean:    return "boolean";
    case ColumnKind::Enumerated: return "enumerated";
  }
  return "text";
}

std::optional<ColumnKind> parse_column_kind(std::string_view s) {
  static constexpr ColumnKind all[] = {ColumnKind::Text, ColumnKind::Integer, ColumnKind::Decimal,
                                       ColumnKind::Date, ColumnKind::Boolean, ColumnKind::Enumerated};
  for (auto k : all) if (ieq(s, column_kind_name(k))) return k;
  if (ieq(s, "string")) return ColumnKind::Text;
  if (ieq(s, "float") || ieq(s, "amount")) return ColumnKind::Decimal;
  if (ieq(s, "bool")) return ColumnKind::Boolean;
  if (ieq(s, "enum")) return ColumnKind::Enumerated;
  return std::nullopt;
}

const char* code_rule_name(CodeRule r) noexcept {
  switch (r) {
    case CodeRule::Amendment:  return "amendment";
    case CodeRule::LineNumber: return "line_number";
  }
  return "amendment";
}

std::optional<CodeRule> parse_code_rule(std::string_view s) {
  if (ieq(s, "amendment")) return CodeRule::Amendment;
  if (ieq(s, "line_number") || ieq(s, "line-number") || ieq(s, "schedule")) return CodeRule::LineNumber;
  return std::nullopt;
}

std::optional<std::size_t> Schema::index_of(std::string_view column) const {
  for (const auto& c : columns) if (c.name == column) return c.position;
  return std::nullopt;
}

const Schema& SchemaRegistry::add(FilingVersion version, std::string form_type,
                                  std::vector<ColumnSpec> columns, CodeRule codes) {
  if (frozen_) throw std::logic_error("schema registry is frozen");
  if (form_type.empty()) throw std::invalid_argument("empty form type");
  if (columns.empty()) throw std::invalid_argument("no columns for " + form_type);
  for (auto& ch : form_type) ch = static_cast<char>(std::toupper((unsigned char)ch));

  std::unordered_set<std::string> seen;
  for (std::size_t i = 0; i < columns.size(); ++i) {
    if (columns[i].name.empty())
      throw std::invalid_argument(form_type + " " + version.str() + ": unnamed column " + std::to_string(i));
    if (!seen.insert(columns[i].name).second)
      throw std::invalid_argument(form_type + " " + version.str() + ": duplicate column " + columns[i].name);
    columns[i].position = i;
  }

  auto [fam, fresh] = by_form_.try_emplace(form_type);
  if (fresh) fam->second.codes = codes;
  else if (fam->second.codes != codes)
    throw std::invalid_argument(form_type + " " + version.str() + ": code rule " + code_rule_name(codes) +
                                " differs from " + code_rule_name(fam->second.codes));
  auto& versions = fam->second.versions;
  if (versions.count(version))
    throw std::invalid_argument(form_type + " " + version.str() + " already registered");

  Schema s;
  s.version = version;
  s.form_type = form_type;
  s.columns = std::move(columns);
  auto it = versions.emplace(version, std::move(s)).first;
  ++count_;
  return it->second;
}

const Schema* SchemaRegistry::resolve(FilingVersion version, std::string_view form_type) const {
  auto f = by_form_.find(form_type);
  if (f == by_form_.end()) return nullptr;
  const auto& versions = f->second.versions;
  // first entry strictly above `version`; the one before it is the match
  auto it = versions.upper_bound(version);
  if (it == versions.begin()) return nullptr;
  --it;
  return &it->second;
}

std::optional<std::string_view> SchemaRegistry::family_of(std::string_view code) const {
  if (code.empty()) return std::nullopt;
  auto it = by_form_.find(code);
  if (it != by_form_.end()) return std::string_view(it->first);

  // amendment suffix: F3XN, F3A, F3T
  const char last = code.back();
  if (last == 'N' || last == 'A' || last == 'T') {
    it = by_form_.find(code.substr(0, code.size() - 1));
    if (it != by_form_.end() && it->second.codes == CodeRule::Amendment)
      return std::string_view(it->first);
  }

  // schedule line number: SA11AI, SB23
  for (std::size_t len = code.size() - 1; len > 0; --len) {
    if (!std::isdigit((unsigned char)code[len])) continue;
    it = by_form_.find(code.substr(0, len));
    if (it != by_form_.end() && it->second.codes == CodeRule::LineNumber)
      return std::string_view(it->first);
  }
  return std::nullopt;
}

std::optional<CodeRule> SchemaRegistry::code_rule(std::string_view form_type) const {
  auto f = by_form_.find(form_type);
  if (f == by_form_.end()) return std::nullopt;
  return f->second.codes;
}

std::vector<FilingVersion> SchemaRegistry::versions_for(std::string_view form_type) const {
  std::vector<FilingVersion> out;
  auto f = by_form_.find(form_type);
  if (f == by_form_.end()) return out;
  out.reserve(f->second.versions.size());
  for (const auto& kv : f->second.versions) out.push_back(kv.first);
  return out;
}

bool SchemaRegistry::covers(FilingVersion version) const {
  for (const auto& kv : by_form_) {
    const auto& versions = kv.second.versions;
    if (!versions.empty() && versions.begin()->first <= version) return true;
  }
  return false;
}

}
