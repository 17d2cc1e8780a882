#include "selector.hpp"

#include <algorithm>
#include <cctype>
#include <tuple>

#include "internal/util/errors.hpp"

namespace orchestrator::labels {

namespace {

bool IsNameChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.' || c == '/';
}

std::string Trim(const std::string& s) {
  size_t begin = 0;
  size_t end   = s.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
  return s.substr(begin, end - begin);
}

[[noreturn]] void Malformed(const std::string& text, const std::string& why) {
  throw util::InvalidArgument("invalid selector \"" + text + "\": " + why);
}

void CheckKey(const std::string& text, const std::string& key) {
  if (key.empty()) Malformed(text, "empty key");
  if (!std::all_of(key.begin(), key.end(), IsNameChar)) Malformed(text, "bad key \"" + key + "\"");
}

void CheckValue(const std::string& text, const std::string& value) {
  if (!std::all_of(value.begin(), value.end(), IsNameChar)) Malformed(text, "bad value \"" + value + "\"");
}

// split on commas outside parentheses
std::vector<std::string> SplitTopLevel(const std::string& text) {
  std::vector<std::string> parts;
  std::string              current;
  int                      depth = 0;
  for (char c : text) {
    if (c == '(') ++depth;
    if (c == ')') --depth;
    if (depth < 0) Malformed(text, "unbalanced parentheses");
    if (c == ',' && depth == 0) {
      parts.push_back(current);
      current.clear();
      continue;
    }
    current.push_back(c);
  }
  if (depth != 0) Malformed(text, "unbalanced parentheses");
  parts.push_back(current);
  return parts;
}

std::vector<std::string> ParseSet(const std::string& text, const std::string& rest) {
  if (rest.size() < 2 || rest.front() != '(' || rest.back() != ')') Malformed(text, "expected (value, ...)");

  std::vector<std::string> values;
  std::string              inner = rest.substr(1, rest.size() - 2);
  size_t                   start = 0;
  while (true) {
    const auto comma = inner.find(',', start);
    auto       value = Trim(inner.substr(start, comma == std::string::npos ? std::string::npos : comma - start));
    if (value.empty()) Malformed(text, "empty value in set");
    CheckValue(text, value);
    values.push_back(std::move(value));
    if (comma == std::string::npos) break;
    start = comma + 1;
  }

  std::sort(values.begin(), values.end());
  values.erase(std::unique(values.begin(), values.end()), values.end());
  return values;
}

Requirement ParseRequirement(const std::string& text, const std::string& raw) {
  const auto  term = Trim(raw);
  Requirement req;

  if (term.empty()) Malformed(text, "empty requirement");

  if (term.front() == '!') {
    req.key = Trim(term.substr(1));
    req.op  = Operator::DoesNotExist;
    CheckKey(text, req.key);
    return req;
  }

  size_t pos = 0;
  while (pos < term.size() && IsNameChar(term[pos])) ++pos;
  req.key = term.substr(0, pos);
  CheckKey(text, req.key);

  auto rest = Trim(term.substr(pos));
  if (rest.empty()) {
    req.op = Operator::Exists;
    return req;
  }

  auto single_value = [&](size_t skip) {
    auto value = Trim(rest.substr(skip));
    CheckValue(text, value);
    req.values = {value};
  };

  if (rest.rfind("!=", 0) == 0) {
    req.op = Operator::NotEquals;
    single_value(2);
  } else if (rest.rfind("==", 0) == 0) {
    req.op = Operator::Equals;
    single_value(2);
  } else if (rest.front() == '=') {
    req.op = Operator::Equals;
    single_value(1);
  } else if (rest.rfind("notin", 0) == 0 && rest.size() > 5 && !IsNameChar(rest[5])) {
    req.op     = Operator::NotIn;
    req.values = ParseSet(text, Trim(rest.substr(5)));
  } else if (rest.rfind("in", 0) == 0 && rest.size() > 2 && !IsNameChar(rest[2])) {
    req.op     = Operator::In;
    req.values = ParseSet(text, Trim(rest.substr(2)));
  } else {
    Malformed(text, "unexpected \"" + rest + "\" after key " + req.key);
  }
  return req;
}

std::string JoinSet(const std::vector<std::string>& values) {
  std::string out = "(";
  for (size_t i = 0; i < values.size(); ++i) {
    if (i) out += ",";
    out += values[i];
  }
  return out + ")";
}

} // namespace

// ------------------------------------------------------------
// Requirement
// ------------------------------------------------------------

bool Requirement::Matches(const Labels& labels) const {
  const auto it  = labels.find(key);
  const bool has = it != labels.end();

  auto in_values = [&] { return has && std::binary_search(values.begin(), values.end(), it->second); };

  switch (op) {
    case Operator::Equals:
      return has && !values.empty() && it->second == values.front();
    case Operator::NotEquals:
      return !has || values.empty() || it->second != values.front();
    case Operator::In:
      return in_values();
    case Operator::NotIn:
      return !in_values();
    case Operator::Exists:
      return has;
    case Operator::DoesNotExist:
      return !has;
  }
  return false;
}

std::string Requirement::String() const {
  switch (op) {
    case Operator::Equals:
      return key + "=" + (values.empty() ? std::string{} : values.front());
    case Operator::NotEquals:
      return key + "!=" + (values.empty() ? std::string{} : values.front());
    case Operator::In:
      return key + " in " + JoinSet(values);
    case Operator::NotIn:
      return key + " notin " + JoinSet(values);
    case Operator::Exists:
      return key;
    case Operator::DoesNotExist:
      return "!" + key;
  }
  return key;
}

bool Requirement::operator<(const Requirement& other) const {
  return std::tie(key, op, values) < std::tie(other.key, other.op, other.values);
}

// ------------------------------------------------------------
// Selector
// ------------------------------------------------------------

Selector Selector::Parse(const std::string& text) {
  Selector selector;
  if (Trim(text).empty()) {
    return selector;
  }

  for (const auto& part : SplitTopLevel(text)) {
    selector.Add(ParseRequirement(text, part));
  }
  return selector;
}

Selector& Selector::Add(Requirement requirement) {
  if (requirement.op == Operator::In || requirement.op == Operator::NotIn) {
    std::sort(requirement.values.begin(), requirement.values.end());
    requirement.values.erase(std::unique(requirement.values.begin(), requirement.values.end()), requirement.values.end());
  }

  auto pos = std::lower_bound(requirements_.begin(), requirements_.end(), requirement);
  if (pos == requirements_.end() || !(*pos == requirement)) {
    requirements_.insert(pos, std::move(requirement));
  }
  return *this;
}

bool Selector::Matches(const Labels& labels) const {
  return std::all_of(requirements_.begin(), requirements_.end(), [&](const Requirement& r) { return r.Matches(labels); });
}

std::string Selector::String() const {
  std::string out;
  for (size_t i = 0; i < requirements_.size(); ++i) {
    if (i) out += ",";
    out += requirements_[i].String();
  }
  return out;
}

} // namespace orchestrator::labels
