#pragma once

#include <map>
#include <string>
#include <vector>

namespace orchestrator::labels {

using Labels = std::map<std::string, std::string>;

enum class Operator { Equals, NotEquals, In, NotIn, Exists, DoesNotExist };

struct Requirement {
  std::string              key;
  Operator                 op = Operator::Exists;
  std::vector<std::string> values; // sorted, unique

  bool Matches(const Labels& labels) const;
  std::string String() const;

  bool operator==(const Requirement&) const = default;
  bool operator<(const Requirement& other) const;
};

/*
  Conjunction of label requirements.

  Grammar (comma separated):

    key=value   key==value   key!=value
    key in (a,b)             key notin (a,b)
    key                      !key

  The empty selector matches every label set. A missing key satisfies != and
  notin.
*/
class Selector {
 public:
  Selector() = default;

  // Throws util::InvalidArgument on malformed input.
  static Selector Parse(const std::string& text);

  static Selector Everything() {
    return {};
  }

  Selector& Add(Requirement requirement);

  bool Matches(const Labels& labels) const;

  bool Empty() const {
    return requirements_.empty();
  }

  const std::vector<Requirement>& Requirements() const {
    return requirements_;
  }

  // Canonical form; Parse(String()) == *this.
  std::string String() const;

  bool operator==(const Selector&) const = default;

 private:
  std::vector<Requirement> requirements_; // sorted
};

} // namespace orchestrator::labels
