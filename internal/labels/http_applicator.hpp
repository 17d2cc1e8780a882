#pragma once

#include <chrono>
#include <map>
#include <string>

#include "internal/labels/applicator.hpp"

namespace orchestrator::labels {

struct HttpApplicatorOptions {
  std::string                        endpoint;
  std::map<std::string, std::string> headers;
  std::chrono::milliseconds          timeout{5000};
};

/*
  Read-only applicator over a node inventory service.

    GET <endpoint>?selector=<urlencoded>&type=<type>
    -> {"matches":[{"id":"...","labels":{...}}]}

  Mutations throw util::Unsupported. The service offers no change feed, so
  watches re-query once per slice.
*/
class HttpApplicator final : public Applicator {
 public:
  explicit HttpApplicator(HttpApplicatorOptions options);

  void   SetLabels(EntityType type, const std::string& id, const Labels& labels) override;
  Labels GetLabels(EntityType type, const std::string& id) override;
  void   RemoveLabels(EntityType type, const std::string& id, const std::vector<std::string>& keys) override;
  void   RemoveAllLabels(EntityType type, const std::string& id) override;

  std::vector<Labeled> GetMatches(const Selector& selector, EntityType type) override;

  // Parses a node inventory response body. Exposed for tests.
  static std::vector<Labeled> ParseMatches(const std::string& body, EntityType type);

 protected:
  uint64_t WaitForChange(EntityType type, uint64_t after, std::chrono::milliseconds timeout) override;

 private:
  std::string Fetch(const std::string& url) const;

  HttpApplicatorOptions options_;
};

} // namespace orchestrator::labels
