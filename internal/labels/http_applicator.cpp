#include "http_applicator.hpp"

#include <curl/curl.h>
#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <memory>
#include <thread>

#include "internal/util/errors.hpp"
#include "orchestrator/v1/types.pb.h"

namespace orchestrator::labels {

namespace {

size_t AppendBody(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* out = static_cast<std::string*>(userdata);
  out->append(ptr, size * nmemb);
  return size * nmemb;
}

std::string UrlEncode(CURL* curl, const std::string& value) {
  char* escaped = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.size()));
  if (!escaped) {
    throw std::runtime_error("curl_easy_escape failed");
  }
  std::string out(escaped);
  curl_free(escaped);
  return out;
}

[[noreturn]] void ReadOnly(const char* op) {
  throw util::Unsupported(std::string(op) + " is not supported by the node inventory applicator");
}

} // namespace

HttpApplicator::HttpApplicator(HttpApplicatorOptions options) : options_(std::move(options)) {
  if (options_.endpoint.empty()) {
    throw util::InvalidArgument("node inventory endpoint is empty");
  }
}

void HttpApplicator::SetLabels(EntityType, const std::string&, const Labels&) {
  ReadOnly("SetLabels");
}

void HttpApplicator::RemoveLabels(EntityType, const std::string&, const std::vector<std::string>&) {
  ReadOnly("RemoveLabels");
}

void HttpApplicator::RemoveAllLabels(EntityType, const std::string&) {
  ReadOnly("RemoveAllLabels");
}

Labels HttpApplicator::GetLabels(EntityType type, const std::string& id) {
  for (auto& match : GetMatches(Selector::Everything(), type)) {
    if (match.id == id) return std::move(match.labels);
  }
  return {};
}

std::string HttpApplicator::Fetch(const std::string& url) const {
  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
  if (!curl) {
    throw util::SchedulingError("curl init failed");
  }

  struct curl_slist* headers = nullptr;
  for (const auto& [name, value] : options_.headers) {
    const auto line = name + ": " + value;
    headers         = curl_slist_append(headers, line.c_str());
  }
  headers = curl_slist_append(headers, "Accept: application/json");
  std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> header_guard(headers, &curl_slist_free_all);

  std::string body;
  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers);
  curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(options_.timeout.count()));
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &AppendBody);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);

  const CURLcode res    = curl_easy_perform(curl.get());
  long           status = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);

  if (res != CURLE_OK) {
    throw util::SchedulingError("node inventory request failed: " + std::string(curl_easy_strerror(res)));
  }
  if (status < 200 || status >= 300) {
    throw util::SchedulingError("node inventory returned HTTP " + std::to_string(status));
  }
  return body;
}

std::vector<Labeled> HttpApplicator::GetMatches(const Selector& selector, EntityType type) {
  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> escaper(curl_easy_init(), &curl_easy_cleanup);
  if (!escaper) {
    throw util::SchedulingError("curl init failed");
  }

  const auto separator = options_.endpoint.find('?') == std::string::npos ? "?" : "&";
  const auto url       = options_.endpoint + separator + "selector=" + UrlEncode(escaper.get(), selector.String()) + "&type=" + EntityTypeName(type);

  auto matches = ParseMatches(Fetch(url), type);

  // the endpoint is trusted to filter, but not to sort
  std::erase_if(matches, [&](const Labeled& l) { return !selector.Matches(l.labels); });
  std::sort(matches.begin(), matches.end(), [](const Labeled& a, const Labeled& b) { return a.id < b.id; });
  return matches;
}

std::vector<Labeled> HttpApplicator::ParseMatches(const std::string& body, EntityType type) {
  orchestrator::v1::LabelMatches response;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(body, &response, options);
  if (!status.ok()) {
    throw util::SchedulingError("malformed node inventory response: " + std::string(status.message()));
  }

  std::vector<Labeled> matches;
  matches.reserve(response.matches_size());
  for (const auto& entity : response.matches()) {
    if (entity.id().empty()) continue;
    matches.push_back({type, entity.id(), Labels(entity.labels().begin(), entity.labels().end())});
  }
  return matches;
}

uint64_t HttpApplicator::WaitForChange(EntityType, uint64_t after, std::chrono::milliseconds timeout) {
  std::this_thread::sleep_for(timeout);
  return after + 1;
}

} // namespace orchestrator::labels
