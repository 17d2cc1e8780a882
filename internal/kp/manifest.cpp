#include "manifest.hpp"

#include <openssl/evp.h>
#include <yaml-cpp/yaml.h>

#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace orchestrator::kp {

std::string Sha256Hex(const std::string& data) {
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int  digest_len = 0;
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 || EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
    throw std::runtime_error("sha256 digest failed");
  }

  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out;
  out.reserve(digest_len * 2);
  for (unsigned int i = 0; i < digest_len; ++i) {
    out.push_back(kHex[digest[i] >> 4]);
    out.push_back(kHex[digest[i] & 0x0F]);
  }
  return out;
}

orchestrator::v1::PodManifest ParseManifest(const std::string& raw_yaml) {
  YAML::Node doc;
  try {
    doc = YAML::Load(raw_yaml);
  } catch (const YAML::Exception& e) {
    throw util::InvalidArgument("manifest is not valid YAML: " + std::string(e.what()));
  }

  if (!doc.IsMap() || !doc["id"] || !doc["id"].IsScalar() || doc["id"].Scalar().empty()) {
    throw util::InvalidArgument("manifest has no top-level id");
  }

  orchestrator::v1::PodManifest manifest;
  manifest.set_id(doc["id"].Scalar());
  manifest.set_raw_yaml(raw_yaml);
  manifest.set_sha256(Sha256Hex(raw_yaml));
  return manifest;
}

orchestrator::v1::PodManifest LoadManifest(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw util::InvalidArgument("cannot open manifest " + path);
  }

  std::ostringstream buffer;
  buffer << in.rdbuf();
  return ParseManifest(buffer.str());
}

} // namespace orchestrator::kp
