#pragma once

#include <string>

#include "orchestrator/v1/types.pb.h"

namespace orchestrator::kp {

/*
  Builds a PodManifest from a raw YAML document.

  Only the top-level `id` key is read; the rest of the document is carried
  verbatim. The digest is the lowercase hex SHA-256 of the raw bytes.
*/
orchestrator::v1::PodManifest ParseManifest(const std::string& raw_yaml);

orchestrator::v1::PodManifest LoadManifest(const std::string& path);

std::string Sha256Hex(const std::string& data);

} // namespace orchestrator::kp
