// src/extensions/resumer.hpp
#pragma once

#include <yaml-cpp/yaml.h>
#include "../core/model.hpp"
#include "../infra/error_handler/error.hpp"

namespace bxfer::extensions {

// YAML form of a job as kept in the resume registry:
//
//   direction: download
//   source: /data/*/x.csv
//   destination: /home/me/out
//   threads: 4
//   chunk_size: 268435456
//   buffer_size: 4194304
//   job_id: 5f0c...
//   temp_dir: /tmp
//   files:
//     - remote: /data/a/x.csv
//       local: /home/me/out/a/x.csv
//       size: 6
//       state: collecting
//       chunks: [[0, 6, waiting, 0]]    # offset, length, state, retries
[[nodiscard]] auto encode_job(const core::JobState& state) -> YAML::Node;

// Rebuilds the chunk table and checks that each file's chunks still
// partition it; the fingerprint is recomputed, not trusted.
[[nodiscard]] auto decode_job(const YAML::Node& node) -> infra::Result<core::JobState>;

} // namespace bxfer::extensions
