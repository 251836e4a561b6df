#pragma once

#include <remit/schema/primitives.hpp>

// Schema type: commit result.
// Settlement workflow: Commit output: records finalized height/state_root
// persistence metadata for the sequencer.
namespace remit::schema {

template <uint16_t Version>
struct commit_result;

template <>
struct commit_result<1> final {
  uint16_t version{1};
  int64_t retain_height{};
  int64_t committed_height{};
  hash32_t state_root{};
};

using commit_result_t = commit_result<1>;

}  // namespace remit::schema
