/* Copyright 2024 Tencent Inc.  All rights reserved.

==============================================================================*/
#pragma once

#include <vector>

#include "ripple_llm/samplers/base/base_sampling.h"

namespace ripple_llm {

// Consecutive rows with the same group id form one beam group. Each row proposes its best tokens
// scored by cumulative_logprob + logprob, and the best ones of the group survive, one per row.
class BeamSearchSampling : public BaseSampling {
 private:
  Status RunSampling(const SamplingInput& input, const GenerationConfig& generation_config,
                     SamplingResult& result) override;

  struct Candidate {
    size_t row;
    int token;
    float logprob;
    float score;
  };

  // Collect the best candidates of the group [first_row, first_row + group_size), in descending score.
  std::vector<Candidate> CollectCandidates(const SamplingInput& input, size_t first_row, size_t group_size);

  // Put every candidate to a row of the group.
  void AssignCandidates(const std::vector<Candidate>& candidates, size_t first_row, size_t group_size,
                        bool is_prefill, SamplingResult& result);
};

}  // namespace ripple_llm
