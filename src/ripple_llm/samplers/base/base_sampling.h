/* Copyright 2024 Tencent Inc.  All rights reserved.

==============================================================================*/
#pragma once

#include <cstdint>
#include <vector>

#include "ripple_llm/utils/environment.h"
#include "ripple_llm/utils/status.h"

namespace ripple_llm {

// The normalized distributions of one batch, both are [row_num, vocab_size] matrix.
struct SamplingInput {
  const float* probs = nullptr;
  const float* logprobs = nullptr;
  size_t row_num = 0;
  size_t vocab_size = 0;

  // The cumulative log probability of every row, used by beam search.
  std::vector<float> cumulative_logprobs;

  // The beam group of every row, consecutive rows with the same group id form one group.
  std::vector<int64_t> group_ids;

  // All rows are in prefill stage, that is, no token generated yet.
  bool is_prefill = false;
};

struct SamplingResult {
  // The selected token and its log probability of every row.
  std::vector<int> tokens;
  std::vector<float> logprobs;

  // The row whose history the selected token continues, always the row itself except for beam search.
  std::vector<size_t> parent_rows;
};

class BaseSampling {
 public:
  BaseSampling() {}
  virtual ~BaseSampling() {}

  Status Forward(const SamplingInput& input, const GenerationConfig& generation_config, SamplingResult& result);

 protected:
  virtual Status RunSampling(const SamplingInput& input, const GenerationConfig& generation_config,
                             SamplingResult& result) = 0;
};

}  // namespace ripple_llm
