/* Copyright 2024 Tencent Inc.  All rights reserved.

==============================================================================*/
#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "ripple_llm/utils/environment.h"

namespace ripple_llm {

// The information used for sampling one batch.
struct SamplingRequest {
  // The [row_num, vocab_size] logits.
  const std::vector<float>* logits = nullptr;
  size_t row_num = 0;
  size_t vocab_size = 0;

  // The generation config.
  const GenerationConfig* generation_config = nullptr;

  // The cumulative log probability and beam group of every row.
  std::vector<float> cumulative_logprobs;
  std::vector<int64_t> group_ids;

  // True if the batch is a prefill batch.
  bool is_prefill = false;
};

}  // namespace ripple_llm
