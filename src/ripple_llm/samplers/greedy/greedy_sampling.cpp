/* Copyright 2024 Tencent Inc.  All rights reserved.

==============================================================================*/

#include "ripple_llm/samplers/greedy/greedy_sampling.h"

#include <algorithm>

namespace ripple_llm {

Status GreedySampling::RunSampling(const SamplingInput& input, const GenerationConfig& generation_config,
                                   SamplingResult& result) {
  for (size_t row = 0; row < input.row_num; ++row) {
    const float* probs = input.probs + row * input.vocab_size;
    size_t token = std::max_element(probs, probs + input.vocab_size) - probs;
    result.tokens[row] = static_cast<int>(token);
    result.logprobs[row] = input.logprobs[row * input.vocab_size + token];
  }
  return Status();
}

}  // namespace ripple_llm
