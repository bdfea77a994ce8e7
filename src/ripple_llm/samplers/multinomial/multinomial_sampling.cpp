/* Copyright 2024 Tencent Inc.  All rights reserved.

==============================================================================*/

#include "ripple_llm/samplers/multinomial/multinomial_sampling.h"

namespace ripple_llm {

MultinomialSampling::MultinomialSampling(unsigned int seed) : generator_(seed) {}

Status MultinomialSampling::RunSampling(const SamplingInput& input, const GenerationConfig& generation_config,
                                        SamplingResult& result) {
  for (size_t row = 0; row < input.row_num; ++row) {
    const float* probs = input.probs + row * input.vocab_size;
    std::discrete_distribution<int> distribution(probs, probs + input.vocab_size);
    int token = distribution(generator_);
    result.tokens[row] = token;
    result.logprobs[row] = input.logprobs[row * input.vocab_size + token];
  }
  return Status();
}

}  // namespace ripple_llm
