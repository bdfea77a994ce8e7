/* Copyright 2024 Tencent Inc.  All rights reserved.

==============================================================================*/

#include "ripple_llm/samplers/sampler.h"

#include <algorithm>
#include <cmath>

#include "fmt/core.h"

#include "ripple_llm/samplers/beam_search/beam_search_sampling.h"
#include "ripple_llm/samplers/greedy/greedy_sampling.h"
#include "ripple_llm/samplers/multinomial/multinomial_sampling.h"
#include "ripple_llm/utils/logger.h"
#include "ripple_llm/utils/ret_code.h"

namespace ripple_llm {

Sampler::Sampler(unsigned int seed) {
  samplings_[SAMPLING_GREEDY] = std::make_shared<GreedySampling>();
  samplings_[SAMPLING_MULTINOMIAL] = std::make_shared<MultinomialSampling>(seed);
  samplings_[SAMPLING_BEAM_SEARCH] = std::make_shared<BeamSearchSampling>();
}

void Sampler::RegisterSampling(SamplingStrategy strategy, std::shared_ptr<BaseSampling> sampling) {
  samplings_[strategy] = sampling;
}

SamplingStrategy Sampler::GetSamplingStrategy(const GenerationConfig& generation_config) {
  if (generation_config.num_beams > 1) {
    return SAMPLING_BEAM_SEARCH;
  }
  return generation_config.do_sample ? SAMPLING_MULTINOMIAL : SAMPLING_GREEDY;
}

Status Sampler::Normalize(const std::vector<float>& logits, size_t row_num, size_t vocab_size,
                          std::vector<float>& probs, std::vector<float>& logprobs) {
  probs.resize(row_num * vocab_size);
  logprobs.resize(row_num * vocab_size);
  for (size_t row = 0; row < row_num; ++row) {
    const float* row_logits = logits.data() + row * vocab_size;
    float max_val = *std::max_element(row_logits, row_logits + vocab_size);
    if (std::isinf(max_val) || std::isnan(max_val)) {
      return Status(RET_INVALID_ARGUMENT, fmt::format("Logits of row {} have no finite max value.", row));
    }

    float sum = 0.0f;
    for (size_t i = 0; i < vocab_size; ++i) {
      sum += std::exp(row_logits[i] - max_val);
    }

    float log_sum = std::log(sum);
    for (size_t i = 0; i < vocab_size; ++i) {
      logprobs[row * vocab_size + i] = row_logits[i] - max_val - log_sum;
      probs[row * vocab_size + i] = std::exp(logprobs[row * vocab_size + i]);
    }
  }
  return Status();
}

Status Sampler::Sample(const SamplingRequest& sampling_request, SamplingResult& result) {
  size_t row_num = sampling_request.row_num;
  size_t vocab_size = sampling_request.vocab_size;
  if (sampling_request.logits == nullptr || sampling_request.generation_config == nullptr) {
    return Status(RET_INVALID_ARGUMENT, "Sampling request has no logits or generation config.");
  }

  const std::vector<float>& logits = *sampling_request.logits;
  const GenerationConfig& generation_config = *sampling_request.generation_config;
  if (row_num == 0 || vocab_size == 0 || logits.size() != row_num * vocab_size) {
    return Status(RET_INVALID_ARGUMENT, fmt::format("Logits size {} not match {} rows with vocab size {}.",
                                                    logits.size(), row_num, vocab_size));
  }

  std::vector<float> filtered_logits = logits;
  STATUS_CHECK_RETURN(
      logits_processor_registry_.Process(filtered_logits.data(), row_num, vocab_size, generation_config));

  std::vector<float> probs;
  std::vector<float> logprobs;
  STATUS_CHECK_RETURN(Normalize(filtered_logits, row_num, vocab_size, probs, logprobs));

  SamplingInput input;
  input.probs = probs.data();
  input.logprobs = logprobs.data();
  input.row_num = row_num;
  input.vocab_size = vocab_size;
  input.cumulative_logprobs = sampling_request.cumulative_logprobs;
  input.group_ids = sampling_request.group_ids;
  input.is_prefill = sampling_request.is_prefill;

  SamplingStrategy strategy = GetSamplingStrategy(generation_config);
  auto it = samplings_.find(strategy);
  if (it == samplings_.end() || it->second == nullptr) {
    return Status(RET_INVALID_ARGUMENT,
                  fmt::format("No sampling registered for strategy {}.", static_cast<int>(strategy)));
  }

  return it->second->Forward(input, generation_config, result);
}

}  // namespace ripple_llm
