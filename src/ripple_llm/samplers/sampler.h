/* Copyright 2024 Tencent Inc.  All rights reserved.

==============================================================================*/
#pragma once

#include <map>
#include <memory>
#include <vector>

#include "ripple_llm/runtime/sampling_request.h"
#include "ripple_llm/samplers/base/base_sampling.h"
#include "ripple_llm/samplers/logits_processor.h"
#include "ripple_llm/utils/environment.h"
#include "ripple_llm/utils/status.h"

namespace ripple_llm {

enum SamplingStrategy {
  SAMPLING_GREEDY,
  SAMPLING_MULTINOMIAL,
  SAMPLING_BEAM_SEARCH,
};

// Turn a batch of logits into the next tokens.
class Sampler {
 public:
  explicit Sampler(unsigned int seed = 0);

  // Register or replace the implementation of a strategy.
  void RegisterSampling(SamplingStrategy strategy, std::shared_ptr<BaseSampling> sampling);

  LogitsProcessorRegistry& GetLogitsProcessorRegistry() { return logits_processor_registry_; }

  // Beam search if num_beams > 1, otherwise multinomial if do_sample, otherwise greedy.
  static SamplingStrategy GetSamplingStrategy(const GenerationConfig& generation_config);

  // Sample one token for every row of the logits matrix.
  Status Sample(const SamplingRequest& sampling_request, SamplingResult& result);

 private:
  // Numerically stable softmax and log_softmax of every row.
  Status Normalize(const std::vector<float>& logits, size_t row_num, size_t vocab_size, std::vector<float>& probs,
                   std::vector<float>& logprobs);

 private:
  LogitsProcessorRegistry logits_processor_registry_;

  std::map<SamplingStrategy, std::shared_ptr<BaseSampling>> samplings_;
};

}  // namespace ripple_llm
