/* Copyright 2024 Tencent Inc.  All rights reserved.

==============================================================================*/
#pragma once

#include <random>

#include "ripple_llm/samplers/base/base_sampling.h"

namespace ripple_llm {

// Draw one token from the distribution of every row.
class MultinomialSampling : public BaseSampling {
 public:
  explicit MultinomialSampling(unsigned int seed);

 private:
  Status RunSampling(const SamplingInput& input, const GenerationConfig& generation_config,
                     SamplingResult& result) override;

  std::mt19937 generator_;
};

}  // namespace ripple_llm
