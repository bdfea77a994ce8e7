/* Copyright 2024 Tencent Inc.  All rights reserved.

==============================================================================*/
#pragma once

#include "ripple_llm/samplers/base/base_sampling.h"

namespace ripple_llm {

// Pick the most likely token, the smallest token id wins a tie.
class GreedySampling : public BaseSampling {
 private:
  Status RunSampling(const SamplingInput& input, const GenerationConfig& generation_config,
                     SamplingResult& result) override;
};

}  // namespace ripple_llm
