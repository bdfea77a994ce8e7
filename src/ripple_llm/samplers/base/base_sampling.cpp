/* Copyright 2024 Tencent Inc.  All rights reserved.

==============================================================================*/

#include "ripple_llm/samplers/base/base_sampling.h"

#include <numeric>

#include "ripple_llm/utils/ret_code.h"

namespace ripple_llm {

Status BaseSampling::Forward(const SamplingInput& input, const GenerationConfig& generation_config,
                             SamplingResult& result) {
  if (input.probs == nullptr || input.logprobs == nullptr || input.row_num == 0 || input.vocab_size == 0) {
    return Status(RET_INVALID_ARGUMENT, "Sampling input is empty.");
  }

  result.tokens.assign(input.row_num, 0);
  result.logprobs.assign(input.row_num, 0.0f);
  result.parent_rows.resize(input.row_num);
  std::iota(result.parent_rows.begin(), result.parent_rows.end(), 0);

  return RunSampling(input, generation_config, result);
}

}  // namespace ripple_llm
