/* Copyright 2024 Tencent Inc.  All rights reserved.

==============================================================================*/

#include "ripple_llm/runtime/sequence.h"

#include "fmt/core.h"

#include "ripple_llm/utils/logger.h"

namespace ripple_llm {

Sequence::Sequence(int64_t req_id, const std::vector<int>& input_tokens, int64_t group_id)
    : req_id_(req_id),
      group_id_(group_id < 0 ? req_id : group_id),
      input_tokens_(input_tokens),
      arrival_time_ms_(GetCurrentTimeInMs()) {}

void Sequence::AppendToken(int token, float logprob) {
  output_tokens_.push_back(token);
  cumulative_logprob_ += logprob;
}

void Sequence::ResetOutput(const std::vector<int>& output_tokens, float cumulative_logprob) {
  output_tokens_ = output_tokens;
  cumulative_logprob_ = cumulative_logprob;
}

std::string Sequence::ToString() const {
  return fmt::format("Sequence(req_id={}, prompt_len={}, output_len={}, status={}, stage={}, blocks={})", req_id_,
                     input_tokens_.size(), output_tokens_.size(), GetRequestStatusName(status_),
                     GetInferStageName(infer_stage_), block_table_.GetBlockNumber());
}

}  // namespace ripple_llm
