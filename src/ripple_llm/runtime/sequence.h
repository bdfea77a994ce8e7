/* Copyright 2024 Tencent Inc.  All rights reserved.

==============================================================================*/
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "ripple_llm/cache_manager/block_table.h"
#include "ripple_llm/runtime/infer_stage.h"
#include "ripple_llm/runtime/request_status.h"
#include "ripple_llm/utils/status.h"

namespace ripple_llm {

// One in-flight generation request. Created by the caller in waiting status, all the state
// transitions after that are done by the request handler.
class Sequence {
 public:
  // The beams of one request share a group id, a negative group id means the sequence is its own group.
  Sequence(int64_t req_id, const std::vector<int>& input_tokens, int64_t group_id = -1);

  Sequence(const Sequence&) = delete;
  Sequence& operator=(const Sequence&) = delete;

  int64_t GetReqId() const { return req_id_; }

  int64_t GetGroupId() const { return group_id_; }

  size_t GetPromptLen() const { return input_tokens_.size(); }

  const std::vector<int>& GetInputTokens() const { return input_tokens_; }

  const std::vector<int>& GetOutputTokens() const { return output_tokens_; }

  size_t GetOutputLen() const { return output_tokens_.size(); }

  // The prompt and generated tokens, that is, the tokens which need kv cache.
  size_t GetTotalTokenNum() const { return input_tokens_.size() + output_tokens_.size(); }

  RequestStatus GetStatus() const { return status_; }

  InferStage GetInferStage() const { return infer_stage_; }

  const BlockTable& GetBlockTable() const { return block_table_; }

  float GetCumulativeLogprob() const { return cumulative_logprob_; }

  uint64_t GetArrivalTimeMs() const { return arrival_time_ms_; }

  // The reason of a finished or aborted sequence, OK for a normal finish.
  const Status& GetFinishStatus() const { return finish_status_; }

  // True if finished or aborted.
  bool CheckFinish() const { return status_ == REQUEST_STATUS_FINISHED || status_ == REQUEST_STATUS_ABORTED; }

  std::string ToString() const;

 private:
  friend class RequestHandler;

  void SetStatus(RequestStatus status) { status_ = status; }

  void SetInferStage(InferStage infer_stage) { infer_stage_ = infer_stage; }

  void SetFinishStatus(const Status& finish_status) { finish_status_ = finish_status; }

  BlockTable& GetMutableBlockTable() { return block_table_; }

  // Append a generated token and accumulate its log probability.
  void AppendToken(int token, float logprob);

  // Replace the generated history, used when a beam continues from another beam of its group.
  void ResetOutput(const std::vector<int>& output_tokens, float cumulative_logprob);

 private:
  int64_t req_id_;

  int64_t group_id_;

  std::vector<int> input_tokens_;

  std::vector<int> output_tokens_;

  RequestStatus status_ = REQUEST_STATUS_WAITING;

  InferStage infer_stage_ = STAGE_PREFILL;

  BlockTable block_table_;

  float cumulative_logprob_ = 0.0f;

  uint64_t arrival_time_ms_ = 0;

  Status finish_status_;
};

}  // namespace ripple_llm
