/* Copyright 2024 Tencent Inc.  All rights reserved.

==============================================================================*/
#pragma once

#include <memory>
#include <vector>

#include "ripple_llm/runtime/sequence.h"
#include "ripple_llm/utils/status.h"

namespace ripple_llm {

// The admitted sequences, split into the ones waiting for their first step and the decoding ones.
class RunningList {
 public:
  explicit RunningList(float ratio) : ratio_(ratio) {}

  // New sequences always enter the prefill part.
  Status Append(const std::shared_ptr<Sequence>& seq);

  // Search decoding first, then prefill. Return nullptr if not found.
  std::shared_ptr<Sequence> Find(int64_t req_id) const;

  Status Remove(int64_t req_id);

  // Move a prefill sequence to the tail of decoding.
  Status MoveToDecoding(int64_t req_id);

  // Whether the prefill part is large enough to interrupt decoding.
  bool ReadyForPrefill() const;

  bool IsEmpty() const { return prefill_.empty() && decoding_.empty(); }

  const std::vector<std::shared_ptr<Sequence>>& GetPrefill() const { return prefill_; }

  const std::vector<std::shared_ptr<Sequence>>& GetDecoding() const { return decoding_; }

  float GetRatio() const { return ratio_; }

 private:
  float ratio_;

  std::vector<std::shared_ptr<Sequence>> prefill_;
  std::vector<std::shared_ptr<Sequence>> decoding_;
};

}  // namespace ripple_llm
