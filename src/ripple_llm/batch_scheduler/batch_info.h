/* Copyright 2024 Tencent Inc.  All rights reserved.

==============================================================================*/
#pragma once

#include <memory>
#include <vector>

#include "ripple_llm/runtime/sequence.h"
#include "ripple_llm/utils/status.h"

namespace ripple_llm {

// The sequences of one forward step. It is only a view, the running list owns the membership.
class BatchInfo {
 public:
  explicit BatchInfo(bool is_prompts) : is_prompts_(is_prompts) {}

  // Replace all the sequences of this batch.
  void Init(const std::vector<std::shared_ptr<Sequence>>& seqs);

  // Add a sequence right after the other sequences of its group, or at the end if it is the first one.
  // Fail if it is already in this batch.
  Status AddSeq(const std::shared_ptr<Sequence>& seq);

  // Remove the sequence by id, return false if not in this batch.
  bool Remove(int64_t req_id);

  bool Contains(int64_t req_id) const;

  void Clear() { seqs_.clear(); }

  bool IsEmpty() const { return seqs_.empty(); }

  size_t Size() const { return seqs_.size(); }

  bool IsPrompts() const { return is_prompts_; }

  const std::vector<std::shared_ptr<Sequence>>& GetSequences() const { return seqs_; }

  std::vector<int64_t> GetReqIds() const;

 private:
  bool is_prompts_;

  std::vector<std::shared_ptr<Sequence>> seqs_;
};

}  // namespace ripple_llm
