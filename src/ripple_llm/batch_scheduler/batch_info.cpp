/* Copyright 2024 Tencent Inc.  All rights reserved.

==============================================================================*/

#include "ripple_llm/batch_scheduler/batch_info.h"

#include <algorithm>

#include "fmt/core.h"

#include "ripple_llm/utils/ret_code.h"

namespace ripple_llm {

void BatchInfo::Init(const std::vector<std::shared_ptr<Sequence>>& seqs) { seqs_ = seqs; }

Status BatchInfo::AddSeq(const std::shared_ptr<Sequence>& seq) {
  if (Contains(seq->GetReqId())) {
    return Status(RET_INVARIANT_VIOLATION, fmt::format("Req {} is already in the batch.", seq->GetReqId()));
  }

  // Keep the beams of one group in adjacent rows, behind the last member already here.
  auto it = std::find_if(seqs_.rbegin(), seqs_.rend(), [&seq](const std::shared_ptr<Sequence>& other) {
    return other->GetGroupId() == seq->GetGroupId();
  });
  if (it == seqs_.rend()) {
    seqs_.push_back(seq);
  } else {
    seqs_.insert(it.base(), seq);
  }
  return Status();
}

bool BatchInfo::Remove(int64_t req_id) {
  auto it = std::find_if(seqs_.begin(), seqs_.end(),
                         [req_id](const std::shared_ptr<Sequence>& seq) { return seq->GetReqId() == req_id; });
  if (it == seqs_.end()) {
    return false;
  }

  seqs_.erase(it);
  return true;
}

bool BatchInfo::Contains(int64_t req_id) const {
  return std::any_of(seqs_.begin(), seqs_.end(),
                     [req_id](const std::shared_ptr<Sequence>& seq) { return seq->GetReqId() == req_id; });
}

std::vector<int64_t> BatchInfo::GetReqIds() const {
  std::vector<int64_t> req_ids;
  req_ids.reserve(seqs_.size());
  for (const auto& seq : seqs_) {
    req_ids.push_back(seq->GetReqId());
  }
  return req_ids;
}

}  // namespace ripple_llm
