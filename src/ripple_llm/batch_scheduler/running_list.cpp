/* Copyright 2024 Tencent Inc.  All rights reserved.

==============================================================================*/

#include "ripple_llm/batch_scheduler/running_list.h"

#include <algorithm>

#include "fmt/core.h"

#include "ripple_llm/utils/ret_code.h"

namespace ripple_llm {

namespace {

std::vector<std::shared_ptr<Sequence>>::iterator FindById(std::vector<std::shared_ptr<Sequence>>& seqs,
                                                          int64_t req_id) {
  return std::find_if(seqs.begin(), seqs.end(),
                      [req_id](const std::shared_ptr<Sequence>& seq) { return seq->GetReqId() == req_id; });
}

}  // namespace

Status RunningList::Append(const std::shared_ptr<Sequence>& seq) {
  if (Find(seq->GetReqId()) != nullptr) {
    return Status(RET_INVARIANT_VIOLATION, fmt::format("Req {} is already running.", seq->GetReqId()));
  }

  prefill_.push_back(seq);
  return Status();
}

std::shared_ptr<Sequence> RunningList::Find(int64_t req_id) const {
  for (const auto* seqs : {&decoding_, &prefill_}) {
    for (const auto& seq : *seqs) {
      if (seq->GetReqId() == req_id) {
        return seq;
      }
    }
  }
  return nullptr;
}

Status RunningList::Remove(int64_t req_id) {
  auto it = FindById(decoding_, req_id);
  if (it != decoding_.end()) {
    decoding_.erase(it);
    return Status();
  }

  it = FindById(prefill_, req_id);
  if (it != prefill_.end()) {
    prefill_.erase(it);
    return Status();
  }

  return Status(RET_NOT_FOUND, fmt::format("Req {} is not in running list.", req_id));
}

Status RunningList::MoveToDecoding(int64_t req_id) {
  auto it = FindById(prefill_, req_id);
  if (it == prefill_.end()) {
    return Status(RET_NOT_FOUND, fmt::format("Req {} is not in prefill list.", req_id));
  }

  decoding_.push_back(*it);
  prefill_.erase(it);
  return Status();
}

bool RunningList::ReadyForPrefill() const {
  if (prefill_.empty()) {
    return false;
  }

  if (decoding_.empty()) {
    return true;
  }

  return static_cast<float>(prefill_.size()) / static_cast<float>(decoding_.size()) >= ratio_;
}

}  // namespace ripple_llm
