/* Copyright 2024 Tencent Inc.  All rights reserved.

==============================================================================*/

#include "ripple_llm/batch_scheduler/waiting_queue.h"

#include <algorithm>

#include "fmt/core.h"

#include "ripple_llm/utils/logger.h"
#include "ripple_llm/utils/ret_code.h"

namespace ripple_llm {

WaitingQueue::WaitingQueue(size_t max_input_len, size_t bucket_num)
    : max_input_len_(max_input_len), buckets_(bucket_num) {
  RLLM_CHECK_WITH_INFO(max_input_len_ > 0, "max_input_len must be positive.");
  RLLM_CHECK_WITH_INFO(bucket_num > 0, "The waiting queue needs at least one bucket.");
}

size_t WaitingQueue::GetPriority(size_t prompt_len) const {
  size_t bucket_index = prompt_len * buckets_.size() / max_input_len_;
  return std::min(bucket_index, buckets_.size() - 1);
}

Status WaitingQueue::Enqueue(const std::shared_ptr<Sequence>& seq) {
  size_t bucket_index = 0;
  if (Find(seq->GetReqId(), bucket_index) != nullptr) {
    return Status(RET_DUPLICATE_REQUEST,
                  fmt::format("Req {} is already waiting in bucket {}.", seq->GetReqId(), bucket_index));
  }

  bucket_index = GetPriority(seq->GetPromptLen());
  buckets_[bucket_index].push_back(seq);
  RLLM_LOG_DEBUG << fmt::format("Req {} with prompt len {} enqueued to bucket {}.", seq->GetReqId(),
                                seq->GetPromptLen(), bucket_index);
  return Status();
}

bool WaitingQueue::HasPending() const {
  return std::any_of(buckets_.begin(), buckets_.end(), [](const auto& bucket) { return !bucket.empty(); });
}

std::shared_ptr<Sequence> WaitingQueue::PeekHighestPriority() const {
  for (const auto& bucket : buckets_) {
    if (!bucket.empty()) {
      return bucket.front();
    }
  }
  return nullptr;
}

std::shared_ptr<Sequence> WaitingQueue::PopHighestPriority() {
  for (auto& bucket : buckets_) {
    if (!bucket.empty()) {
      std::shared_ptr<Sequence> seq = bucket.front();
      bucket.pop_front();
      return seq;
    }
  }
  return nullptr;
}

Status WaitingQueue::Remove(int64_t req_id) {
  for (auto& bucket : buckets_) {
    auto it = std::find_if(bucket.begin(), bucket.end(),
                           [req_id](const std::shared_ptr<Sequence>& seq) { return seq->GetReqId() == req_id; });
    if (it != bucket.end()) {
      bucket.erase(it);
      return Status();
    }
  }
  return Status(RET_NOT_FOUND, fmt::format("Req {} is not in waiting queue.", req_id));
}

std::shared_ptr<Sequence> WaitingQueue::Find(int64_t req_id, size_t& bucket_index) const {
  for (size_t i = 0; i < buckets_.size(); ++i) {
    for (const auto& seq : buckets_[i]) {
      if (seq->GetReqId() == req_id) {
        bucket_index = i;
        return seq;
      }
    }
  }
  return nullptr;
}

size_t WaitingQueue::Size() const {
  size_t size = 0;
  for (const auto& bucket : buckets_) {
    size += bucket.size();
  }
  return size;
}

}  // namespace ripple_llm
