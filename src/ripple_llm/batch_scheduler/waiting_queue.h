/* Copyright 2024 Tencent Inc.  All rights reserved.

==============================================================================*/
#pragma once

#include <deque>
#include <memory>
#include <vector>

#include "ripple_llm/runtime/sequence.h"
#include "ripple_llm/utils/status.h"

namespace ripple_llm {

// The not yet admitted sequences, bucketed by prompt length. Bucket 0 holds the shortest
// prompts and has the highest priority, every bucket is FIFO.
class WaitingQueue {
 public:
  WaitingQueue(size_t max_input_len, size_t bucket_num);

  // floor(prompt_len * bucket_num / max_input_len), clamped to the last bucket.
  size_t GetPriority(size_t prompt_len) const;

  Status Enqueue(const std::shared_ptr<Sequence>& seq);

  bool HasPending() const;

  // The head of the first non-empty bucket, nullptr if nothing pending.
  std::shared_ptr<Sequence> PeekHighestPriority() const;

  std::shared_ptr<Sequence> PopHighestPriority();

  Status Remove(int64_t req_id);

  // Return nullptr if not found, otherwise set the bucket index.
  std::shared_ptr<Sequence> Find(int64_t req_id, size_t& bucket_index) const;

  size_t Size() const;

  size_t GetBucketNum() const { return buckets_.size(); }

  const std::deque<std::shared_ptr<Sequence>>& GetBucket(size_t bucket_index) const { return buckets_[bucket_index]; }

 private:
  size_t max_input_len_;

  std::vector<std::deque<std::shared_ptr<Sequence>>> buckets_;
};

}  // namespace ripple_llm
