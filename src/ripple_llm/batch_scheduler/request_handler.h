/* Copyright 2024 Tencent Inc.  All rights reserved.

==============================================================================*/
#pragma once

#include <memory>
#include <unordered_set>
#include <vector>

#include "ripple_llm/batch_scheduler/batch_info.h"
#include "ripple_llm/batch_scheduler/running_list.h"
#include "ripple_llm/batch_scheduler/waiting_queue.h"
#include "ripple_llm/cache_manager/cache_manager_interface.h"
#include "ripple_llm/runtime/sequence.h"
#include "ripple_llm/samplers/sampler.h"
#include "ripple_llm/utils/environment.h"
#include "ripple_llm/utils/status.h"

namespace ripple_llm {

enum SequenceLocation { LOCATION_WAITING, LOCATION_RUNNING };

// The result of a lookup, bucket_index is only meaningful for a waiting sequence.
struct FoundSequence {
  SequenceLocation location = LOCATION_WAITING;
  size_t bucket_index = 0;
  std::shared_ptr<Sequence> seq;
};

// Schedule the sequences of a continuous batching engine. Every step the driver calls
// Schedule(), runs the model on the returned batch, then calls SearchTokens() and Update().
// Not thread-safe, all the calls should come from the engine loop.
class RequestHandler {
 public:
  RequestHandler(const RequestHandlerConfig& request_handler_config,
                 std::shared_ptr<CacheManagerInterface> cache_manager, std::shared_ptr<Sampler> sampler);

  // Admit at most one waiting sequence, then return the prefill batch if the prefill part of the running list
  // is ready, otherwise the decode batch.
  const BatchInfo& Schedule();

  // Add a new sequence to the waiting queue.
  Status AddSequence(const std::shared_ptr<Sequence>& seq);

  // Abort a waiting or running sequence and release its blocks.
  Status AbortSequence(int64_t req_id);

  // Search the waiting queue, then the running list.
  Status FindSequence(int64_t req_id, FoundSequence& found);

  // Sample the next token for every sequence of the active batch, the active batch is the prefill batch if
  // it is not empty, otherwise the decode batch. logits is a [batch_size, vocab_size] matrix.
  Status SearchTokens(const std::vector<float>& logits, size_t vocab_size, const GenerationConfig& generation_config);

  // Mark the sequence finished if it generated eos or reached max output len, return true if it is finished.
  bool MarkFinished(const std::shared_ptr<Sequence>& seq, const GenerationConfig& generation_config);

  // Fold the executed prefill batch into decoding, retire the finished sequences,
  // and return all the done sequences not released yet.
  const std::vector<std::shared_ptr<Sequence>>& Update();

  // Whether there are still waiting or running sequences.
  bool HasUnfinishedSequences() const;

  // Hand over the done sequences and forget them.
  std::vector<std::shared_ptr<Sequence>> ReleaseDoneSequences();

  const RunningList& GetRunningList() const { return running_list_; }

  const WaitingQueue& GetWaitingQueue() const { return waiting_queue_; }

  const BatchInfo& GetPrefillBatch() const { return prefill_batch_; }

  const BatchInfo& GetDecodeBatch() const { return decode_batch_; }

  const std::vector<std::shared_ptr<Sequence>>& GetDoneSequences() const { return done_seqs_; }

 private:
  // Try to move the highest priority waiting sequence into the running list.
  void ProcessWaitingQueue();

  // Grow the blocks of a sequence to hold all its tokens, abort it if no more blocks.
  void AllocateStepBlocks(const std::shared_ptr<Sequence>& seq);

  // Set the terminal status, do nothing if the sequence is already finished or aborted.
  void StopSequence(const std::shared_ptr<Sequence>& seq, RequestStatus status, const Status& finish_status);

  void AppendDone(const std::shared_ptr<Sequence>& seq);

  // Continue the history of another beam of the group before appending the new token.
  void ReparentBeams(const std::vector<std::shared_ptr<Sequence>>& seqs, const std::vector<size_t>& parent_rows);

 private:
  RequestHandlerConfig request_handler_config_;

  std::shared_ptr<CacheManagerInterface> cache_manager_;

  std::shared_ptr<Sampler> sampler_;

  RunningList running_list_;

  WaitingQueue waiting_queue_;

  BatchInfo prefill_batch_;

  BatchInfo decode_batch_;

  // The finished and aborted sequences, in finish order.
  std::vector<std::shared_ptr<Sequence>> done_seqs_;
  std::unordered_set<int64_t> done_req_ids_;
};

}  // namespace ripple_llm
