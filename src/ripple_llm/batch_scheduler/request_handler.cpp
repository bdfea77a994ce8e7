/* Copyright 2024 Tencent Inc.  All rights reserved.

==============================================================================*/

#include "ripple_llm/batch_scheduler/request_handler.h"

#include "fmt/core.h"

#include "ripple_llm/utils/logger.h"
#include "ripple_llm/utils/ret_code.h"
#include "ripple_llm/utils/string_utils.h"

namespace ripple_llm {

RequestHandler::RequestHandler(const RequestHandlerConfig& request_handler_config,
                               std::shared_ptr<CacheManagerInterface> cache_manager, std::shared_ptr<Sampler> sampler)
    : request_handler_config_(request_handler_config),
      cache_manager_(cache_manager),
      sampler_(sampler),
      running_list_(request_handler_config.ratio),
      waiting_queue_(request_handler_config.max_input_len, request_handler_config.waiting_bucket_num),
      prefill_batch_(true),
      decode_batch_(false) {
  RLLM_CHECK_WITH_INFO(cache_manager_ != nullptr, "RequestHandler needs a cache manager.");
  RLLM_CHECK_WITH_INFO(sampler_ != nullptr, "RequestHandler needs a sampler.");
}

void RequestHandler::ProcessWaitingQueue() {
  std::shared_ptr<Sequence> seq = waiting_queue_.PeekHighestPriority();
  if (seq == nullptr) {
    return;
  }

  // A prompt longer than limit could only come here if the limit is bypassed, drop it.
  if (seq->GetPromptLen() > request_handler_config_.max_input_len) {
    RLLM_LOG_WARNING << fmt::format("Req {} prompt len {} exceed max input len {}, abort it.", seq->GetReqId(),
                                    seq->GetPromptLen(), request_handler_config_.max_input_len);
    STATUS_CHECK_FAILURE(waiting_queue_.Remove(seq->GetReqId()));
    StopSequence(seq, REQUEST_STATUS_ABORTED, Status(RET_EXCEED_LENGTH, "prompt too long."));
    AppendDone(seq);
    return;
  }

  size_t available_block_num = cache_manager_->GetAvailableBlockNumber();
  size_t max_blocks_per_sequence = cache_manager_->GetMaxBlocksPerSequence();
  if (available_block_num <= max_blocks_per_sequence) {
    RLLM_LOG_DEBUG << fmt::format("Not enough blocks for waiting req {}, available {}, max per sequence {}.",
                                  seq->GetReqId(), available_block_num, max_blocks_per_sequence);
    return;
  }

  Status status = cache_manager_->AllocateBlocks(seq->GetReqId(), seq->GetPromptLen(), seq->GetMutableBlockTable());
  if (status.GetCode() == RET_CACHE_EXHAUSTED) {
    RLLM_LOG_WARNING << fmt::format("Allocate blocks for req {} error, keep it waiting. info: {}", seq->GetReqId(),
                                    status.GetMessage());
    return;
  }

  // The prompt could never fit into one sequence's blocks, drop it so that it does not block the queue.
  if (!status.OK()) {
    RLLM_LOG_WARNING << fmt::format("Req {} could not be admitted, abort it. info: {}", seq->GetReqId(),
                                    status.GetMessage());
    STATUS_CHECK_FAILURE(waiting_queue_.Remove(seq->GetReqId()));
    StopSequence(seq, REQUEST_STATUS_ABORTED, Status(RET_EXCEED_LENGTH, status.GetMessage()));
    AppendDone(seq);
    return;
  }

  STATUS_CHECK_FAILURE(waiting_queue_.Remove(seq->GetReqId()));
  STATUS_CHECK_FAILURE(running_list_.Append(seq));
  RLLM_LOG_DEBUG << fmt::format("Req {} admitted with {} blocks, waiting {}, prefill {}, decoding {}.",
                                seq->GetReqId(), seq->GetBlockTable().GetBlockNumber(), waiting_queue_.Size(),
                                running_list_.GetPrefill().size(), running_list_.GetDecoding().size());
}

const BatchInfo& RequestHandler::Schedule() {
  if (waiting_queue_.HasPending()) {
    ProcessWaitingQueue();
  }

  if (running_list_.ReadyForPrefill()) {
    for (const auto& seq : running_list_.GetPrefill()) {
      seq->SetStatus(REQUEST_STATUS_RUNNING);
    }
    prefill_batch_.Init(running_list_.GetPrefill());
    RLLM_LOG_DEBUG << "Schedule prefill batch " << Vector2Str(prefill_batch_.GetReqIds());
    return prefill_batch_;
  }

  RLLM_LOG_DEBUG << "Schedule decode batch " << Vector2Str(decode_batch_.GetReqIds());
  return decode_batch_;
}

Status RequestHandler::AddSequence(const std::shared_ptr<Sequence>& seq) {
  if (seq == nullptr) {
    return Status(RET_INVALID_ARGUMENT, "Add an empty sequence.");
  }

  int64_t req_id = seq->GetReqId();
  FoundSequence found;
  if (FindSequence(req_id, found).OK() || done_req_ids_.count(req_id) > 0) {
    return Status(RET_DUPLICATE_REQUEST, fmt::format("Req {} already exists.", req_id));
  }

  if (seq->GetPromptLen() >= request_handler_config_.max_input_len) {
    return Status(RET_EXCEED_LENGTH, fmt::format("Req {} prompt len {} should be less than max input len {}.", req_id,
                                                 seq->GetPromptLen(), request_handler_config_.max_input_len));
  }

  return waiting_queue_.Enqueue(seq);
}

Status RequestHandler::AbortSequence(int64_t req_id) {
  FoundSequence found;
  Status status = FindSequence(req_id, found);
  if (!status.OK()) {
    return status;
  }

  std::shared_ptr<Sequence> seq = found.seq;
  if (!seq->GetBlockTable().IsEmpty()) {
    STATUS_CHECK_FAILURE(cache_manager_->FreeBlocks(req_id, seq->GetMutableBlockTable()));
  }

  if (found.location == LOCATION_WAITING) {
    STATUS_CHECK_FAILURE(waiting_queue_.Remove(req_id));
  } else {
    STATUS_CHECK_FAILURE(running_list_.Remove(req_id));
    prefill_batch_.Remove(req_id);
    decode_batch_.Remove(req_id);
  }

  StopSequence(seq, REQUEST_STATUS_ABORTED, Status(RET_TERMINATED, "client aborted."));
  AppendDone(seq);
  RLLM_LOG_DEBUG << "req " << req_id << " aborted in " << (found.location == LOCATION_WAITING ? "waiting" : "running");
  return Status();
}

Status RequestHandler::FindSequence(int64_t req_id, FoundSequence& found) {
  size_t bucket_index = 0;
  std::shared_ptr<Sequence> seq = waiting_queue_.Find(req_id, bucket_index);
  if (seq != nullptr) {
    found.location = LOCATION_WAITING;
    found.bucket_index = bucket_index;
    found.seq = seq;
    return Status();
  }

  seq = running_list_.Find(req_id);
  if (seq != nullptr) {
    found.location = LOCATION_RUNNING;
    found.bucket_index = 0;
    found.seq = seq;
    return Status();
  }

  return Status(RET_NOT_FOUND, fmt::format("Req {} is not waiting or running.", req_id));
}

void RequestHandler::ReparentBeams(const std::vector<std::shared_ptr<Sequence>>& seqs,
                                   const std::vector<size_t>& parent_rows) {
  // Snapshot first, a parent may be overwritten by its own child in the same step.
  std::vector<std::vector<int>> output_tokens(seqs.size());
  std::vector<float> cumulative_logprobs(seqs.size());
  for (size_t row = 0; row < seqs.size(); ++row) {
    output_tokens[row] = seqs[row]->GetOutputTokens();
    cumulative_logprobs[row] = seqs[row]->GetCumulativeLogprob();
  }

  for (size_t row = 0; row < seqs.size(); ++row) {
    size_t parent_row = parent_rows[row];
    if (parent_row != row && !seqs[row]->CheckFinish()) {
      seqs[row]->ResetOutput(output_tokens[parent_row], cumulative_logprobs[parent_row]);
    }
  }
}

Status RequestHandler::SearchTokens(const std::vector<float>& logits, size_t vocab_size,
                                    const GenerationConfig& generation_config) {
  BatchInfo& batch = prefill_batch_.IsEmpty() ? decode_batch_ : prefill_batch_;
  if (batch.IsEmpty()) {
    return Status(RET_INVALID_ARGUMENT, "No active batch to search tokens for.");
  }

  const std::vector<std::shared_ptr<Sequence>>& seqs = batch.GetSequences();
  if (vocab_size == 0 || logits.size() != seqs.size() * vocab_size) {
    return Status(RET_INVALID_ARGUMENT, fmt::format("Logits size {} not match batch size {} with vocab size {}.",
                                                    logits.size(), seqs.size(), vocab_size));
  }

  SamplingRequest sampling_request;
  sampling_request.logits = &logits;
  sampling_request.row_num = seqs.size();
  sampling_request.vocab_size = vocab_size;
  sampling_request.generation_config = &generation_config;
  sampling_request.is_prefill = batch.IsPrompts();
  for (const auto& seq : seqs) {
    sampling_request.cumulative_logprobs.push_back(seq->GetCumulativeLogprob());
    sampling_request.group_ids.push_back(seq->GetGroupId());
  }

  SamplingResult result;
  STATUS_CHECK_RETURN(sampler_->Sample(sampling_request, result));

  if (Sampler::GetSamplingStrategy(generation_config) == SAMPLING_BEAM_SEARCH) {
    ReparentBeams(seqs, result.parent_rows);
  }

  for (size_t row = 0; row < seqs.size(); ++row) {
    const std::shared_ptr<Sequence>& seq = seqs[row];
    if (seq->CheckFinish()) {
      continue;
    }

    seq->AppendToken(result.tokens[row], result.logprobs[row]);
    if (!MarkFinished(seq, generation_config)) {
      AllocateStepBlocks(seq);
    }
  }

  return Status();
}

void RequestHandler::AllocateStepBlocks(const std::shared_ptr<Sequence>& seq) {
  Status status =
      cache_manager_->AllocateBlocks(seq->GetReqId(), seq->GetTotalTokenNum(), seq->GetMutableBlockTable());
  if (!status.OK()) {
    RLLM_LOG_WARNING << fmt::format("Allocate step blocks for req {} error, abort it. info: {}", seq->GetReqId(),
                                    status.GetMessage());
    StopSequence(seq, REQUEST_STATUS_ABORTED, status);
  }
}

bool RequestHandler::MarkFinished(const std::shared_ptr<Sequence>& seq, const GenerationConfig& generation_config) {
  if (seq->CheckFinish()) {
    return true;
  }

  const std::vector<int>& output_tokens = seq->GetOutputTokens();
  if (output_tokens.empty()) {
    return false;
  }

  if (output_tokens.back() == generation_config.eos_id || output_tokens.size() >= generation_config.max_output_len) {
    RLLM_LOG_DEBUG << fmt::format("Req {} finished with {} output tokens.", seq->GetReqId(), output_tokens.size());
    StopSequence(seq, REQUEST_STATUS_FINISHED, Status());
    return true;
  }

  return false;
}

const std::vector<std::shared_ptr<Sequence>>& RequestHandler::Update() {
  if (!prefill_batch_.IsEmpty()) {
    for (const auto& seq : prefill_batch_.GetSequences()) {
      STATUS_CHECK_FAILURE(running_list_.MoveToDecoding(seq->GetReqId()));
      seq->SetInferStage(STAGE_DECODE);
      STATUS_CHECK_FAILURE(decode_batch_.AddSeq(seq));
    }
    prefill_batch_.Clear();
  }

  std::vector<std::shared_ptr<Sequence>> finished_seqs;
  for (const auto& seq : decode_batch_.GetSequences()) {
    if (seq->CheckFinish()) {
      finished_seqs.push_back(seq);
    }
  }

  for (const auto& seq : finished_seqs) {
    int64_t req_id = seq->GetReqId();
    STATUS_CHECK_FAILURE(running_list_.Remove(req_id));
    decode_batch_.Remove(req_id);
    // An empty prompt finished on its first token never got a block.
    if (!seq->GetBlockTable().IsEmpty()) {
      STATUS_CHECK_FAILURE(cache_manager_->FreeBlocks(req_id, seq->GetMutableBlockTable()));
    }
    AppendDone(seq);
    RLLM_LOG_DEBUG << "req " << req_id << " done, " << seq->ToString();
  }

  return done_seqs_;
}

bool RequestHandler::HasUnfinishedSequences() const { return waiting_queue_.HasPending() || !running_list_.IsEmpty(); }

std::vector<std::shared_ptr<Sequence>> RequestHandler::ReleaseDoneSequences() {
  std::vector<std::shared_ptr<Sequence>> done_seqs;
  done_seqs.swap(done_seqs_);
  done_req_ids_.clear();
  return done_seqs;
}

void RequestHandler::StopSequence(const std::shared_ptr<Sequence>& seq, RequestStatus status,
                                  const Status& finish_status) {
  if (seq->CheckFinish()) {
    return;
  }

  seq->SetStatus(status);
  seq->SetFinishStatus(finish_status);
}

void RequestHandler::AppendDone(const std::shared_ptr<Sequence>& seq) {
  if (!done_req_ids_.insert(seq->GetReqId()).second) {
    RLLM_THROW(fmt::format("Req {} is already in done list.", seq->GetReqId()));
  }
  done_seqs_.push_back(seq);
}

}  // namespace ripple_llm
