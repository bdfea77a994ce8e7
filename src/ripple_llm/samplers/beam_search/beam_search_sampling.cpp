/* Copyright 2024 Tencent Inc.  All rights reserved.

==============================================================================*/
#include "ripple_llm/samplers/beam_search/beam_search_sampling.h"

#include <algorithm>
#include <numeric>

#include "fmt/core.h"

#include "ripple_llm/utils/logger.h"
#include "ripple_llm/utils/ret_code.h"

namespace ripple_llm {

std::vector<BeamSearchSampling::Candidate> BeamSearchSampling::CollectCandidates(const SamplingInput& input,
                                                                                 size_t first_row,
                                                                                 size_t group_size) {
  // In prefill all beams of a group hold the same prompt, so only the first one proposes tokens.
  size_t proposer_num = input.is_prefill ? 1 : group_size;

  std::vector<Candidate> candidates;
  std::vector<size_t> indices(input.vocab_size);
  for (size_t row = first_row; row < first_row + proposer_num; ++row) {
    const float* logprobs = input.logprobs + row * input.vocab_size;
    std::iota(indices.begin(), indices.end(), 0);
    std::partial_sort(indices.begin(), indices.begin() + group_size, indices.end(), [logprobs](size_t a, size_t b) {
      return logprobs[a] > logprobs[b] || (logprobs[a] == logprobs[b] && a < b);
    });

    float cumulative = input.is_prefill ? 0.0f : input.cumulative_logprobs[row];
    for (size_t i = 0; i < group_size; ++i) {
      int token = static_cast<int>(indices[i]);
      candidates.push_back({row, token, logprobs[token], cumulative + logprobs[token]});
    }
  }

  std::stable_sort(candidates.begin(), candidates.end(),
                   [](const Candidate& a, const Candidate& b) { return a.score > b.score; });
  candidates.resize(group_size);
  return candidates;
}

void BeamSearchSampling::AssignCandidates(const std::vector<Candidate>& candidates, size_t first_row,
                                          size_t group_size, bool is_prefill, SamplingResult& result) {
  // A candidate stays in its own row if that row is still free, the others fill the rest in order.
  std::vector<bool> row_taken(group_size, false);
  std::vector<bool> candidate_placed(candidates.size(), false);
  if (!is_prefill) {
    for (size_t i = 0; i < candidates.size(); ++i) {
      size_t offset = candidates[i].row - first_row;
      if (!row_taken[offset]) {
        row_taken[offset] = true;
        candidate_placed[i] = true;
        result.tokens[candidates[i].row] = candidates[i].token;
        result.logprobs[candidates[i].row] = candidates[i].logprob;
        result.parent_rows[candidates[i].row] = candidates[i].row;
      }
    }
  }

  size_t offset = 0;
  for (size_t i = 0; i < candidates.size(); ++i) {
    if (candidate_placed[i]) {
      continue;
    }
    while (row_taken[offset]) {
      ++offset;
    }
    row_taken[offset] = true;
    size_t row = first_row + offset;
    result.tokens[row] = candidates[i].token;
    result.logprobs[row] = candidates[i].logprob;
    result.parent_rows[row] = candidates[i].row;
  }
}

Status BeamSearchSampling::RunSampling(const SamplingInput& input, const GenerationConfig& generation_config,
                                       SamplingResult& result) {
  if (input.group_ids.size() != input.row_num) {
    return Status(RET_INVALID_ARGUMENT, "Beam search error, group ids not match rows.");
  }

  if (!input.is_prefill && input.cumulative_logprobs.size() != input.row_num) {
    return Status(RET_INVALID_ARGUMENT, "Beam search error, cumulative logprobs not match rows.");
  }

  size_t first_row = 0;
  while (first_row < input.row_num) {
    size_t group_size = 1;
    while (first_row + group_size < input.row_num &&
           input.group_ids[first_row + group_size] == input.group_ids[first_row]) {
      ++group_size;
    }

    if (group_size > generation_config.num_beams || group_size > input.vocab_size) {
      return Status(RET_INVALID_ARGUMENT,
                    fmt::format("Beam search error, group {} has {} rows, num_beams {}, vocab size {}.",
                                input.group_ids[first_row], group_size, generation_config.num_beams,
                                input.vocab_size));
    }

    std::vector<Candidate> candidates = CollectCandidates(input, first_row, group_size);
    AssignCandidates(candidates, first_row, group_size, input.is_prefill, result);
    RLLM_LOG_DEBUG << fmt::format("Beam group {} selected {} candidates from row {}.", input.group_ids[first_row],
                                  candidates.size(), first_row);

    first_row += group_size;
  }

  return Status();
}

}  // namespace ripple_llm
