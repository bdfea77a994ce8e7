/* Copyright 2024 Tencent Inc.  All rights reserved.

==============================================================================*/
#pragma once

#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "ripple_llm/utils/environment.h"
#include "ripple_llm/utils/status.h"

namespace ripple_llm {

// Filter one row of logits in place, filtered entries are set to -inf.
using LogitsProcessorFunc = std::function<void(float* logits, size_t vocab_size, const GenerationConfig&)>;

// Keep the smallest set of most likely tokens whose probability sum reaches top_p.
void ApplyTopP(float* logits, size_t vocab_size, float top_p);

// Keep the top_k most likely tokens, the ties of the k-th value are kept too.
void ApplyTopK(float* logits, size_t vocab_size, int top_k);

// Drop the tokens whose probability is less than min_p times the largest probability.
void ApplyMinP(float* logits, size_t vocab_size, float min_p);

// The named logits processors. They are applied in registration order, which is
// top_p, top_k, min_p for the builtin ones, no matter how the config lists them.
class LogitsProcessorRegistry {
 public:
  LogitsProcessorRegistry();

  // Register a new processor after all existing ones.
  Status Register(const std::string& name, LogitsProcessorFunc func);

  bool IsRegistered(const std::string& name) const;

  // Check that every enabled name is registered.
  Status CheckEnabled(const std::vector<std::string>& enabled_names) const;

  // Apply the enabled processors to every row of a [row_num, vocab_size] matrix.
  Status Process(float* logits, size_t row_num, size_t vocab_size, const GenerationConfig& generation_config) const;

 private:
  std::vector<std::pair<std::string, LogitsProcessorFunc>> processors_;
};

}  // namespace ripple_llm
