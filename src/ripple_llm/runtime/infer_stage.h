/* Copyright 2024 Tencent Inc.  All rights reserved.

==============================================================================*/
#pragma once

namespace ripple_llm {

// A sequence is admitted in prefill stage, and moves to decode stage once its prompt has been executed.
enum InferStage {
  STAGE_PREFILL,
  STAGE_DECODE,
};

inline const char* GetInferStageName(InferStage infer_stage) {
  return infer_stage == STAGE_PREFILL ? "PREFILL" : "DECODE";
}

}  // namespace ripple_llm
