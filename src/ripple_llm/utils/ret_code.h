/* Copyright 2024 Tencent Inc.  All rights reserved.

==============================================================================*/

#pragma once

namespace ripple_llm {

enum RetCode {
  // All things ok.
  RET_SUCCESS = 0,

  // The input argument is invalid.
  RET_INVALID_ARGUMENT = 1,

  // A request with the same id is already waiting, running or done.
  RET_DUPLICATE_REQUEST = 2,

  // The input len exceed max input length.
  RET_EXCEED_LENGTH = 3,

  // The request is not found in any queue.
  RET_NOT_FOUND = 4,

  // No more free cache blocks.
  RET_CACHE_EXHAUSTED = 5,

  // cache manager free fail
  RET_FREE_FAIL = 6,

  // A request is in an inconsistent state, for example present in two lists.
  RET_INVARIANT_VIOLATION = 7,

  // The request is terminated.
  RET_TERMINATED = 8,

  // The runtime error.
  RET_RUNTIME = 9,

  // something not in above values.
  RET_UNKNOWN = 255,
};

inline const char* GetRetCodeName(RetCode code) {
  switch (code) {
    case RET_SUCCESS:
      return "SUCCESS";
    case RET_INVALID_ARGUMENT:
      return "INVALID_ARGUMENT";
    case RET_DUPLICATE_REQUEST:
      return "DUPLICATE_REQUEST";
    case RET_EXCEED_LENGTH:
      return "EXCEED_LENGTH";
    case RET_NOT_FOUND:
      return "NOT_FOUND";
    case RET_CACHE_EXHAUSTED:
      return "CACHE_EXHAUSTED";
    case RET_FREE_FAIL:
      return "FREE_FAIL";
    case RET_INVARIANT_VIOLATION:
      return "INVARIANT_VIOLATION";
    case RET_TERMINATED:
      return "TERMINATED";
    case RET_RUNTIME:
      return "RUNTIME";
    default:
      return "UNKNOWN";
  }
}

}  // namespace ripple_llm
