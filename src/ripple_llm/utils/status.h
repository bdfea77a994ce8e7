/* Copyright 2024 Tencent Inc.  All rights reserved.

==============================================================================*/

#pragma once

#include <memory>
#include <string>

#include "ripple_llm/utils/logger.h"
#include "ripple_llm/utils/ret_code.h"

namespace ripple_llm {

// The result of a scheduler call. An OK status carries nothing, an error carries its code and
// message in a state shared by all the copies.
class Status {
 public:
  Status() {}

  // RET_SUCCESS makes an OK status and drops the message.
  explicit Status(RetCode code, const std::string &message = "");

  bool OK() const { return state_ == nullptr; }

  RetCode GetCode() const { return OK() ? RET_SUCCESS : state_->code; }

  const std::string &GetMessage() const;

  // "OK", or "<CODE_NAME>(<code>): <message>".
  std::string ToString() const;

 private:
  struct State {
    RetCode code;
    std::string message;
  };

  std::shared_ptr<const State> state_;
};

// Log and return the status from current function if it is an error.
#define STATUS_CHECK_RETURN(status)         \
  do {                                      \
    auto &&_status = (status);              \
    if (!_status.OK()) {                    \
      RLLM_LOG_ERROR << _status.ToString(); \
      return _status;                       \
    }                                       \
  } while (0)

// For calls that could only fail if the scheduler state is broken.
#define STATUS_CHECK_FAILURE(status)        \
  do {                                      \
    auto &&_status = (status);              \
    if (!_status.OK()) {                    \
      RLLM_LOG_ERROR << _status.ToString(); \
      RLLM_THROW(_status.ToString());       \
    }                                       \
  } while (0)

}  // namespace ripple_llm
