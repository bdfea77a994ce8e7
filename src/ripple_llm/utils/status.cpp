/* Copyright 2024 Tencent Inc.  All rights reserved.

==============================================================================*/

#include "ripple_llm/utils/status.h"

#include "fmt/core.h"

namespace ripple_llm {

Status::Status(RetCode code, const std::string &message) {
  if (code != RET_SUCCESS) {
    state_ = std::make_shared<State>(State{code, message});
  }
}

const std::string &Status::GetMessage() const {
  static const std::string empty_message;
  return OK() ? empty_message : state_->message;
}

std::string Status::ToString() const {
  if (OK()) {
    return "OK";
  }
  return fmt::format("{}({}): {}", GetRetCodeName(state_->code), static_cast<int>(state_->code), state_->message);
}

}  // namespace ripple_llm
