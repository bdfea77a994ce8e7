/* Copyright 2024 Tencent Inc.  All rights reserved.

==============================================================================*/
#pragma once

#include <string>

namespace ripple_llm {

enum RequestStatus {
  REQUEST_STATUS_WAITING,
  REQUEST_STATUS_RUNNING,
  REQUEST_STATUS_FINISHED,
  REQUEST_STATUS_ABORTED,
};

inline std::string GetRequestStatusName(RequestStatus status) {
  switch (status) {
    case REQUEST_STATUS_WAITING:
      return "WAITING";
    case REQUEST_STATUS_RUNNING:
      return "RUNNING";
    case REQUEST_STATUS_FINISHED:
      return "FINISHED";
    case REQUEST_STATUS_ABORTED:
      return "ABORTED";
    default:
      return "UNKNOWN";
  }
}

}  // namespace ripple_llm
