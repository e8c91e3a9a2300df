// Copyright 2018 The Fuchsia Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "util/status.h"

namespace shamir {
namespace util {

const Status& Status::OK = Status();

const char* StatusCodeName(StatusCode code) {
  switch (code) {
    case OK:
      return "OK";
    case INVALID_ARGUMENT:
      return "INVALID_ARGUMENT";
    case NOT_FOUND:
      return "NOT_FOUND";
    case FAILED_PRECONDITION:
      return "FAILED_PRECONDITION";
    case INTERNAL:
      return "INTERNAL";
  }
  return "UNKNOWN";
}

Status Status::Annotate(const std::string& context) const {
  if (ok()) {
    return *this;
  }
  return Status(code_, context + ": " + error_message_, error_details_);
}

std::string Status::ToString() const {
  if (ok()) {
    return "OK";
  }
  std::string result = std::string(StatusCodeName(code_)) + ": " +
                       error_message_;
  if (!error_details_.empty()) {
    result += " (" + error_details_ + ")";
  }
  return result;
}

}  // namespace util
}  // namespace shamir
