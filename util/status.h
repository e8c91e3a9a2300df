// Copyright 2018 The Fuchsia Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef SHAMIR_UTIL_STATUS_H_
#define SHAMIR_UTIL_STATUS_H_

#include "util/status_codes.h"

#include <string>

namespace shamir {
namespace util {

// The outcome of an operation in the decoding and tool layers: a StatusCode,
// a message for the user and optional details naming the offending input.
class Status {
 public:
  Status() : code_(StatusCode::OK) {}

  Status(StatusCode code, const std::string &error_message)
      : code_(code), error_message_(error_message) {}

  Status(StatusCode code, const std::string &error_message,
         const std::string &error_details)
      : code_(code),
        error_message_(error_message),
        error_details_(error_details) {}

  static const Status &OK;

  StatusCode error_code() const { return code_; }
  std::string error_message() const { return error_message_; }
  std::string error_details() const { return error_details_; }

  bool ok() const { return code_ == StatusCode::OK; }

  // Returns a copy of this status whose message is prefixed with |context|.
  // An OK status is returned unchanged.
  Status Annotate(const std::string &context) const;

  // Returns "<CODE>: <message> (<details>)", or "OK".
  std::string ToString() const;

 private:
  StatusCode code_;
  std::string error_message_;
  std::string error_details_;
};

// Early-returns the status if it is an error, otherwise it proceeds.
//
// The argument expression is evaluated only once.
#define RETURN_IF_ERROR(__status) \
  do {                            \
    auto status = (__status);     \
    if (!status.ok()) {           \
      return status;              \
    }                             \
  } while (false)

}  // namespace util
}  // namespace shamir

#endif  // SHAMIR_UTIL_STATUS_H_
