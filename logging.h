// Copyright 2017 The Fuchsia Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef SHAMIR_LOGGING_H_
#define SHAMIR_LOGGING_H_

#include <glog/logging.h>

#define INIT_LOGGING(val) \
{ \
  google::InitGoogleLogging(val); \
  google::InstallFailureSignalHandler(); \
}

#endif  // SHAMIR_LOGGING_H_
