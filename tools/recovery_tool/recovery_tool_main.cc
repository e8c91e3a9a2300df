// Copyright 2017 The Fuchsia Authors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//    http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "tools/recovery_tool/recovery_tool.h"

#include <gflags/gflags.h>

#include <cstdlib>
#include <iostream>

#include "logging.h"

DECLARE_string(share_file);

int main(int argc, char* argv[]) {
  google::SetUsageMessage(
      "Recovers a secret from a file of threshold secret shares.\n"
      "usage: recovery_tool -share_file=<path> [-pick=x1,x2,...] "
      "[-find_consistent] [-method=lagrange|gaussian]");
  google::ParseCommandLineFlags(&argc, &argv, true);
  INIT_LOGGING(argv[0]);

  if (FLAGS_share_file.empty()) {
    std::cerr << "Error: -share_file is required" << std::endl;
    exit(1);
  }
  auto tool = shamir::RecoveryTool::CreateFromFlagsOrDie();
  exit(tool->Run(FLAGS_share_file) ? 0 : 1);
}
