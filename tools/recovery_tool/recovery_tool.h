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

// A command-line tool that recovers a secret from a share file.
//
// The share file lists the threshold k, the share count n and the shares.
// The tool works in one of two ways:
// - If the -pick flag lists k x values, or if the file holds exactly k shares,
//   the tool interpolates those k shares and reports the result.
// - Otherwise, if -find_consistent is set (the default), it interpolates every
//   k-subset of the shares and reports the value most subsets agree on. This
//   tolerates a few corrupted shares.

#ifndef SHAMIR_TOOLS_RECOVERY_TOOL_RECOVERY_TOOL_H_
#define SHAMIR_TOOLS_RECOVERY_TOOL_RECOVERY_TOOL_H_

#include <gmpxx.h>

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "./shares.pb.h"
#include "algorithms/recovery/point.h"
#include "algorithms/recovery/secret_recoverer.h"
#include "util/status.h"

namespace shamir {

struct RecoveryToolOptions {
  // The comma-separated x values of the shares to use. Empty means no pick.
  std::string pick;

  // Whether to vote over every subset when there are more than k shares and
  // nothing was picked.
  bool find_consistent = true;

  recovery::RecoveryOptions recovery_options;

  // Whether to print every candidate secret with its number of votes and the
  // keys of the witness subset.
  bool print_votes = false;

  // Whether to print every coefficient of the recovered polynomial.
  bool print_coefficients = false;
};

class RecoveryTool {
 public:
  // Builds a RecoveryTool from the command-line flags. Invokes LOG(FATAL) if
  // a flag is invalid.
  static std::unique_ptr<RecoveryTool> CreateFromFlagsOrDie();

  // The results are written to |ostream|.
  RecoveryTool(RecoveryToolOptions options, std::ostream* ostream);

  // Reads the share file at |share_file_path| and recovers its secret.
  // Returns true on success. On failure the error is written to std::cerr.
  bool Run(const std::string& share_file_path);

  // Recovers the secret from |share_set| and writes it to the output stream.
  util::Status Recover(const ShareSet& share_set);

 private:
  friend class RecoveryToolTest;

  // Parses the -pick list into x values.
  static util::Status ParsePickList(const std::string& pick,
                                    std::vector<mpz_class>* x_keys_out);

  // Converts a failed recovery into a util::Status.
  static util::Status ToUtilStatus(recovery::Status status,
                                   const recovery::RecoveryResult& result);

  void PrintVotes(const std::vector<recovery::Point>& points,
                  const recovery::RecoveryResult& result);

  util::Status PrintCoefficients(const std::vector<recovery::Point>& points,
                                 const recovery::RecoveryResult& result);

  RecoveryToolOptions options_;
  std::ostream* ostream_;
};

}  // namespace shamir

#endif  // SHAMIR_TOOLS_RECOVERY_TOOL_RECOVERY_TOOL_H_
