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
#include <glog/logging.h>

#include <sstream>
#include <utility>

#include "algorithms/recovery/polynomial_computations.h"
#include "decoding/radix.h"
#include "decoding/share_file_parser.h"

DEFINE_string(share_file, "",
              "The share file to read. Files ending in .json use the JSON "
              "share format, all others ShareSet text format.");
DEFINE_string(pick, "",
              "A comma-separated list of exactly k share keys (x values). "
              "When given, the secret is interpolated from these shares only.");
DEFINE_bool(find_consistent, true,
            "When there are more than k shares and -pick is not given, vote "
            "over every k-subset of the shares and report the secret most "
            "subsets agree on.");
DEFINE_string(method, "lagrange",
              "The interpolation method: 'lagrange' or 'gaussian'.");
DEFINE_uint32(num_workers, 1,
              "The number of threads that evaluate subsets when voting.");
DEFINE_bool(print_votes, false,
            "Print every candidate secret with its number of votes and the "
            "keys of the subset that produced the secret.");
DEFINE_bool(print_coefficients, false,
            "Print every coefficient of the recovered polynomial.");

namespace shamir {

using recovery::Point;
using recovery::RecoveryResult;
using recovery::SecretRecoverer;

std::unique_ptr<RecoveryTool> RecoveryTool::CreateFromFlagsOrDie() {
  RecoveryToolOptions options;
  options.pick = FLAGS_pick;
  options.find_consistent = FLAGS_find_consistent;
  if (!recovery::ParseInterpolationMethod(
          FLAGS_method, &options.recovery_options.method)) {
    LOG(FATAL) << "Unrecognized method: " << FLAGS_method;
  }
  CHECK_GT(FLAGS_num_workers, 0u) << "-num_workers must be positive";
  options.recovery_options.num_workers = FLAGS_num_workers;
  options.print_votes = FLAGS_print_votes;
  options.print_coefficients = FLAGS_print_coefficients;
  return std::unique_ptr<RecoveryTool>(
      new RecoveryTool(std::move(options), &std::cout));
}

RecoveryTool::RecoveryTool(RecoveryToolOptions options, std::ostream* ostream)
    : options_(std::move(options)), ostream_(ostream) {}

bool RecoveryTool::Run(const std::string& share_file_path) {
  ShareSet share_set;
  util::Status status = decoding::ReadShareFile(share_file_path, &share_set);
  if (status.ok()) {
    status = Recover(share_set);
  }
  if (!status.ok()) {
    LOG(ERROR) << status.ToString();
    std::cerr << "Error: " << status.ToString() << std::endl;
    return false;
  }
  return true;
}

util::Status RecoveryTool::Recover(const ShareSet& share_set) {
  size_t threshold;
  std::vector<Point> points;
  RETURN_IF_ERROR(decoding::DecodeShares(share_set, &threshold, &points));

  SecretRecoverer recoverer(threshold, options_.recovery_options);
  RecoveryResult result;
  recovery::Status recovery_status;
  if (!options_.pick.empty()) {
    std::vector<mpz_class> x_keys;
    RETURN_IF_ERROR(ParsePickList(options_.pick, &x_keys));
    recovery_status = recoverer.RecoverFromKeys(points, x_keys, &result);
  } else if (points.size() == threshold) {
    recovery_status = recoverer.RecoverDirect(points, &result);
  } else if (options_.find_consistent) {
    recovery_status = recoverer.RecoverByVoting(points, &result);
  } else {
    std::ostringstream stream;
    stream << "k=" << threshold << " but there are " << points.size()
           << " shares";
    return util::Status(util::StatusCode::INVALID_ARGUMENT,
                        "There are more shares than the threshold: pass "
                        "-pick or -find_consistent",
                        stream.str());
  }
  if (recovery_status != recovery::kOK) {
    return ToUtilStatus(recovery_status, result);
  }

  *ostream_ << "constant = " << result.secret << std::endl;
  if (options_.print_votes) {
    PrintVotes(points, result);
  }
  if (options_.print_coefficients) {
    RETURN_IF_ERROR(PrintCoefficients(points, result));
  }
  return util::Status::OK;
}

util::Status RecoveryTool::ParsePickList(const std::string& pick,
                                         std::vector<mpz_class>* x_keys_out) {
  std::vector<mpz_class> x_keys;
  std::istringstream stream(pick);
  std::string item;
  while (std::getline(stream, item, ',')) {
    size_t begin = item.find_first_not_of(' ');
    size_t end = item.find_last_not_of(' ');
    std::string key =
        begin == std::string::npos ? "" : item.substr(begin, end - begin + 1);
    mpz_class x;
    util::Status status = decoding::DecodeDecimal(key, &x);
    if (!status.ok()) {
      return util::Status(util::StatusCode::INVALID_ARGUMENT,
                          "Invalid key '" + key + "' in -pick",
                          status.error_message());
    }
    x_keys.push_back(std::move(x));
  }
  x_keys_out->swap(x_keys);
  return util::Status::OK;
}

util::Status RecoveryTool::ToUtilStatus(recovery::Status status,
                                        const RecoveryResult& result) {
  util::StatusCode code;
  switch (status) {
    case recovery::kWrongSubsetSize:
      code = util::StatusCode::INVALID_ARGUMENT;
      break;
    case recovery::kUnknownKey:
      code = util::StatusCode::NOT_FOUND;
      break;
    case recovery::kOK:
      code = util::StatusCode::OK;
      break;
    default:
      code = util::StatusCode::FAILED_PRECONDITION;
      break;
  }
  return util::Status(code, recovery::StatusName(status),
                      result.error_details);
}

void RecoveryTool::PrintVotes(const std::vector<Point>& points,
                              const RecoveryResult& result) {
  if (!result.candidates.empty()) {
    *ostream_ << "votes:" << std::endl;
    for (const auto& candidate : result.candidates) {
      *ostream_ << "  " << candidate.value << ": " << candidate.votes
                << std::endl;
    }
    *ostream_ << "subsets evaluated = " << result.subsets_evaluated
              << ", discarded = " << result.subsets_discarded << std::endl;
  }
  *ostream_ << "witness = {";
  for (size_t i = 0; i < result.witness.size(); i++) {
    if (i > 0) {
      *ostream_ << ", ";
    }
    *ostream_ << points[result.witness[i]].x;
  }
  *ostream_ << "}" << std::endl;
}

util::Status RecoveryTool::PrintCoefficients(const std::vector<Point>& points,
                                             const RecoveryResult& result) {
  std::vector<const Point*> selected;
  for (size_t index : result.witness) {
    selected.push_back(&points[index]);
  }
  std::vector<recovery::Rational> coefficients;
  recovery::Status status =
      recovery::SolveVandermonde(selected, &coefficients);
  if (status != recovery::kOK) {
    return ToUtilStatus(status, result);
  }
  size_t degree = coefficients.size() - 1;
  for (size_t i = 0; i < coefficients.size(); i++) {
    *ostream_ << "a_" << degree - i << " = " << coefficients[i] << std::endl;
  }
  return util::Status::OK;
}

}  // namespace shamir
