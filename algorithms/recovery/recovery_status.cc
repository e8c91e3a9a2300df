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

#include "algorithms/recovery/recovery_status.h"

namespace shamir {
namespace recovery {

const char* StatusName(Status status) {
  switch (status) {
    case kOK:
      return "OK";
    case kDivisionByZero:
      return "DivisionByZero";
    case kNonIntegerResult:
      return "NonIntegerResult";
    case kSingularSystem:
      return "SingularSystem";
    case kNoConsistentSubset:
      return "NoConsistentSubset";
    case kWrongSubsetSize:
      return "WrongSubsetSize";
    case kUnknownKey:
      return "UnknownKey";
  }
  return "Unknown";
}

}  // namespace recovery
}  // namespace shamir
