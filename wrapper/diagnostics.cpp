/*
 * Copyright 2025 AxonOps
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "diagnostics.h"
#include <cstdlib>
#include <iostream>

namespace regexkit {
namespace diag {

void engineContractViolation(const char* where, const std::string& message) {
    std::cerr << "REGEXKIT FATAL: " << where << ": engine contract violation: "
              << message << std::endl;
    std::abort();
}

void warning(const char* where, const std::string& message) {
    std::cerr << "REGEXKIT WARNING: " << where << ": " << message << std::endl;
}

}  // namespace diag
}  // namespace regexkit
