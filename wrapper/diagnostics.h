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

#pragma once

#include <string>

namespace regexkit {
namespace diag {

/**
 * Report a broken engine invariant and abort the process.
 *
 * Used only for conditions that mean RE2 (or the adapter around it) handed us
 * impossible data: an overall match reported as unset, offsets past the end of
 * the subject, an offset in the middle of a code point. These are never
 * recoverable, so nothing is thrown.
 *
 * @param where component reporting the violation (e.g. "PositionMapper")
 * @param message description of the violated invariant
 */
[[noreturn]] void engineContractViolation(const char* where, const std::string& message);

/**
 * Write a non-fatal warning to stderr.
 *
 * @param where component reporting the warning
 * @param message warning text
 */
void warning(const char* where, const std::string& message);

}  // namespace diag
}  // namespace regexkit
