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

#include "escaper.h"
#include <stdexcept>
#include <utility>

namespace regexkit {
namespace api {

Escaper::Escaper()
    : metacharacters_(std::make_shared<const Regex>(kMetacharacterPattern)) {}

Escaper::Escaper(std::shared_ptr<const Regex> metacharacters)
    : metacharacters_(std::move(metacharacters)) {
    if (!metacharacters_) {
        throw std::invalid_argument("Escaper: metacharacter pattern is null");
    }
}

std::string Escaper::escape(std::string_view text) const {
    std::vector<Match> matches = metacharacters_->findAll(text);
    if (matches.empty()) {
        return std::string(text);
    }

    std::string buffer;
    buffer.reserve(text.size() + matches.size());
    size_t pos = 0;

    // Matches are ordered and never overlap
    for (const Match& m : matches) {
        const text::PositionRange& range = m.wholeRange();

        buffer.append(text, pos, range.start.offset - pos);
        buffer += '\\';
        buffer.append(text, range.start.offset, range.length());

        pos = range.end.offset;
    }

    buffer.append(text, pos, std::string_view::npos);

    return buffer;
}

std::string escape(std::string_view text) {
    return Escaper().escape(text);
}

}  // namespace api
}  // namespace regexkit
