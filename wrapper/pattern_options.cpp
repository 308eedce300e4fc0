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

#include "pattern_options.h"
#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

namespace regexkit {
namespace api {

RE2::Options PatternOptions::toRE2Options() const {
    RE2::Options opts;

    opts.set_posix_syntax(posix_syntax);
    opts.set_longest_match(longest_match);
    opts.set_log_errors(log_errors);
    opts.set_literal(literal);
    opts.set_never_nl(never_nl);
    opts.set_dot_nl(dot_nl);
    opts.set_never_capture(never_capture);
    opts.set_case_sensitive(case_sensitive);
    opts.set_perl_classes(perl_classes);
    opts.set_word_boundary(word_boundary);
    opts.set_one_line(one_line);
    opts.set_encoding(utf8 ? RE2::Options::EncodingUTF8 : RE2::Options::EncodingLatin1);
    opts.set_max_mem(max_mem);

    return opts;
}

PatternOptions PatternOptions::fromRE2Options(const RE2::Options& opts) {
    PatternOptions out;

    out.posix_syntax = opts.posix_syntax();
    out.longest_match = opts.longest_match();
    out.log_errors = opts.log_errors();
    out.literal = opts.literal();
    out.never_nl = opts.never_nl();
    out.dot_nl = opts.dot_nl();
    out.never_capture = opts.never_capture();
    out.case_sensitive = opts.case_sensitive();
    out.perl_classes = opts.perl_classes();
    out.word_boundary = opts.word_boundary();
    out.one_line = opts.one_line();
    out.utf8 = opts.encoding() == RE2::Options::EncodingUTF8;
    out.max_mem = opts.max_mem();

    return out;
}

PatternOptions PatternOptions::fromJson(const std::string& json_str) {
    if (json_str.empty()) {
        return defaults();
    }

    try {
        json j = json::parse(json_str);

        PatternOptions opts = defaults();

        // Parse each field (all optional)
        if (j.contains("case_sensitive"))  opts.case_sensitive = j["case_sensitive"].get<bool>();
        if (j.contains("posix_syntax"))    opts.posix_syntax = j["posix_syntax"].get<bool>();
        if (j.contains("longest_match"))   opts.longest_match = j["longest_match"].get<bool>();
        if (j.contains("log_errors"))      opts.log_errors = j["log_errors"].get<bool>();
        if (j.contains("literal"))         opts.literal = j["literal"].get<bool>();
        if (j.contains("never_nl"))        opts.never_nl = j["never_nl"].get<bool>();
        if (j.contains("dot_nl"))          opts.dot_nl = j["dot_nl"].get<bool>();
        if (j.contains("never_capture"))   opts.never_capture = j["never_capture"].get<bool>();
        if (j.contains("perl_classes"))    opts.perl_classes = j["perl_classes"].get<bool>();
        if (j.contains("word_boundary"))   opts.word_boundary = j["word_boundary"].get<bool>();
        if (j.contains("one_line"))        opts.one_line = j["one_line"].get<bool>();
        if (j.contains("max_mem"))         opts.max_mem = j["max_mem"].get<int64_t>();

        // Encoding (accept "UTF8" or "Latin1" string)
        if (j.contains("encoding")) {
            std::string encoding = j["encoding"].get<std::string>();
            if (encoding == "UTF8") {
                opts.utf8 = true;
            } else if (encoding == "Latin1") {
                opts.utf8 = false;
            } else {
                throw std::runtime_error("Invalid options JSON: unknown encoding '" + encoding + "'");
            }
        }

        if (opts.max_mem <= 0) {
            throw std::runtime_error("Invalid options JSON: max_mem must be > 0");
        }

        return opts;

    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid options JSON: ") + e.what());
    }
}

std::string PatternOptions::toJson() const {
    json j;

    j["case_sensitive"] = case_sensitive;
    j["encoding"] = utf8 ? "UTF8" : "Latin1";
    j["posix_syntax"] = posix_syntax;
    j["longest_match"] = longest_match;
    j["log_errors"] = log_errors;
    j["literal"] = literal;
    j["never_nl"] = never_nl;
    j["dot_nl"] = dot_nl;
    j["never_capture"] = never_capture;
    j["perl_classes"] = perl_classes;
    j["word_boundary"] = word_boundary;
    j["one_line"] = one_line;
    j["max_mem"] = max_mem;

    return j.dump(2);
}

PatternOptions PatternOptions::defaults() {
    PatternOptions opts;
    // All fields already initialized with defaults in struct definition
    return opts;
}

PatternOptions PatternOptions::fromCaseSensitive(bool case_sensitive) {
    PatternOptions opts = defaults();
    opts.case_sensitive = case_sensitive;
    return opts;
}

}  // namespace api
}  // namespace regexkit
