// Copyright (c) 2026 The pdfscrub Authors
//
// This file is part of pdfscrub.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef SIGNATURESCANNER_HH
#define SIGNATURESCANNER_HH

#include <pdfscrub/DLL.h>

#include <string>
#include <vector>

namespace pdfscrub
{
    // Byte-level removal of attribution signatures from a serialized
    // document. Every substitution replaces a token with the same
    // number of spaces so the length of the buffer, and therefore every
    // byte offset recorded inside it, is unchanged.
    class SignatureScanner
    {
      public:
        // Uses vendorTokens() and metadataKeys()
        PDFSCRUB_DLL
        SignatureScanner();
        PDFSCRUB_DLL
        SignatureScanner(
            std::vector<std::string> const& tokens,
            std::vector<std::string> const& keys = metadataKeys());

        // Replace every occurrence of every token, anywhere in data.
        // Tokens match exactly; case variants must be listed
        // separately (see caseVariants). Returns true if anything was
        // replaced.
        PDFSCRUB_DLL
        bool scanUnscoped(std::string& data) const;

        // For each occurrence of each metadata key, find the key's value
        // span with findValueEnd and blank out vendor tokens inside that
        // span only. Matching inside a span is case-insensitive. Returns
        // true if anything was replaced.
        PDFSCRUB_DLL
        bool scanScoped(std::string& data) const;

        // Return the offset one past the end of the value that starts at
        // start. Outside of a literal string, the value ends before "/"
        // or ">>". A literal string starts at "(" and ends at the ")"
        // that brings nesting back to zero; delimiters and escaped
        // characters inside it are ignored. A value that does not end
        // runs to the end of data.
        PDFSCRUB_DLL
        static size_t findValueEnd(std::string const& data, size_t start);

        // The as-written, upper case, and lower case forms of term,
        // without duplicates
        PDFSCRUB_DLL
        static std::vector<std::string> caseVariants(std::string const& term);

        // Case variants of every known vendor/product name
        PDFSCRUB_DLL
        static std::vector<std::string> vendorTokens();

        // Only the Adobe variants. Applied unconditionally to sanitized
        // output because, unlike the full list, none of them collide
        // with PDF syntax keywords.
        PDFSCRUB_DLL
        static std::vector<std::string> narrowVendorTokens();

        // Document information keys whose values are scanned by
        // scanScoped
        PDFSCRUB_DLL
        static std::vector<std::string> metadataKeys();

      private:
        size_t blankTokensInSpan(std::string& data, size_t begin, size_t end) const;

        std::vector<std::string> tokens;
        std::vector<std::string> keys;
    };
} // namespace pdfscrub

#endif // SIGNATURESCANNER_HH
