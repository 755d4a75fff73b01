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

#ifndef STRUCTURALSANITIZER_HH
#define STRUCTURALSANITIZER_HH

#include <pdfscrub/DLL.h>
#include <pdfscrub/DocumentModel.hh>

#include <string>
#include <vector>

namespace pdfscrub
{
    // Outcome of touching one dictionary field
    enum class FieldResult {
        absent,   // the field was not there
        kept,     // present and left alone
        removed,  // deleted
        replaced, // overwritten with a generic placeholder
        skipped,  // the backend refused; see SanitizeStats::skipped
    };

    struct SanitizeStats
    {
        size_t fields_removed{0};
        size_t fields_replaced{0};
        size_t fields_skipped{0};
        size_t annotations_dropped{0};
        // True if the post-save byte pass blanked any vendor token
        bool signatures_blanked{false};
        // One "object key: reason" line per skipped field
        std::vector<std::string> skipped;
    };

    // Removes metadata-bearing structures from an open Document. Every
    // pass is idempotent. Failures to touch an individual field are
    // recorded in the statistics and never interrupt a pass.
    class StructuralSanitizer
    {
      public:
        PDFSCRUB_DLL
        StructuralSanitizer() = default;

        // Delete document information entries one key at a time. The
        // dictionary itself stays in place.
        PDFSCRUB_DLL
        void clearDocInfo(Document&);
        PDFSCRUB_DLL
        void clearXmpMetadata(Document&);
        PDFSCRUB_DLL
        void stripPageMetadata(Document&);
        // Scripts, embedded files, multimedia and similar entries in the
        // document catalog and in its /Names tree
        PDFSCRUB_DLL
        void removeDangerousObjects(Document&);
        PDFSCRUB_DLL
        void filterAnnotations(Document&);
        PDFSCRUB_DLL
        void sanitizeFonts(Document&);
        PDFSCRUB_DLL
        void removeFormsAndOutlines(Document&);
        // Drop /Info and /ID from the trailer
        PDFSCRUB_DLL
        void removeTrailerInfo(Document&);

        // All of the above, in order
        PDFSCRUB_DLL
        void sanitize(Document&);

        // Open input, sanitize it, serialize it, blank the narrow vendor
        // token list in the serialized bytes, and write the result to
        // output. A parse failure propagates as ScrubError with
        // pdfscrub_e_parse. Any failure after that throws ScrubError
        // with pdfscrub_e_sanitization, and output does not exist
        // afterwards.
        PDFSCRUB_DLL
        void sanitizeFile(
            DocumentModel&, std::string const& input, std::string const& output);

        // Field primitives used by the passes. Each returns what it did
        // and never throws for backend failures.
        PDFSCRUB_DLL
        FieldResult removeField(NodePtr node, std::string const& key);
        PDFSCRUB_DLL
        FieldResult replaceWithName(NodePtr node, std::string const& key, std::string const& name);
        PDFSCRUB_DLL
        FieldResult
        replaceWithString(NodePtr node, std::string const& key, std::string const& value);

        PDFSCRUB_DLL
        SanitizeStats const& getStats() const;
        PDFSCRUB_DLL
        void resetStats();

        // Annotation subtypes that survive filterAnnotations
        PDFSCRUB_DLL
        static std::vector<std::string> const& safeAnnotationSubtypes();
        // Root and /Names keys removed by removeDangerousObjects
        PDFSCRUB_DLL
        static std::vector<std::string> const& dangerousKeys();
        // Page keys removed by stripPageMetadata
        PDFSCRUB_DLL
        static std::vector<std::string> const& pageMetadataKeys();
        // Fields stripped from annotations that are kept
        PDFSCRUB_DLL
        static std::vector<std::string> const& annotationMetadataKeys();
        // Lower-case vendor and typeface terms that mark a font field as
        // attribution-bearing. The extended list, used on font
        // dictionaries, also matches "symbol" and "courier".
        PDFSCRUB_DLL
        static std::vector<std::string> const& fontTerms();
        PDFSCRUB_DLL
        static std::vector<std::string> const& extendedFontTerms();

      private:
        FieldResult skip(NodePtr node, std::string const& key, std::string const& reason);
        FieldResult count(FieldResult);
        void sanitizeFontDictionary(NodePtr font);
        void sanitizeFontDescriptor(NodePtr descriptor);
        bool readField(NodePtr node, std::string const& key, std::string& value);
        // node's value for key, or nullptr if it is absent or can't be
        // read. A read failure is counted as a skip.
        NodePtr lookup(NodePtr node, std::string const& key);

        SanitizeStats stats;
    };
} // namespace pdfscrub

#endif // STRUCTURALSANITIZER_HH
