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

#ifndef FORENSICVALIDATOR_HH
#define FORENSICVALIDATOR_HH

#include <pdfscrub/DLL.h>
#include <pdfscrub/DocumentModel.hh>
#include <pdfscrub/EntropyAnalyzer.hh>
#include <pdfscrub/ForensicReport.hh>

#include <memory>
#include <string>
#include <vector>

namespace pdfscrub
{
    // Runs the forensic checks against one file and builds a
    // ForensicReport. Each check opens the file on its own, so a check
    // never sees state left behind by another.
    class ForensicValidator
    {
      public:
        PDFSCRUB_DLL
        ForensicValidator(
            std::shared_ptr<DocumentModel> model, EntropyAnalyzer const& analyzer = EntropyAnalyzer());

        // Throws ScrubError with pdfscrub_e_input_not_found if filename
        // can't be read. Failures inside individual checks are recorded
        // in the report instead.
        PDFSCRUB_DLL
        std::shared_ptr<ForensicReport> validate(std::string const& filename);

        // Document information values and the catalog's XMP stream, as
        // reported by the document information accessor. If the file
        // can't be opened the check records a finding so that an
        // unreadable file is never judged clean.
        PDFSCRUB_DLL
        CheckResult checkDocumentInfo(std::string const& filename);

        // The same question answered by walking every object in the file
        // and by looking at each page, independent of the trailer. Fails
        // closed like checkDocumentInfo.
        PDFSCRUB_DLL
        CheckResult checkObjectGraph(std::string const& filename);

        // Metadata key names and XMP packet markers anywhere in the raw
        // bytes
        PDFSCRUB_DLL
        CheckResult checkBinaryPatterns(std::string const& data);

        // Decoded stream data whose entropy marks it as a possible
        // hidden payload
        PDFSCRUB_DLL
        CheckResult checkSteganography(std::string const& filename);

        // Page-level metadata keys, annotation metadata, vendor font
        // names, and the Adobe signature in the raw bytes
        PDFSCRUB_DLL
        CheckResult checkAdvancedMetadata(std::string const& filename, std::string const& data);

        PDFSCRUB_DLL
        StructuralReport checkStructure(std::string const& filename);

        PDFSCRUB_DLL
        static FileTimes captureFileTimes(std::string const& filename);

        // Hex-encoded SHA-256 digest
        PDFSCRUB_DLL
        static std::string sha256(std::string const& data);

        PDFSCRUB_DLL
        static std::vector<std::string> const& binaryPatterns();

        PDFSCRUB_DLL
        EntropyAnalyzer const& getAnalyzer() const;

      private:
        std::shared_ptr<DocumentModel> model;
        EntropyAnalyzer analyzer;
    };
} // namespace pdfscrub

#endif // FORENSICVALIDATOR_HH
