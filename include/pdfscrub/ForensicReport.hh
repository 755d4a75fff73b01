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

#ifndef FORENSICREPORT_HH
#define FORENSICREPORT_HH

#include <pdfscrub/Constants.h>
#include <pdfscrub/DLL.h>
#include <pdfscrub/EntropyAnalyzer.hh>

#include <qpdf/JSON.hh>

#include <string>
#include <vector>

namespace pdfscrub
{
    struct MetadataFinding
    {
        pdfscrub_location_e location;
        std::string key;
        // At most excerpt_length bytes of the value, never ending inside
        // a UTF-8 character
        std::string value_excerpt;

        static constexpr size_t excerpt_length = 50;

        PDFSCRUB_DLL
        static char const* locationName(pdfscrub_location_e);
    };

    // The result of one validation check. found() is derived from the
    // recorded details, so a result never reports a finding it can't
    // show.
    class CheckResult
    {
      public:
        PDFSCRUB_DLL
        CheckResult(std::string const& name);

        PDFSCRUB_DLL
        void addFinding(
            pdfscrub_location_e location, std::string const& key, std::string const& value = "");
        PDFSCRUB_DLL
        void addHighEntropy(EntropyReport const&);
        // A check that could not run records why. The error is
        // informational; checks that must fail closed add a finding as
        // well.
        PDFSCRUB_DLL
        void setError(std::string const&);

        PDFSCRUB_DLL
        bool found() const;
        PDFSCRUB_DLL
        std::string const& getName() const;
        PDFSCRUB_DLL
        std::vector<MetadataFinding> const& getFindings() const;
        PDFSCRUB_DLL
        std::vector<EntropyReport> const& getHighEntropy() const;
        PDFSCRUB_DLL
        std::string const& getError() const;

        PDFSCRUB_DLL
        JSON getJSON() const;

      private:
        std::string name;
        std::vector<MetadataFinding> findings;
        std::vector<EntropyReport> high_entropy;
        std::string error;
    };

    // Reader health and trailer sanity. Reported alongside the verdict
    // but never part of it.
    struct StructuralReport
    {
        size_t total_pages{0};
        size_t readable_pages{0};
        std::vector<std::string> corrupted_pages;
        std::vector<std::string> missing_fonts;
        std::vector<std::string> structural_issues;

        PDFSCRUB_DLL
        bool isValid() const;
        PDFSCRUB_DLL
        JSON getJSON() const;
    };

    // Filesystem timestamps in seconds since the epoch. Informational
    // only.
    struct FileTimes
    {
        bool available{false};
        long long creation_time{0};
        long long modification_time{0};
        long long access_time{0};
        std::string error;

        PDFSCRUB_DLL
        JSON getJSON() const;
    };

    // Everything the validator learned about one file snapshot. A report
    // is immutable: the verdict is computed once, at construction.
    class ForensicReport
    {
      public:
        // Names of the checks that make up the verdict, in the order the
        // validator runs them
        static constexpr char const* check_document_info = "document_info";
        static constexpr char const* check_object_graph = "object_graph_metadata";
        static constexpr char const* check_binary_patterns = "binary_pattern_search";
        static constexpr char const* check_steganography = "steganography_detection";
        static constexpr char const* check_advanced = "advanced_metadata";

        PDFSCRUB_DLL
        ForensicReport(
            std::string const& filename,
            unsigned long long file_size,
            std::string const& sha256,
            std::vector<CheckResult> const& checks,
            StructuralReport const& structure,
            FileTimes const& file_times);

        PDFSCRUB_DLL
        std::string const& getFilename() const;
        PDFSCRUB_DLL
        unsigned long long getFileSize() const;
        // Hex-encoded SHA-256 of the bytes that were validated
        PDFSCRUB_DLL
        std::string const& getSHA256() const;

        PDFSCRUB_DLL
        std::vector<CheckResult> const& getChecks() const;
        // Throws std::logic_error if there is no check with this name
        PDFSCRUB_DLL
        CheckResult const& getCheck(std::string const& name) const;
        PDFSCRUB_DLL
        StructuralReport const& getStructure() const;
        PDFSCRUB_DLL
        FileTimes const& getFileTimes() const;

        // True if any verdict check found something
        PDFSCRUB_DLL
        bool metadataDetected() const;
        PDFSCRUB_DLL
        bool scrubbingSuccessful() const;
        PDFSCRUB_DLL
        pdfscrub_confidence_e getConfidence() const;
        // "HIGH" or "LOW"
        PDFSCRUB_DLL
        std::string getConfidenceLevel() const;

        PDFSCRUB_DLL
        JSON getJSON() const;

      private:
        std::string filename;
        unsigned long long file_size;
        std::string sha256;
        std::vector<CheckResult> checks;
        StructuralReport structure;
        FileTimes file_times;
        bool metadata_detected;
    };
} // namespace pdfscrub

#endif // FORENSICREPORT_HH
