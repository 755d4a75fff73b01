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

#ifndef SCRUBJOB_HH
#define SCRUBJOB_HH

#include <pdfscrub/DLL.h>
#include <pdfscrub/ForensicReport.hh>
#include <pdfscrub/Scrubber.hh>

#include <qpdf/Pipeline.hh>
#include <qpdf/QPDFLogger.hh>

#include <functional>
#include <iostream>
#include <memory>
#include <string>

namespace pdfscrub
{
    // The command-line front end as a library object. Configure it from
    // argv or through config(), then call run() and getExitCode().
    class ScrubJob
    {
      public:
        static int constexpr EXIT_CLEAN = 0;
        // Metadata detected, or the operation failed
        static int constexpr EXIT_DETECTED = 1;
        static int constexpr EXIT_USAGE = 2;

        PDFSCRUB_DLL
        ScrubJob();

        // Parse a null-terminated argument vector. argv[0] is the
        // program name. Throws ScrubUsage for invalid arguments.
        PDFSCRUB_DLL
        void initializeFromArgv(char const* const argv[]);

        class Config
        {
            friend class ScrubJob;

          public:
            // Proxy to ScrubJob::checkConfiguration()
            PDFSCRUB_DLL
            void checkConfiguration();

            PDFSCRUB_DLL
            Config* inputFile(std::string const& filename);
            PDFSCRUB_DLL
            Config* outputFile(std::string const& filename);
            PDFSCRUB_DLL
            Config* validateOnly();
            PDFSCRUB_DLL
            Config* scanSignatures();
            PDFSCRUB_DLL
            Config* quiet();
            PDFSCRUB_DLL
            Config* verbose();
            PDFSCRUB_DLL
            Config* json();
            // Between 0 and 8
            PDFSCRUB_DLL
            Config* entropyThreshold(std::string const& parameter);
            PDFSCRUB_DLL
            Config* entropyMinLength(std::string const& parameter);
            PDFSCRUB_DLL
            Config* tempDirectory(std::string const& directory);

          private:
            Config() = delete;
            Config(Config const&) = delete;
            Config(ScrubJob& job) :
                o(job)
            {
            }
            ScrubJob& o;
        };
        friend class Config;

        PDFSCRUB_DLL
        std::shared_ptr<Config> config();

        // Throws ScrubUsage if the configuration is inconsistent. run()
        // calls this first.
        PDFSCRUB_DLL
        void checkConfiguration();

        // Never throws for problems with the input file; those are
        // logged and reflected in the exit code.
        PDFSCRUB_DLL
        void run();

        PDFSCRUB_DLL
        int getExitCode() const;

        PDFSCRUB_DLL
        std::shared_ptr<QPDFLogger> getLogger();
        PDFSCRUB_DLL
        void setLogger(std::shared_ptr<QPDFLogger>);
        // Create a new logger that writes to the given streams
        PDFSCRUB_DLL
        void setOutputStreams(std::ostream* out, std::ostream* err);
        PDFSCRUB_DLL
        void setMessagePrefix(std::string const&);
        PDFSCRUB_DLL
        std::string getMessagePrefix() const;

        PDFSCRUB_DLL
        void doIfVerbose(std::function<void(Pipeline&, std::string const& prefix)> fn);

        // The pipeline settings implied by the configuration
        PDFSCRUB_DLL
        ScrubOptions getScrubOptions() const;

        PDFSCRUB_DLL
        static void
        writeTextReport(Pipeline&, ForensicReport const&, std::string const& title);
        PDFSCRUB_DLL
        static void
        writeComparison(Pipeline&, ForensicReport const& original, ForensicReport const& final);
        // One of "METADATA SUCCESSFULLY REMOVED", "NO METADATA IN
        // ORIGINAL OR FINAL", or "METADATA STILL PRESENT"
        PDFSCRUB_DLL
        static char const*
        comparisonVerdict(ForensicReport const& original, ForensicReport const& final);

        PDFSCRUB_DLL
        static std::string usageText(std::string const& whoami);

      private:
        static void usage(std::string const& msg);
        void doValidate(Scrubber&);
        void doScrub(Scrubber&);
        void doScanSignatures();
        void writeJSON(JSON const&);

        class Members
        {
            friend class ScrubJob;

          public:
            PDFSCRUB_DLL
            ~Members() = default;

          private:
            Members();
            Members(Members const&) = delete;

            std::shared_ptr<QPDFLogger> log;
            std::string message_prefix{"pdfscrub"};
            std::string infilename;
            std::string outfilename;
            bool validate_only{false};
            bool scan_signatures{false};
            bool quiet{false};
            bool verbose{false};
            bool json{false};
            bool show_version{false};
            bool show_help{false};
            double entropy_threshold{EntropyAnalyzer::default_threshold};
            size_t entropy_min_length{EntropyAnalyzer::default_min_length};
            std::string temp_dir;
            int exit_code{EXIT_CLEAN};
        };
        std::shared_ptr<Members> m;
    };
} // namespace pdfscrub

#endif // SCRUBJOB_HH
