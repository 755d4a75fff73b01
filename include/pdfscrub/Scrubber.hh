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

#ifndef SCRUBBER_HH
#define SCRUBBER_HH

#include <pdfscrub/Constants.h>
#include <pdfscrub/DLL.h>
#include <pdfscrub/DocumentModel.hh>
#include <pdfscrub/EntropyAnalyzer.hh>
#include <pdfscrub/ForensicReport.hh>
#include <pdfscrub/ScrubStrategy.hh>

#include <qpdf/Pipeline.hh>
#include <qpdf/QPDFLogger.hh>

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace pdfscrub
{
    struct ScrubOptions
    {
        double entropy_threshold{EntropyAnalyzer::default_threshold};
        size_t entropy_min_length{EntropyAnalyzer::default_min_length};
        // Directory for intermediate candidates
        std::string temp_dir{"/tmp"};
        bool verbose{false};
        bool quiet{false};
        std::string message_prefix{"pdfscrub"};
        // QPDFLogger::defaultLogger() if not set
        std::shared_ptr<QPDFLogger> logger;
    };

    struct ScrubResult
    {
        bool success{false};
        pdfscrub_error_code_e error_code{pdfscrub_e_success};
        std::string error_message;
        // Name of the strategy whose candidate was accepted
        std::string strategy;
        std::string output_path;
        std::shared_ptr<ForensicReport> original_report;
        std::shared_ptr<ForensicReport> final_report;
    };

    class TempFileSet;

    // Runs strategies in priority order, sanitizes and validates each
    // candidate, and installs the first one that validates clean.
    class Scrubber
    {
      public:
        enum class State {
            init,
            analyzing_original,
            trying_strategy,
            sanitizing,
            validating,
            next_strategy,
            accepted,
            all_failed,
        };

        // Uses defaultStrategies(model)
        PDFSCRUB_DLL
        Scrubber(std::shared_ptr<DocumentModel> model, ScrubOptions const& options = ScrubOptions());
        PDFSCRUB_DLL
        Scrubber(
            std::shared_ptr<DocumentModel> model,
            ScrubOptions const& options,
            std::vector<std::shared_ptr<ScrubStrategy>> const& strategies);

        // Scrub input into output, or into defaultOutputPath(input) if
        // output is empty. Parse, write and sanitization failures move
        // on to the next strategy and are not reported individually. On
        // failure, error_code and error_message say why and output was
        // not created. Intermediate files are removed before returning
        // on every path. Throws std::runtime_error only if no
        // intermediate file can be created.
        PDFSCRUB_DLL
        ScrubResult scrub(std::string const& input, std::string const& output = "");

        // Throws ScrubError with pdfscrub_e_input_not_found if path
        // can't be read.
        PDFSCRUB_DLL
        std::shared_ptr<ForensicReport> validateOnly(std::string const& path);

        // "<stem>_scrubbed<ext>" next to input
        PDFSCRUB_DLL
        static std::string defaultOutputPath(std::string const& input);

        PDFSCRUB_DLL
        static char const* stateName(State);

        // Called with each state scrub() enters
        PDFSCRUB_DLL
        void registerStateObserver(std::function<void(State)>);

        // Call fn with the info pipeline and message prefix if verbose
        // is set
        PDFSCRUB_DLL
        void doIfVerbose(std::function<void(Pipeline&, std::string const& prefix)> fn);

      private:
        void enter(State);
        void info(std::string const& msg);
        void warn(std::string const& msg);
        void logRejection(std::string const& strategy, ForensicReport const&);
        void installOutput(std::string const& candidate, std::string const& output);
        // Set path to a new intermediate file. On failure, record the
        // error in result and return false.
        bool createTemp(TempFileSet&, std::string& path, ScrubResult& result);

        std::shared_ptr<DocumentModel> model;
        ScrubOptions options;
        std::vector<std::shared_ptr<ScrubStrategy>> strategies;
        std::shared_ptr<QPDFLogger> log;
        std::function<void(State)> state_observer;
    };
} // namespace pdfscrub

#endif // SCRUBBER_HH
