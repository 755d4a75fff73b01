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

#ifndef SCRUBERROR_HH
#define SCRUBERROR_HH

#include <pdfscrub/Constants.h>
#include <pdfscrub/DLL.h>

#include <stdexcept>
#include <string>

namespace pdfscrub
{
    class PDFSCRUB_DLL_CLASS ScrubError: public std::runtime_error
    {
      public:
        PDFSCRUB_DLL
        ScrubError(
            pdfscrub_error_code_e error_code,
            std::string const& filename,
            std::string const& message);
        PDFSCRUB_DLL
        ~ScrubError() noexcept override = default;

        // what() returns "filename: message". The accessors return the
        // values the exception was created with. The filename may be
        // empty when the failure is not tied to one file.
        PDFSCRUB_DLL
        pdfscrub_error_code_e getErrorCode() const;
        PDFSCRUB_DLL
        std::string const& getFilename() const;
        PDFSCRUB_DLL
        std::string const& getMessageDetail() const;

        // Short symbolic name for an error code, used in reports and
        // in log lines ("ParseError", "AllMethodsFailed", ...)
        PDFSCRUB_DLL
        static char const* codeName(pdfscrub_error_code_e);

      private:
        static std::string
        createWhat(std::string const& filename, std::string const& message);

        pdfscrub_error_code_e error_code;
        std::string filename;
        std::string message;
    };

    // Thrown by ScrubJob for command-line and configuration errors.
    class PDFSCRUB_DLL_CLASS ScrubUsage: public std::runtime_error
    {
      public:
        PDFSCRUB_DLL
        ScrubUsage(std::string const& msg);
        PDFSCRUB_DLL
        ~ScrubUsage() noexcept override = default;
    };
} // namespace pdfscrub

#endif // SCRUBERROR_HH
