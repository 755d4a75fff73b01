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

#ifndef SCRUBSTRATEGY_HH
#define SCRUBSTRATEGY_HH

#include <pdfscrub/DLL.h>
#include <pdfscrub/DocumentModel.hh>

#include <memory>
#include <string>
#include <vector>

namespace pdfscrub
{
    // One way of producing a metadata-free candidate from an input
    // document. Success only means a candidate was written; whether it is
    // actually clean is for ForensicValidator to decide.
    class PDFSCRUB_DLL_CLASS ScrubStrategy
    {
      public:
        PDFSCRUB_DLL
        virtual ~ScrubStrategy() = default;

        virtual std::string getName() const = 0;

        // Write a candidate for input to output. Throws ScrubError on
        // failure, in which case output may or may not exist.
        virtual void apply(std::string const& input, std::string const& output) = 0;
    };

    // Copy every page into a brand new document. Nothing from the
    // input's trailer or cross-reference table survives.
    class ReconstructStrategy: public ScrubStrategy
    {
      public:
        PDFSCRUB_DLL
        ReconstructStrategy(std::shared_ptr<DocumentModel>);
        PDFSCRUB_DLL
        std::string getName() const override;
        PDFSCRUB_DLL
        void apply(std::string const& input, std::string const& output) override;

      private:
        std::shared_ptr<DocumentModel> model;
    };

    // Remove metadata from the input in place, keeping its object
    // numbering.
    class StructuralClearStrategy: public ScrubStrategy
    {
      public:
        PDFSCRUB_DLL
        StructuralClearStrategy(std::shared_ptr<DocumentModel>);
        PDFSCRUB_DLL
        std::string getName() const override;
        PDFSCRUB_DLL
        void apply(std::string const& input, std::string const& output) override;

        // Catalog keys removed in addition to the per-page and document
        // information passes
        PDFSCRUB_DLL
        static std::vector<std::string> const& rootMetadataKeys();

      private:
        std::shared_ptr<DocumentModel> model;
    };

    // Copy the pages into a fresh document whose information dictionary
    // is explicitly empty.
    class MinimalRewriteStrategy: public ScrubStrategy
    {
      public:
        PDFSCRUB_DLL
        MinimalRewriteStrategy(std::shared_ptr<DocumentModel>);
        PDFSCRUB_DLL
        std::string getName() const override;
        PDFSCRUB_DLL
        void apply(std::string const& input, std::string const& output) override;

      private:
        std::shared_ptr<DocumentModel> model;
    };

    // Reconstruct, structural-clear, minimal-rewrite, in that order
    PDFSCRUB_DLL
    std::vector<std::shared_ptr<ScrubStrategy>>
    defaultStrategies(std::shared_ptr<DocumentModel>);
} // namespace pdfscrub

#endif // SCRUBSTRATEGY_HH
