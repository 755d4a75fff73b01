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

#ifndef QPDFDOCUMENTMODEL_HH
#define QPDFDOCUMENTMODEL_HH

#include <pdfscrub/DocumentModel.hh>

#include <qpdf/QPDFLogger.hh>

namespace pdfscrub
{
    // DocumentModel backed by libqpdf. Documents are opened with
    // libqpdf warnings suppressed; damage that libqpdf recovers from
    // shows up as warnings counted by checkPageContents instead of
    // being written to the logger.
    class QPDFDocumentModel: public DocumentModel
    {
      public:
        PDFSCRUB_DLL
        QPDFDocumentModel() = default;
        PDFSCRUB_DLL
        ~QPDFDocumentModel() override = default;

        PDFSCRUB_DLL
        std::unique_ptr<Document> open(std::string const& filename) override;
        PDFSCRUB_DLL
        std::unique_ptr<Document> newEmpty() override;

        // Logger handed to every QPDF object this model creates. If not
        // set, QPDF uses the default logger.
        PDFSCRUB_DLL
        void setLogger(std::shared_ptr<QPDFLogger>);

      private:
        std::shared_ptr<QPDFLogger> logger;
    };
} // namespace pdfscrub

#endif // QPDFDOCUMENTMODEL_HH
