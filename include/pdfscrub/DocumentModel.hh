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

#ifndef DOCUMENTMODEL_HH
#define DOCUMENTMODEL_HH

#include <pdfscrub/DLL.h>

#include <memory>
#include <set>
#include <string>
#include <vector>

// These interfaces are the only way the scrubbing pipeline touches a
// document. Keys are opaque strings spelled the way the format spells
// them ("/Producer"); nothing above this layer depends on how a backend
// identifies or stores objects. QPDFDocumentModel.hh provides the
// libqpdf implementation.

namespace pdfscrub
{
    class DocumentNode;
    using NodePtr = std::shared_ptr<DocumentNode>;

    // A node in a document's object graph: a dictionary, array, stream,
    // or scalar. Dictionary methods also work on a stream's dictionary.
    // Nodes are only valid while the Document they came from is alive.
    class PDFSCRUB_DLL_CLASS DocumentNode
    {
      public:
        PDFSCRUB_DLL
        virtual ~DocumentNode() = default;

        virtual bool isDictionary() = 0;
        virtual bool isArray() = 0;
        virtual bool isStream() = 0;

        // Human-readable identity such as "12 0 R", for reports
        virtual std::string describe() = 0;

        // Names are returned with their leading "/", strings as UTF-8,
        // anything else in its serialized form.
        virtual std::string getText() = 0;

        virtual std::set<std::string> getKeys() = 0;
        virtual bool hasKey(std::string const& key) = 0;
        // Returns nullptr if the key is absent
        virtual NodePtr getKey(std::string const& key) = 0;
        virtual void removeKey(std::string const& key) = 0;
        virtual void replaceKeyWithName(std::string const& key, std::string const& name) = 0;
        virtual void replaceKeyWithString(std::string const& key, std::string const& value) = 0;
        // Replace key's value with a new array holding items, which must
        // come from the same document
        virtual void
        replaceKeyWithArray(std::string const& key, std::vector<NodePtr> const& items) = 0;

        // Array items; empty if this is not an array
        virtual std::vector<NodePtr> getItems() = 0;

        // For streams, set data to the decoded stream bytes and return
        // true. Return false if this is not a stream or its data can't be
        // decoded.
        virtual bool readData(std::string& data) = 0;
    };

    // An open document. A Document exclusively owns its session; closing
    // it (destroying the object) discards any unsaved changes.
    class PDFSCRUB_DLL_CLASS Document
    {
      public:
        PDFSCRUB_DLL
        virtual ~Document() = default;

        virtual std::string getFilename() = 0;

        // Pages in document order
        virtual std::vector<NodePtr> getPages() = 0;
        // Append a copy of a page, which may belong to another Document
        // from the same model, and return the copy.
        virtual NodePtr appendPage(NodePtr page) = 0;

        virtual NodePtr getRoot() = 0;
        virtual NodePtr getTrailer() = 0;
        // Returns nullptr if there is no document information dictionary
        virtual NodePtr getDocInfo() = 0;
        // Return the document information dictionary, creating an empty
        // one if there is none
        virtual NodePtr makeDocInfo() = 0;
        // Returns nullptr if the document has no XMP metadata stream
        virtual NodePtr openXmpMetadata() = 0;

        // Every object in the document's cross-reference table
        virtual std::vector<NodePtr> getAllObjects() = 0;

        // Tokenize the content streams of page. Returns false and sets
        // error if the content could not be read cleanly.
        virtual bool checkPageContents(NodePtr page, std::string& error) = 0;

        // Serialize the document. Both throw ScrubError with
        // pdfscrub_e_write on failure.
        virtual void save(std::string const& filename) = 0;
        virtual std::string saveToMemory() = 0;
    };

    class PDFSCRUB_DLL_CLASS DocumentModel
    {
      public:
        PDFSCRUB_DLL
        virtual ~DocumentModel() = default;

        // Throws ScrubError with pdfscrub_e_parse if filename can't be
        // opened as a document.
        virtual std::unique_ptr<Document> open(std::string const& filename) = 0;
        virtual std::unique_ptr<Document> newEmpty() = 0;
    };
} // namespace pdfscrub

#endif // DOCUMENTMODEL_HH
