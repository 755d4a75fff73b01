#include <pdfscrub/QPDFDocumentModel.hh>

#include <pdfscrub/ScrubError.hh>

#include <qpdf/Buffer.hh>
#include <qpdf/Pl_String.hh>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFExc.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <qpdf/QPDFWriter.hh>

#include <cstdio>
#include <stdexcept>

using namespace pdfscrub;

namespace
{
    // Nodes hold a reference to their QPDF so that a node outliving its
    // Document reads a valid (if detached) object instead of a destroyed
    // one.
    class QPDFNode: public DocumentNode
    {
      public:
        QPDFNode(std::shared_ptr<QPDF> qpdf, QPDFObjectHandle oh);
        ~QPDFNode() override = default;

        bool isDictionary() override;
        bool isArray() override;
        bool isStream() override;
        std::string describe() override;
        std::string getText() override;
        std::set<std::string> getKeys() override;
        bool hasKey(std::string const& key) override;
        NodePtr getKey(std::string const& key) override;
        void removeKey(std::string const& key) override;
        void replaceKeyWithName(std::string const& key, std::string const& name) override;
        void replaceKeyWithString(std::string const& key, std::string const& value) override;
        void
        replaceKeyWithArray(std::string const& key, std::vector<NodePtr> const& items) override;
        std::vector<NodePtr> getItems() override;
        bool readData(std::string& data) override;

        QPDFObjectHandle getObjectHandle() const;
        QPDF* getOwner() const;

      private:
        QPDFObjectHandle dict();
        QPDFObjectHandle checkedDict(char const* method);

        std::shared_ptr<QPDF> qpdf;
        QPDFObjectHandle oh;
    };

    class QPDFDocument: public Document
    {
      public:
        QPDFDocument(std::shared_ptr<QPDF> qpdf, std::string const& filename);
        ~QPDFDocument() override = default;

        std::string getFilename() override;
        std::vector<NodePtr> getPages() override;
        NodePtr appendPage(NodePtr page) override;
        NodePtr getRoot() override;
        NodePtr getTrailer() override;
        NodePtr getDocInfo() override;
        NodePtr makeDocInfo() override;
        NodePtr openXmpMetadata() override;
        std::vector<NodePtr> getAllObjects() override;
        bool checkPageContents(NodePtr page, std::string& error) override;
        void save(std::string const& filename) override;
        std::string saveToMemory() override;

      private:
        NodePtr node(QPDFObjectHandle oh);
        std::shared_ptr<QPDFNode> ownNode(NodePtr n, char const* method);
        void configureWriter(QPDFWriter& w);

        std::shared_ptr<QPDF> qpdf;
        std::string filename;
    };

    // Content is only tokenized; the objects themselves are not needed.
    class ContentChecker: public QPDFObjectHandle::ParserCallbacks
    {
      public:
        ~ContentChecker() override = default;
        void handleObject(QPDFObjectHandle, size_t offset, size_t length) override;
        void handleEOF() override;

        size_t objects{0};
        bool saw_eof{false};
    };
} // namespace

QPDFNode::QPDFNode(std::shared_ptr<QPDF> qpdf, QPDFObjectHandle oh) :
    qpdf(qpdf),
    oh(oh)
{
}

QPDFObjectHandle
QPDFNode::getObjectHandle() const
{
    return this->oh;
}

QPDF*
QPDFNode::getOwner() const
{
    return this->qpdf.get();
}

QPDFObjectHandle
QPDFNode::dict()
{
    return this->oh.isStream() ? this->oh.getDict() : this->oh;
}

QPDFObjectHandle
QPDFNode::checkedDict(char const* method)
{
    auto d = dict();
    if (!d.isDictionary()) {
        throw std::runtime_error(
            std::string(method) + " called on " + this->oh.getTypeName() + " " + describe());
    }
    return d;
}

bool
QPDFNode::isDictionary()
{
    return this->oh.isDictionary();
}

bool
QPDFNode::isArray()
{
    return this->oh.isArray();
}

bool
QPDFNode::isStream()
{
    return this->oh.isStream();
}

std::string
QPDFNode::describe()
{
    if (this->oh.isIndirect()) {
        return this->oh.getObjGen().unparse(' ') + " R";
    }
    return std::string("direct ") + this->oh.getTypeName();
}

std::string
QPDFNode::getText()
{
    if (this->oh.isName()) {
        return this->oh.getName();
    } else if (this->oh.isString()) {
        return this->oh.getUTF8Value();
    } else if (this->oh.isStream()) {
        return describe();
    }
    return this->oh.unparse();
}

std::set<std::string>
QPDFNode::getKeys()
{
    auto d = dict();
    if (!d.isDictionary()) {
        return {};
    }
    return d.getKeys();
}

bool
QPDFNode::hasKey(std::string const& key)
{
    auto d = dict();
    return d.isDictionary() && d.hasKey(key);
}

NodePtr
QPDFNode::getKey(std::string const& key)
{
    if (!hasKey(key)) {
        return nullptr;
    }
    return std::make_shared<QPDFNode>(this->qpdf, dict().getKey(key));
}

void
QPDFNode::removeKey(std::string const& key)
{
    checkedDict("removeKey").removeKey(key);
}

void
QPDFNode::replaceKeyWithName(std::string const& key, std::string const& name)
{
    checkedDict("replaceKeyWithName").replaceKey(key, QPDFObjectHandle::newName(name));
}

void
QPDFNode::replaceKeyWithString(std::string const& key, std::string const& value)
{
    checkedDict("replaceKeyWithString").replaceKey(key, QPDFObjectHandle::newUnicodeString(value));
}

void
QPDFNode::replaceKeyWithArray(std::string const& key, std::vector<NodePtr> const& items)
{
    auto d = checkedDict("replaceKeyWithArray");
    std::vector<QPDFObjectHandle> handles;
    for (auto const& item: items) {
        auto qn = std::dynamic_pointer_cast<QPDFNode>(item);
        if (!(qn && (qn->getOwner() == getOwner()))) {
            throw std::logic_error(
                "QPDFNode::replaceKeyWithArray: item does not belong to this document");
        }
        handles.push_back(qn->getObjectHandle());
    }
    d.replaceKey(key, QPDFObjectHandle::newArray(handles));
}

std::vector<NodePtr>
QPDFNode::getItems()
{
    std::vector<NodePtr> result;
    if (this->oh.isArray()) {
        for (auto const& item: this->oh.getArrayAsVector()) {
            result.push_back(std::make_shared<QPDFNode>(this->qpdf, item));
        }
    }
    return result;
}

bool
QPDFNode::readData(std::string& data)
{
    if (!this->oh.isStream()) {
        return false;
    }
    try {
        auto buf = this->oh.getStreamData(qpdf_dl_generalized);
        data.assign(reinterpret_cast<char const*>(buf->getBuffer()), buf->getSize());
    } catch (std::exception&) {
        // Filters we can't decode (images with specialized compression,
        // damaged streams) have no readable data.
        return false;
    }
    return true;
}

void
ContentChecker::handleObject(QPDFObjectHandle, size_t, size_t)
{
    ++this->objects;
}

void
ContentChecker::handleEOF()
{
    this->saw_eof = true;
}

QPDFDocument::QPDFDocument(std::shared_ptr<QPDF> qpdf, std::string const& filename) :
    qpdf(qpdf),
    filename(filename)
{
}

NodePtr
QPDFDocument::node(QPDFObjectHandle oh)
{
    return std::make_shared<QPDFNode>(this->qpdf, oh);
}

std::shared_ptr<QPDFNode>
QPDFDocument::ownNode(NodePtr n, char const* method)
{
    auto qn = std::dynamic_pointer_cast<QPDFNode>(n);
    if (!qn) {
        throw std::logic_error(
            std::string("QPDFDocument::") + method +
            ": node was not created by QPDFDocumentModel");
    }
    return qn;
}

std::string
QPDFDocument::getFilename()
{
    return this->filename;
}

std::vector<NodePtr>
QPDFDocument::getPages()
{
    std::vector<NodePtr> result;
    for (auto& page: QPDFPageDocumentHelper(*this->qpdf).getAllPages()) {
        result.push_back(node(page.getObjectHandle()));
    }
    return result;
}

NodePtr
QPDFDocument::appendPage(NodePtr page)
{
    auto qn = ownNode(page, "appendPage");
    QPDFPageDocumentHelper dh(*this->qpdf);
    // addPage copies pages that belong to another QPDF.
    dh.addPage(QPDFPageObjectHelper(qn->getObjectHandle()), false);
    return node(dh.getAllPages().back().getObjectHandle());
}

NodePtr
QPDFDocument::getRoot()
{
    return node(this->qpdf->getRoot());
}

NodePtr
QPDFDocument::getTrailer()
{
    return node(this->qpdf->getTrailer());
}

NodePtr
QPDFDocument::getDocInfo()
{
    auto info = this->qpdf->getTrailer().getKey("/Info");
    if (!info.isDictionary()) {
        return nullptr;
    }
    return node(info);
}

NodePtr
QPDFDocument::makeDocInfo()
{
    auto trailer = this->qpdf->getTrailer();
    auto info = trailer.getKey("/Info");
    if (!info.isDictionary()) {
        info = this->qpdf->makeIndirectObject(QPDFObjectHandle::newDictionary());
        trailer.replaceKey("/Info", info);
    }
    return node(info);
}

NodePtr
QPDFDocument::openXmpMetadata()
{
    auto metadata = this->qpdf->getRoot().getKey("/Metadata");
    if (!metadata.isStream()) {
        return nullptr;
    }
    return node(metadata);
}

std::vector<NodePtr>
QPDFDocument::getAllObjects()
{
    std::vector<NodePtr> result;
    for (auto const& oh: this->qpdf->getAllObjects()) {
        result.push_back(node(oh));
    }
    return result;
}

bool
QPDFDocument::checkPageContents(NodePtr page, std::string& error)
{
    auto qn = ownNode(page, "checkPageContents");
    // Discard earlier warnings so only this page's are counted.
    (void)this->qpdf->getWarnings();
    ContentChecker checker;
    try {
        QPDFPageObjectHelper(qn->getObjectHandle()).parseContents(&checker);
    } catch (std::exception& e) {
        error = e.what();
        return false;
    }
    auto warnings = this->qpdf->getWarnings();
    if (!warnings.empty()) {
        error = warnings.front().what();
        return false;
    }
    if (!checker.saw_eof) {
        error = "content stream parsing stopped before end of data";
        return false;
    }
    return true;
}

void
QPDFDocument::configureWriter(QPDFWriter& w)
{
    // A content-derived /ID carries no time or host information.
    // Deterministic IDs can't be combined with encryption.
    if (!this->qpdf->isEncrypted()) {
        w.setDeterministicID(true);
    }
}

void
QPDFDocument::save(std::string const& out_filename)
{
    try {
        QPDFWriter w(*this->qpdf, out_filename.c_str());
        configureWriter(w);
        w.write();
    } catch (QPDFExc& e) {
        (void)remove(out_filename.c_str());
        throw ScrubError(pdfscrub_e_write, out_filename, e.getMessageDetail());
    } catch (std::exception& e) {
        (void)remove(out_filename.c_str());
        throw ScrubError(pdfscrub_e_write, out_filename, e.what());
    }
}

std::string
QPDFDocument::saveToMemory()
{
    std::string result;
    try {
        Pl_String pl("pdfscrub memory output", nullptr, result);
        QPDFWriter w(*this->qpdf);
        w.setOutputPipeline(&pl);
        configureWriter(w);
        w.write();
    } catch (QPDFExc& e) {
        throw ScrubError(pdfscrub_e_write, this->filename, e.getMessageDetail());
    } catch (std::exception& e) {
        throw ScrubError(pdfscrub_e_write, this->filename, e.what());
    }
    return result;
}

std::unique_ptr<Document>
QPDFDocumentModel::open(std::string const& filename)
{
    auto qpdf = QPDF::create();
    if (this->logger) {
        qpdf->setLogger(this->logger);
    }
    qpdf->setSuppressWarnings(true);
    try {
        qpdf->processFile(filename.c_str());
        // Make every page self-contained so pages copied into another
        // document keep their resources.
        QPDFPageDocumentHelper(*qpdf).pushInheritedAttributesToPage();
    } catch (QPDFExc& e) {
        throw ScrubError(pdfscrub_e_parse, filename, e.getMessageDetail());
    } catch (std::exception& e) {
        throw ScrubError(pdfscrub_e_parse, filename, e.what());
    }
    return std::make_unique<QPDFDocument>(qpdf, filename);
}

std::unique_ptr<Document>
QPDFDocumentModel::newEmpty()
{
    auto qpdf = QPDF::create();
    if (this->logger) {
        qpdf->setLogger(this->logger);
    }
    qpdf->setSuppressWarnings(true);
    qpdf->emptyPDF();
    return std::make_unique<QPDFDocument>(qpdf, "empty PDF");
}

void
QPDFDocumentModel::setLogger(std::shared_ptr<QPDFLogger> l)
{
    this->logger = l;
}
