#include <pdfscrub/assert_test.h>

#include "pdf_fixtures.hh"

#include <pdfscrub/ForensicValidator.hh>
#include <pdfscrub/QPDFDocumentModel.hh>
#include <pdfscrub/ScrubError.hh>
#include <pdfscrub/StructuralSanitizer.hh>

#include <qpdf/QUtil.hh>

#include <iostream>
#include <stdexcept>

using namespace pdfscrub;

namespace
{
    // A dictionary whose backend refuses every operation
    class BrokenNode: public DocumentNode
    {
      public:
        ~BrokenNode() override = default;
        bool
        isDictionary() override
        {
            return true;
        }
        bool
        isArray() override
        {
            return false;
        }
        bool
        isStream() override
        {
            return false;
        }
        std::string
        describe() override
        {
            return "broken";
        }
        std::string
        getText() override
        {
            fail();
            return "";
        }
        std::set<std::string>
        getKeys() override
        {
            return {"/Author"};
        }
        bool
        hasKey(std::string const&) override
        {
            return true;
        }
        NodePtr
        getKey(std::string const&) override
        {
            fail();
            return nullptr;
        }
        void
        removeKey(std::string const&) override
        {
            fail();
        }
        void
        replaceKeyWithName(std::string const&, std::string const&) override
        {
            fail();
        }
        void
        replaceKeyWithString(std::string const&, std::string const&) override
        {
            fail();
        }
        void
        replaceKeyWithArray(std::string const&, std::vector<NodePtr> const&) override
        {
            fail();
        }
        std::vector<NodePtr>
        getItems() override
        {
            return {};
        }
        bool
        readData(std::string&) override
        {
            return false;
        }

      private:
        static void
        fail()
        {
            throw std::runtime_error("object is read-only");
        }
    };

    // One page; the catalog, trailer, page and document information
    // are all BrokenNodes
    class BrokenDocument: public Document
    {
      public:
        ~BrokenDocument() override = default;
        std::string
        getFilename() override
        {
            return "broken.pdf";
        }
        std::vector<NodePtr>
        getPages() override
        {
            return {node};
        }
        NodePtr
        appendPage(NodePtr) override
        {
            throw std::logic_error("appendPage called");
        }
        NodePtr
        getRoot() override
        {
            return node;
        }
        NodePtr
        getTrailer() override
        {
            return node;
        }
        NodePtr
        getDocInfo() override
        {
            return node;
        }
        NodePtr
        makeDocInfo() override
        {
            return node;
        }
        NodePtr
        openXmpMetadata() override
        {
            return nullptr;
        }
        std::vector<NodePtr>
        getAllObjects() override
        {
            return {node};
        }
        bool
        checkPageContents(NodePtr, std::string& error) override
        {
            error = "no contents";
            return false;
        }
        void
        save(std::string const&) override
        {
            throw std::logic_error("save called");
        }
        std::string
        saveToMemory() override
        {
            throw std::logic_error("saveToMemory called");
        }

      private:
        NodePtr node{std::make_shared<BrokenNode>()};
    };
} // namespace

static bool
skipped_contains(SanitizeStats const& stats, std::string const& line)
{
    for (auto const& s: stats.skipped) {
        if (s == line) {
            return true;
        }
    }
    return false;
}

static void
test_primitives(std::string const& dir)
{
    StructuralSanitizer s;
    auto broken = std::make_shared<BrokenNode>();
    assert(s.removeField(broken, "/Author") == FieldResult::skipped);
    assert(s.replaceWithName(broken, "/BaseFont", "/F1") == FieldResult::skipped);
    assert(s.replaceWithString(broken, "/FontName", "F") == FieldResult::skipped);
    auto const& stats = s.getStats();
    assert(stats.fields_skipped == 3);
    assert(stats.fields_removed == 0);
    assert(stats.skipped.size() == 3);
    assert(stats.skipped.at(0) == "broken /Author: object is read-only");

    s.resetStats();
    assert(s.getStats().fields_skipped == 0);
    assert(s.getStats().skipped.empty());

    auto filename = dir + "/info.pdf";
    fixtures::write_document_with_info(filename);
    QPDFDocumentModel model;
    auto doc = model.open(filename);
    auto info = doc->getDocInfo();
    assert(info);
    assert(s.removeField(info, "/Author") == FieldResult::removed);
    assert(s.removeField(info, "/Author") == FieldResult::absent);
    assert(s.replaceWithString(info, "/Producer", "none") == FieldResult::replaced);
    assert(info->getKey("/Producer")->getText() == "none");
    assert(s.getStats().fields_removed == 1);
    assert(s.getStats().fields_replaced == 1);

    // Passes keep going past fields they can't touch.
    auto fresh = model.open(filename);
    s.resetStats();
    s.sanitize(*fresh);
    assert(s.getStats().fields_skipped == 0);
    assert(!fresh->getDocInfo());
}

static void
test_broken_document()
{
    // Every read and write fails; each becomes a counted skip instead
    // of aborting the pass.
    BrokenDocument doc;
    StructuralSanitizer s;
    s.sanitize(doc);
    auto const& stats = s.getStats();
    // info 1, XMP 1, page keys 7, /Names 1, danger list 12, /Annots 1,
    // /Resources 1, forms and outlines 2, trailer /Info 1
    assert(stats.fields_skipped == 27);
    assert(stats.skipped.size() == 27);
    assert(stats.fields_removed == 0);
    assert(stats.annotations_dropped == 0);
    assert(skipped_contains(stats, "broken /Names: object is read-only"));
    assert(skipped_contains(stats, "broken /Annots: object is read-only"));
    assert(skipped_contains(stats, "broken /Resources: object is read-only"));
    std::cout << "broken document: " << stats.fields_skipped << " skipped" << std::endl;
}

static void
test_sanitize(std::string const& dir)
{
    auto filename = dir + "/rich.pdf";
    fixtures::write_rich_document(filename);
    QPDFDocumentModel model;
    auto doc = model.open(filename);

    StructuralSanitizer s;
    s.sanitize(*doc);
    auto const& stats = s.getStats();
    assert(stats.annotations_dropped == 2);
    assert(stats.fields_removed > 0);
    assert(stats.fields_skipped == 0);

    auto root = doc->getRoot();
    for (auto const& key: {"/Metadata", "/JavaScript", "/AcroForm", "/Outlines"}) {
        assert(!root->hasKey(key));
    }
    assert(!doc->openXmpMetadata());
    assert(!root->getKey("/Names")->hasKey("/EmbeddedFiles"));
    assert(!doc->getDocInfo());
    assert(!doc->getTrailer()->hasKey("/Info"));
    assert(!doc->getTrailer()->hasKey("/ID"));

    auto pages = doc->getPages();
    assert(pages.size() == 1);
    auto page = pages.at(0);
    for (auto const& key: StructuralSanitizer::pageMetadataKeys()) {
        assert(!page->hasKey(key));
    }
    auto annots = page->getKey("/Annots")->getItems();
    assert(annots.size() == 1);
    assert(annots.at(0)->getKey("/Subtype")->getText() == "/Text");
    for (auto const& key: StructuralSanitizer::annotationMetadataKeys()) {
        assert(!annots.at(0)->hasKey(key));
    }
    assert(annots.at(0)->hasKey("/Rect"));

    auto font = page->getKey("/Resources")->getKey("/Font")->getKey("/F1");
    assert(font->getKey("/BaseFont")->getText() == "/F1");
    assert(font->getKey("/Name")->getText() == "/F1");
    auto descriptor = font->getKey("/FontDescriptor");
    assert(descriptor->getKey("/FontName")->getText() == "F");
    assert(descriptor->hasKey("/Flags"));

    // Every pass is idempotent.
    s.resetStats();
    s.sanitize(*doc);
    assert(s.getStats().fields_removed == 0);
    assert(s.getStats().fields_replaced == 0);
    assert(s.getStats().annotations_dropped == 0);
    assert(s.getStats().fields_skipped == 0);
}

static void
test_annotations_all_dropped(std::string const& dir)
{
    auto filename = dir + "/rich.pdf";
    fixtures::write_rich_document(filename);
    QPDFDocumentModel model;
    auto doc = model.open(filename);
    auto page = doc->getPages().at(0);
    auto text = page->getKey("/Annots")->getItems().at(0);
    text->replaceKeyWithName("/Subtype", "/FileAttachment");

    StructuralSanitizer s;
    s.filterAnnotations(*doc);
    assert(s.getStats().annotations_dropped == 3);
    assert(!page->hasKey("/Annots"));
}

static void
test_sanitize_file(std::string const& dir)
{
    auto rich = dir + "/rich.pdf";
    auto once = dir + "/once.pdf";
    auto twice = dir + "/twice.pdf";
    fixtures::write_rich_document(rich);
    auto model = std::make_shared<QPDFDocumentModel>();

    StructuralSanitizer s;
    s.sanitizeFile(*model, rich, once);
    assert(s.getStats().annotations_dropped == 2);
    assert(fixtures::read_file(once).find("Adobe") == std::string::npos);

    ForensicValidator validator(model);
    auto first = validator.validate(once);
    assert(!first->metadataDetected());

    StructuralSanitizer s2;
    s2.sanitizeFile(*model, once, twice);
    assert(s2.getStats().annotations_dropped == 0);
    assert(s2.getStats().fields_replaced == 0);
    assert(!s2.getStats().signatures_blanked);
    auto second = validator.validate(twice);
    assert(!second->metadataDetected());

    // Vendor names outside of anything the passes remove are blanked
    // in the serialized bytes without breaking the file.
    auto tagged = dir + "/tagged.pdf";
    {
        auto doc = model->open(rich);
        doc->getRoot()->replaceKeyWithString("/Lang", "Adobe");
        doc->save(tagged);
    }
    StructuralSanitizer s3;
    s3.sanitizeFile(*model, tagged, once);
    assert(s3.getStats().signatures_blanked);
    assert(fixtures::read_file(once).find("Adobe") == std::string::npos);
    assert(model->open(once)->getRoot()->getKey("/Lang")->getText() == "     ");
}

static void
test_sanitize_file_errors(std::string const& dir)
{
    QPDFDocumentModel model;
    StructuralSanitizer s;
    try {
        s.sanitizeFile(model, dir + "/does-not-exist.pdf", dir + "/out.pdf");
        assert(false);
    } catch (ScrubError& e) {
        assert(e.getErrorCode() == pdfscrub_e_parse);
        std::cout << "missing input: " << ScrubError::codeName(e.getErrorCode()) << std::endl;
    }
    assert(!QUtil::file_can_be_opened((dir + "/out.pdf").c_str()));

    auto input = dir + "/info.pdf";
    fixtures::write_document_with_info(input);
    auto output = dir + "/no-such-dir/out.pdf";
    try {
        s.sanitizeFile(model, input, output);
        assert(false);
    } catch (ScrubError& e) {
        assert(e.getErrorCode() == pdfscrub_e_sanitization);
        std::cout << "unwritable output: " << ScrubError::codeName(e.getErrorCode())
                  << std::endl;
    }
    assert(!QUtil::file_can_be_opened(output.c_str()));
}

int
main()
{
    std::string dir;
    try {
        dir = fixtures::make_temp_dir();
        test_primitives(dir);
        test_broken_document();
        test_sanitize(dir);
        test_annotations_all_dropped(dir);
        test_sanitize_file(dir);
        test_sanitize_file_errors(dir);
        fixtures::remove_tree(dir);
    } catch (std::exception& e) {
        std::cout << "unexpected exception: " << e.what() << std::endl;
        return 2;
    }
    std::cout << "done" << std::endl;
    return 0;
}
