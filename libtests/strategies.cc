#include <pdfscrub/assert_test.h>

#include "pdf_fixtures.hh"

#include <pdfscrub/ForensicValidator.hh>
#include <pdfscrub/QPDFDocumentModel.hh>
#include <pdfscrub/ScrubError.hh>
#include <pdfscrub/ScrubStrategy.hh>
#include <pdfscrub/StructuralSanitizer.hh>

#include <iostream>
#include <stdexcept>

using namespace pdfscrub;

static void
check_info_empty(Document& doc)
{
    auto info = doc.getDocInfo();
    assert((info == nullptr) || info->getKeys().empty());
}

// Sanitize candidate and require the validator to find nothing
static void
check_sanitized_clean(
    std::shared_ptr<DocumentModel> model, std::string const& candidate, std::string const& dir)
{
    auto sanitized = dir + "/sanitized.pdf";
    StructuralSanitizer s;
    s.sanitizeFile(*model, candidate, sanitized);
    ForensicValidator validator(model);
    auto report = validator.validate(sanitized);
    assert(!report->metadataDetected());
    assert(report->getStructure().total_pages == 1);
}

static void
test_default_order()
{
    auto model = std::make_shared<QPDFDocumentModel>();
    auto strategies = defaultStrategies(model);
    assert(strategies.size() == 3);
    assert(strategies.at(0)->getName() == "reconstruct");
    assert(strategies.at(1)->getName() == "structural_clear");
    assert(strategies.at(2)->getName() == "minimal_rewrite");
}

static void
test_reconstruct(std::shared_ptr<DocumentModel> model, std::string const& dir)
{
    auto rich = dir + "/rich.pdf";
    auto out = dir + "/reconstruct.pdf";
    fixtures::write_rich_document(rich);

    ReconstructStrategy strategy(model);
    strategy.apply(rich, out);
    {
        auto doc = model->open(out);
        auto pages = doc->getPages();
        assert(pages.size() == 1);
        check_info_empty(*doc);
        auto root = doc->getRoot();
        assert(!root->hasKey("/Metadata"));
        assert(!root->hasKey("/JavaScript"));
        assert(!pages.at(0)->hasKey("/Metadata"));
        assert(doc->openXmpMetadata() == nullptr);
    }
    check_sanitized_clean(model, out, dir);
    std::cout << "reconstruct" << std::endl;
}

static void
test_structural_clear(std::shared_ptr<DocumentModel> model, std::string const& dir)
{
    auto rich = dir + "/rich.pdf";
    auto input = dir + "/rich-perms.pdf";
    auto out = dir + "/structural.pdf";
    fixtures::write_rich_document(rich);
    {
        auto doc = model->open(rich);
        auto root = doc->getRoot();
        root->replaceKeyWithName("/PieceInfo", "/Private");
        root->replaceKeyWithString("/Perms", "Jane Doe");
        doc->save(input);
    }

    StructuralClearStrategy strategy(model);
    strategy.apply(input, out);
    {
        auto doc = model->open(out);
        auto pages = doc->getPages();
        assert(pages.size() == 1);
        check_info_empty(*doc);
        auto root = doc->getRoot();
        for (auto const& key: StructuralClearStrategy::rootMetadataKeys()) {
            assert(!root->hasKey(key));
        }
        assert(!pages.at(0)->hasKey("/Metadata"));
        assert(!pages.at(0)->hasKey("/PieceInfo"));
        // Only metadata is cleared; everything else is left for the
        // sanitizer.
        assert(root->hasKey("/AcroForm"));
        assert(pages.at(0)->getKey("/Annots")->getItems().size() == 3);
    }
    check_sanitized_clean(model, out, dir);
    std::cout << "structural_clear" << std::endl;
}

static void
test_minimal_rewrite(std::shared_ptr<DocumentModel> model, std::string const& dir)
{
    auto rich = dir + "/rich.pdf";
    auto out = dir + "/minimal.pdf";
    fixtures::write_rich_document(rich);

    MinimalRewriteStrategy strategy(model);
    strategy.apply(rich, out);
    {
        auto doc = model->open(out);
        auto pages = doc->getPages();
        assert(pages.size() == 1);
        auto info = doc->getDocInfo();
        assert(info && info->getKeys().empty());
        auto root = doc->getRoot();
        assert(!root->hasKey("/Metadata"));
        assert(!root->hasKey("/Outlines"));
        // Pages are copied as they are.
        assert(pages.at(0)->hasKey("/Metadata"));
    }
    check_sanitized_clean(model, out, dir);
    std::cout << "minimal_rewrite" << std::endl;
}

static void
test_failures(std::shared_ptr<DocumentModel> model, std::string const& dir)
{
    auto garbage = dir + "/garbage.pdf";
    fixtures::write_garbage(garbage);
    for (auto const& strategy: defaultStrategies(model)) {
        for (auto const& input: {dir + "/missing.pdf", garbage}) {
            auto out = dir + "/" + strategy->getName() + ".pdf";
            try {
                strategy->apply(input, out);
                assert(false);
            } catch (ScrubError& e) {
                assert(e.getErrorCode() == pdfscrub_e_parse);
                std::cout << strategy->getName() << ": "
                          << ScrubError::codeName(e.getErrorCode()) << std::endl;
            }
        }
    }
}

int
main()
{
    std::string dir;
    try {
        dir = fixtures::make_temp_dir();
        auto model = std::make_shared<QPDFDocumentModel>();
        test_default_order();
        test_reconstruct(model, dir);
        test_structural_clear(model, dir);
        test_minimal_rewrite(model, dir);
        test_failures(model, dir);
        fixtures::remove_tree(dir);
    } catch (std::exception& e) {
        std::cout << "unexpected exception: " << e.what() << std::endl;
        return 2;
    }
    std::cout << "done" << std::endl;
    return 0;
}
