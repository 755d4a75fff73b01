#include <pdfscrub/ScrubStrategy.hh>

#include <pdfscrub/ScrubError.hh>
#include <pdfscrub/StructuralSanitizer.hh>

using namespace pdfscrub;

namespace
{
    // Run fn, converting anything other than a ScrubError into one.
    // Backend failures while walking or copying the object graph are
    // reported against the input.
    template <typename F>
    void
    translate_errors(std::string const& input, F fn)
    {
        try {
            fn();
        } catch (ScrubError&) {
            throw;
        } catch (std::exception& e) {
            throw ScrubError(pdfscrub_e_parse, input, e.what());
        }
    }
} // namespace

ReconstructStrategy::ReconstructStrategy(std::shared_ptr<DocumentModel> model) :
    model(model)
{
}

std::string
ReconstructStrategy::getName() const
{
    return "reconstruct";
}

void
ReconstructStrategy::apply(std::string const& input, std::string const& output)
{
    translate_errors(input, [&]() {
        // The source must stay open until the copy is saved since copied
        // pages are resolved lazily.
        auto source = this->model->open(input);
        auto doc = this->model->newEmpty();
        for (auto const& page: source->getPages()) {
            auto copy = doc->appendPage(page);
            if (copy->hasKey("/Metadata")) {
                copy->removeKey("/Metadata");
            }
        }
        StructuralSanitizer sanitizer;
        sanitizer.clearDocInfo(*doc);
        sanitizer.removeTrailerInfo(*doc);
        doc->save(output);
    });
}

StructuralClearStrategy::StructuralClearStrategy(std::shared_ptr<DocumentModel> model) :
    model(model)
{
}

std::string
StructuralClearStrategy::getName() const
{
    return "structural_clear";
}

std::vector<std::string> const&
StructuralClearStrategy::rootMetadataKeys()
{
    static std::vector<std::string> const keys = {"/Info", "/Metadata", "/PieceInfo", "/Perms"};
    return keys;
}

void
StructuralClearStrategy::apply(std::string const& input, std::string const& output)
{
    translate_errors(input, [&]() {
        auto doc = this->model->open(input);
        StructuralSanitizer sanitizer;
        sanitizer.clearDocInfo(*doc);
        sanitizer.clearXmpMetadata(*doc);
        sanitizer.stripPageMetadata(*doc);
        auto root = doc->getRoot();
        for (auto const& key: rootMetadataKeys()) {
            sanitizer.removeField(root, key);
        }
        sanitizer.removeTrailerInfo(*doc);
        doc->save(output);
    });
}

MinimalRewriteStrategy::MinimalRewriteStrategy(std::shared_ptr<DocumentModel> model) :
    model(model)
{
}

std::string
MinimalRewriteStrategy::getName() const
{
    return "minimal_rewrite";
}

void
MinimalRewriteStrategy::apply(std::string const& input, std::string const& output)
{
    translate_errors(input, [&]() {
        auto source = this->model->open(input);
        auto doc = this->model->newEmpty();
        for (auto const& page: source->getPages()) {
            doc->appendPage(page);
        }
        auto info = doc->makeDocInfo();
        for (auto const& key: info->getKeys()) {
            info->removeKey(key);
        }
        doc->save(output);
    });
}

std::vector<std::shared_ptr<ScrubStrategy>>
pdfscrub::defaultStrategies(std::shared_ptr<DocumentModel> model)
{
    return {
        std::make_shared<ReconstructStrategy>(model),
        std::make_shared<StructuralClearStrategy>(model),
        std::make_shared<MinimalRewriteStrategy>(model)};
}
