#include <pdfscrub/ForensicValidator.hh>

#include <pdfscrub/ScrubError.hh>
#include <pdfscrub/StructuralSanitizer.hh>
#include <pdfscrub/Util.hh>

#include <qpdf/QPDFCryptoProvider.hh>
#include <qpdf/QUtil.hh>

#include <cerrno>
#include <cstring>
#include <sys/stat.h>

using namespace pdfscrub;

// Keys that only document information dictionaries carry. /Title is
// handled separately because outline items have one too.
static std::vector<std::string> const info_only_keys = {
    "/Producer", "/Creator", "/Author", "/Subject", "/Keywords", "/CreationDate", "/ModDate"};
static std::vector<std::string> const font_keys = {
    "/BaseFont", "/Name", "/Registry", "/Ordering", "/Supplement"};
static std::vector<std::string> const descriptor_keys = {"/FontName", "/FontFamily"};
static std::vector<std::string> const generic_font_values = {
    "/F1", "/GenericFont", "F", "Generic", "None"};
static char const* const signature_token = "Adobe";

static std::string
page_label(size_t pageno)
{
    return "page " + std::to_string(pageno);
}

static bool
is_vendor_font_value(std::string const& value)
{
    return !util::contains(generic_font_values, value) &&
        util::contains_any_nocase(value, StructuralSanitizer::fontTerms());
}

ForensicValidator::ForensicValidator(
    std::shared_ptr<DocumentModel> model, EntropyAnalyzer const& analyzer) :
    model(model),
    analyzer(analyzer)
{
}

EntropyAnalyzer const&
ForensicValidator::getAnalyzer() const
{
    return this->analyzer;
}

std::vector<std::string> const&
ForensicValidator::binaryPatterns()
{
    static std::vector<std::string> const patterns = {
        "/Title",
        "/Author",
        "/Subject",
        "/Creator",
        "/Producer",
        "/CreationDate",
        "/ModDate",
        "/Keywords",
        "/Application",
        "<?xpacket",
        "<x:xmpmeta",
        "xmp:",
        "pdf:",
        "dc:"};
    return patterns;
}

std::string
ForensicValidator::sha256(std::string const& data)
{
    auto crypto = QPDFCryptoProvider::getImpl();
    crypto->SHA2_init(256);
    crypto->SHA2_update(reinterpret_cast<unsigned char const*>(data.data()), data.length());
    crypto->SHA2_finalize();
    return QUtil::hex_encode(crypto->SHA2_digest());
}

FileTimes
ForensicValidator::captureFileTimes(std::string const& filename)
{
    FileTimes result;
    struct stat st;
    if (stat(filename.c_str(), &st) != 0) {
        result.error = filename + ": " + strerror(errno);
        return result;
    }
    result.available = true;
    result.creation_time = static_cast<long long>(st.st_ctime);
    result.modification_time = static_cast<long long>(st.st_mtime);
    result.access_time = static_cast<long long>(st.st_atime);
    return result;
}

CheckResult
ForensicValidator::checkDocumentInfo(std::string const& filename)
{
    CheckResult result(ForensicReport::check_document_info);
    try {
        auto doc = this->model->open(filename);
        auto info = doc->getDocInfo();
        if (info) {
            for (auto const& key: info->getKeys()) {
                result.addFinding(pdfscrub_loc_doc_info, key, info->getKey(key)->getText());
            }
        }
        if (doc->openXmpMetadata()) {
            result.addFinding(pdfscrub_loc_xmp, "/Metadata", "XMP metadata present");
        }
    } catch (std::exception& e) {
        result.setError(e.what());
        result.addFinding(pdfscrub_loc_doc_info, "error", e.what());
    }
    return result;
}

CheckResult
ForensicValidator::checkObjectGraph(std::string const& filename)
{
    CheckResult result(ForensicReport::check_object_graph);
    try {
        auto doc = this->model->open(filename);
        for (auto const& obj: doc->getAllObjects()) {
            if (!(obj->isDictionary() || obj->isStream())) {
                continue;
            }
            auto type = obj->getKey("/Type");
            auto subtype = obj->getKey("/Subtype");
            if ((type && (type->getText() == "/Metadata")) ||
                (subtype && (subtype->getText() == "/XML"))) {
                result.addFinding(pdfscrub_loc_xmp, obj->describe(), "XMP metadata stream");
                continue;
            }
            if (obj->isStream()) {
                continue;
            }
            bool info_like = false;
            for (auto const& key: info_only_keys) {
                auto value = obj->getKey(key);
                if (value) {
                    info_like = true;
                    result.addFinding(pdfscrub_loc_doc_info, key, value->getText());
                }
            }
            auto title = obj->getKey("/Title");
            if (title && (info_like || !obj->hasKey("/Parent"))) {
                result.addFinding(pdfscrub_loc_doc_info, "/Title", title->getText());
            }
        }
        size_t pageno = 0;
        for (auto const& page: doc->getPages()) {
            ++pageno;
            if (page->hasKey("/Metadata")) {
                result.addFinding(pdfscrub_loc_page_metadata, "/Metadata", page_label(pageno));
            }
        }
    } catch (std::exception& e) {
        result.setError(e.what());
        result.addFinding(pdfscrub_loc_doc_info, "error", e.what());
    }
    return result;
}

CheckResult
ForensicValidator::checkBinaryPatterns(std::string const& data)
{
    CheckResult result(ForensicReport::check_binary_patterns);
    for (auto const& pattern: binaryPatterns()) {
        auto offset = data.find(pattern);
        if (offset != std::string::npos) {
            result.addFinding(
                pdfscrub_loc_binary_signature, pattern, "offset " + std::to_string(offset));
        }
    }
    return result;
}

CheckResult
ForensicValidator::checkSteganography(std::string const& filename)
{
    CheckResult result(ForensicReport::check_steganography);
    try {
        auto doc = this->model->open(filename);
        for (auto const& obj: doc->getAllObjects()) {
            std::string data;
            if (!obj->readData(data)) {
                continue;
            }
            EntropyReport report;
            if (this->analyzer.analyze(obj->describe(), data, report)) {
                result.addHighEntropy(report);
            }
        }
    } catch (std::exception& e) {
        result.setError(e.what());
    }
    return result;
}

CheckResult
ForensicValidator::checkAdvancedMetadata(std::string const& filename, std::string const& data)
{
    CheckResult result(ForensicReport::check_advanced);
    try {
        auto doc = this->model->open(filename);
        size_t pageno = 0;
        for (auto const& page: doc->getPages()) {
            ++pageno;
            for (auto const& key: StructuralSanitizer::pageMetadataKeys()) {
                if (page->hasKey(key)) {
                    result.addFinding(pdfscrub_loc_page_metadata, key, page_label(pageno));
                }
            }
            auto annots = page->getKey("/Annots");
            if (annots) {
                for (auto const& annot: annots->getItems()) {
                    for (auto const& key: StructuralSanitizer::annotationMetadataKeys()) {
                        auto value = annot->getKey(key);
                        if (value) {
                            result.addFinding(pdfscrub_loc_annotation, key, value->getText());
                        }
                    }
                }
            }
            auto resources = page->getKey("/Resources");
            auto fonts = resources ? resources->getKey("/Font") : nullptr;
            if (!(fonts && fonts->isDictionary())) {
                continue;
            }
            for (auto const& name: fonts->getKeys()) {
                auto font = fonts->getKey(name);
                if (!(font && font->isDictionary())) {
                    continue;
                }
                for (auto const& key: font_keys) {
                    auto value = font->getKey(key);
                    if (value && is_vendor_font_value(value->getText())) {
                        result.addFinding(pdfscrub_loc_font, key, value->getText());
                    }
                }
                auto descriptor = font->getKey("/FontDescriptor");
                if (!(descriptor && descriptor->isDictionary())) {
                    continue;
                }
                for (auto const& key: descriptor_keys) {
                    auto value = descriptor->getKey(key);
                    if (value && is_vendor_font_value(value->getText())) {
                        result.addFinding(pdfscrub_loc_font_descriptor, key, value->getText());
                    }
                }
            }
        }
    } catch (std::exception& e) {
        result.setError(e.what());
    }
    if (data.find(signature_token) != std::string::npos) {
        result.addFinding(pdfscrub_loc_binary_signature, signature_token);
    }
    return result;
}

StructuralReport
ForensicValidator::checkStructure(std::string const& filename)
{
    // Two independent readers: one measures whether page content can
    // be read, the other inspects fonts and the trailer.
    StructuralReport result;
    try {
        auto reader = this->model->open(filename);
        auto pages = reader->getPages();
        result.total_pages = pages.size();
        size_t pageno = 0;
        for (auto const& page: pages) {
            ++pageno;
            std::string error;
            if (reader->checkPageContents(page, error)) {
                ++result.readable_pages;
            } else {
                result.corrupted_pages.push_back(page_label(pageno) + ": " + error);
            }
        }

        auto inspector = this->model->open(filename);
        auto inspected_pages = inspector->getPages();
        if (inspected_pages.size() != result.total_pages) {
            result.structural_issues.push_back(
                "Readers disagree on page count: " + std::to_string(result.total_pages) +
                " vs " + std::to_string(inspected_pages.size()));
        }
        for (auto const& page: inspected_pages) {
            auto resources = page->getKey("/Resources");
            auto fonts = resources ? resources->getKey("/Font") : nullptr;
            if (!(fonts && fonts->isDictionary())) {
                continue;
            }
            for (auto const& name: fonts->getKeys()) {
                auto font = fonts->getKey(name);
                if (font && font->isDictionary() && !font->hasKey("/BaseFont")) {
                    result.missing_fonts.push_back(name);
                }
            }
        }
        auto trailer = inspector->getTrailer();
        if (!trailer->hasKey("/Root")) {
            result.structural_issues.push_back("Missing document root");
        }
        if (trailer->hasKey("/Info")) {
            result.structural_issues.push_back("Document info still present");
        }
    } catch (std::exception& e) {
        result.structural_issues.push_back(std::string("Validation error: ") + e.what());
    }
    return result;
}

std::shared_ptr<ForensicReport>
ForensicValidator::validate(std::string const& filename)
{
    std::string data;
    try {
        std::shared_ptr<char> buf;
        size_t size = 0;
        QUtil::read_file_into_memory(filename.c_str(), buf, size);
        data.assign(buf.get(), size);
    } catch (std::exception& e) {
        throw ScrubError(pdfscrub_e_input_not_found, filename, e.what());
    }

    std::vector<CheckResult> checks;
    checks.push_back(checkDocumentInfo(filename));
    checks.push_back(checkObjectGraph(filename));
    checks.push_back(checkBinaryPatterns(data));
    checks.push_back(checkSteganography(filename));
    checks.push_back(checkAdvancedMetadata(filename, data));

    return std::make_shared<ForensicReport>(
        filename,
        data.length(),
        sha256(data),
        checks,
        checkStructure(filename),
        captureFileTimes(filename));
}
