#include <pdfscrub/StructuralSanitizer.hh>

#include <pdfscrub/ScrubError.hh>
#include <pdfscrub/SignatureScanner.hh>
#include <pdfscrub/Util.hh>

#include <stdexcept>

using namespace pdfscrub;

static std::vector<std::string> const font_fields = {
    "/BaseFont",
    "/Name",
    "/Registry",
    "/Ordering",
    "/Supplement",
    "/FontName",
    "/FontFamily",
    "/FontStretch",
    "/FontWeight",
    "/Creator",
    "/Producer",
    "/CreationDate",
    "/ModDate"};
static std::vector<std::string> const font_always_removed = {
    "/Registry", "/Ordering", "/Supplement", "/Creator", "/Producer", "/CreationDate", "/ModDate"};
static std::vector<std::string> const descriptor_fields = {
    "/FontName", "/FontFamily", "/FontStretch", "/FontWeight", "/Registry", "/Ordering"};
static std::vector<std::string> const descriptor_always_removed = {"/Registry", "/Ordering"};

std::vector<std::string> const&
StructuralSanitizer::safeAnnotationSubtypes()
{
    static std::vector<std::string> const subtypes = {
        "/Text",
        "/FreeText",
        "/Line",
        "/Square",
        "/Circle",
        "/Polygon",
        "/PolyLine",
        "/Highlight",
        "/Underline",
        "/Squiggly",
        "/StrikeOut",
        "/Stamp",
        "/Ink"};
    return subtypes;
}

std::vector<std::string> const&
StructuralSanitizer::dangerousKeys()
{
    static std::vector<std::string> const keys = {
        "/JavaScript",
        "/JS",
        "/EmbeddedFiles",
        "/Multimedia",
        "/3D",
        "/RichMedia",
        "/FileAttachment",
        "/Sound",
        "/Movie",
        "/Screen",
        "/Widget",
        "/Popup"};
    return keys;
}

std::vector<std::string> const&
StructuralSanitizer::pageMetadataKeys()
{
    static std::vector<std::string> const keys = {
        "/Metadata",
        "/PieceInfo",
        "/SeparationInfo",
        "/Tabs",
        "/TemplateInstantiated",
        "/PresSteps",
        "/UserUnit"};
    return keys;
}

std::vector<std::string> const&
StructuralSanitizer::annotationMetadataKeys()
{
    static std::vector<std::string> const keys = {
        "/T", "/Contents", "/RC", "/CreationDate", "/M", "/NM", "/Subj", "/IT", "/ExData"};
    return keys;
}

std::vector<std::string> const&
StructuralSanitizer::fontTerms()
{
    static std::vector<std::string> const terms = {
        "adobe", "microsoft", "pages", "word", "acrobat", "times", "helvetica", "arial"};
    return terms;
}

std::vector<std::string> const&
StructuralSanitizer::extendedFontTerms()
{
    static std::vector<std::string> const terms = [] {
        auto t = fontTerms();
        t.push_back("symbol");
        t.push_back("courier");
        return t;
    }();
    return terms;
}

SanitizeStats const&
StructuralSanitizer::getStats() const
{
    return this->stats;
}

void
StructuralSanitizer::resetStats()
{
    this->stats = SanitizeStats();
}

FieldResult
StructuralSanitizer::count(FieldResult r)
{
    switch (r) {
    case FieldResult::removed:
        ++this->stats.fields_removed;
        break;
    case FieldResult::replaced:
        ++this->stats.fields_replaced;
        break;
    case FieldResult::skipped:
        ++this->stats.fields_skipped;
        break;
    default:
        break;
    }
    return r;
}

FieldResult
StructuralSanitizer::skip(NodePtr node, std::string const& key, std::string const& reason)
{
    std::string where;
    try {
        where = node->describe();
    } catch (std::exception&) {
        where = "unknown object";
    }
    this->stats.skipped.push_back(where + " " + key + ": " + reason);
    return count(FieldResult::skipped);
}

FieldResult
StructuralSanitizer::removeField(NodePtr node, std::string const& key)
{
    try {
        if (!node->hasKey(key)) {
            return FieldResult::absent;
        }
        node->removeKey(key);
    } catch (std::exception& e) {
        return skip(node, key, e.what());
    }
    return count(FieldResult::removed);
}

FieldResult
StructuralSanitizer::replaceWithName(
    NodePtr node, std::string const& key, std::string const& name)
{
    try {
        node->replaceKeyWithName(key, name);
    } catch (std::exception& e) {
        return skip(node, key, e.what());
    }
    return count(FieldResult::replaced);
}

FieldResult
StructuralSanitizer::replaceWithString(
    NodePtr node, std::string const& key, std::string const& value)
{
    try {
        node->replaceKeyWithString(key, value);
    } catch (std::exception& e) {
        return skip(node, key, e.what());
    }
    return count(FieldResult::replaced);
}

bool
StructuralSanitizer::readField(NodePtr node, std::string const& key, std::string& value)
{
    try {
        auto v = node->getKey(key);
        if (!v) {
            return false;
        }
        value = v->getText();
    } catch (std::exception& e) {
        skip(node, key, e.what());
        return false;
    }
    return true;
}

NodePtr
StructuralSanitizer::lookup(NodePtr node, std::string const& key)
{
    try {
        return node->getKey(key);
    } catch (std::exception& e) {
        skip(node, key, e.what());
    }
    return nullptr;
}

void
StructuralSanitizer::clearDocInfo(Document& doc)
{
    auto info = doc.getDocInfo();
    if (!info) {
        return;
    }
    for (auto const& key: info->getKeys()) {
        removeField(info, key);
    }
}

void
StructuralSanitizer::clearXmpMetadata(Document& doc)
{
    removeField(doc.getRoot(), "/Metadata");
}

void
StructuralSanitizer::stripPageMetadata(Document& doc)
{
    for (auto const& page: doc.getPages()) {
        for (auto const& key: pageMetadataKeys()) {
            removeField(page, key);
        }
    }
}

void
StructuralSanitizer::removeDangerousObjects(Document& doc)
{
    auto root = doc.getRoot();
    auto names = lookup(root, "/Names");
    for (auto const& key: dangerousKeys()) {
        removeField(root, key);
        if (names && names->isDictionary()) {
            removeField(names, key);
        }
    }
}

void
StructuralSanitizer::filterAnnotations(Document& doc)
{
    for (auto const& page: doc.getPages()) {
        auto annots = lookup(page, "/Annots");
        if (!annots) {
            continue;
        }
        auto items = annots->getItems();
        std::vector<NodePtr> kept;
        for (auto const& annot: items) {
            auto subtype = lookup(annot, "/Subtype");
            if (subtype && util::contains(safeAnnotationSubtypes(), subtype->getText())) {
                for (auto const& key: annotationMetadataKeys()) {
                    removeField(annot, key);
                }
                kept.push_back(annot);
            } else {
                ++this->stats.annotations_dropped;
            }
        }
        if (kept.empty()) {
            removeField(page, "/Annots");
        } else if (kept.size() != items.size()) {
            try {
                page->replaceKeyWithArray("/Annots", kept);
                count(FieldResult::replaced);
            } catch (std::exception& e) {
                skip(page, "/Annots", e.what());
            }
        }
    }
}

void
StructuralSanitizer::sanitizeFontDictionary(NodePtr font)
{
    for (auto const& key: font_fields) {
        std::string value;
        if (!readField(font, key, value)) {
            continue;
        }
        if (util::contains_any_nocase(value, extendedFontTerms())) {
            if (key == "/BaseFont") {
                replaceWithName(font, key, "/F1");
            } else if ((key == "/FontName") || (key == "/FontFamily")) {
                replaceWithString(font, key, "F");
            } else {
                removeField(font, key);
            }
        } else if (util::contains(font_always_removed, key)) {
            removeField(font, key);
        }
    }
    auto descriptor = lookup(font, "/FontDescriptor");
    if (descriptor && descriptor->isDictionary()) {
        sanitizeFontDescriptor(descriptor);
    }
}

void
StructuralSanitizer::sanitizeFontDescriptor(NodePtr descriptor)
{
    for (auto const& key: descriptor_fields) {
        std::string value;
        if (!readField(descriptor, key, value)) {
            continue;
        }
        if (util::contains_any_nocase(value, fontTerms())) {
            if ((key == "/FontName") || (key == "/FontFamily")) {
                replaceWithString(descriptor, key, "F");
            } else {
                removeField(descriptor, key);
            }
        } else if (util::contains(descriptor_always_removed, key)) {
            removeField(descriptor, key);
        }
    }
}

void
StructuralSanitizer::sanitizeFonts(Document& doc)
{
    for (auto const& page: doc.getPages()) {
        auto resources = lookup(page, "/Resources");
        if (!resources) {
            continue;
        }
        auto fonts = lookup(resources, "/Font");
        if (!(fonts && fonts->isDictionary())) {
            continue;
        }
        for (auto const& name: fonts->getKeys()) {
            auto font = lookup(fonts, name);
            if (font && font->isDictionary()) {
                sanitizeFontDictionary(font);
            }
        }
    }
}

void
StructuralSanitizer::removeFormsAndOutlines(Document& doc)
{
    auto root = doc.getRoot();
    removeField(root, "/AcroForm");
    removeField(root, "/Outlines");
}

void
StructuralSanitizer::removeTrailerInfo(Document& doc)
{
    auto trailer = doc.getTrailer();
    removeField(trailer, "/Info");
    // The encryption key of an encrypted file is derived from its /ID.
    if (!trailer->hasKey("/Encrypt")) {
        removeField(trailer, "/ID");
    }
}

void
StructuralSanitizer::sanitize(Document& doc)
{
    clearDocInfo(doc);
    clearXmpMetadata(doc);
    stripPageMetadata(doc);
    removeDangerousObjects(doc);
    filterAnnotations(doc);
    sanitizeFonts(doc);
    removeFormsAndOutlines(doc);
    removeTrailerInfo(doc);
}

void
StructuralSanitizer::sanitizeFile(
    DocumentModel& model, std::string const& input, std::string const& output)
{
    std::string data;
    {
        auto doc = model.open(input);
        try {
            sanitize(*doc);
            data = doc->saveToMemory();
        } catch (ScrubError& e) {
            throw ScrubError(pdfscrub_e_sanitization, input, e.getMessageDetail());
        } catch (std::exception& e) {
            throw ScrubError(pdfscrub_e_sanitization, input, e.what());
        }
    }

    // Compressed and binary streams may carry attribution strings the
    // object graph doesn't reach. Substitution keeps every offset valid.
    SignatureScanner scanner(SignatureScanner::narrowVendorTokens());
    this->stats.signatures_blanked = scanner.scanUnscoped(data);

    try {
        util::write_file(output, data);
    } catch (std::exception& e) {
        throw ScrubError(pdfscrub_e_sanitization, output, e.what());
    }
}
