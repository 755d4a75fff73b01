#include <pdfscrub/ForensicReport.hh>

#include <pdfscrub/Util.hh>

#include <stdexcept>

using namespace pdfscrub;

char const*
MetadataFinding::locationName(pdfscrub_location_e location)
{
    switch (location) {
    case pdfscrub_loc_doc_info:
        return "DocInfo";
    case pdfscrub_loc_xmp:
        return "XMP";
    case pdfscrub_loc_page_metadata:
        return "PageMetadata";
    case pdfscrub_loc_annotation:
        return "Annotation";
    case pdfscrub_loc_font:
        return "Font";
    case pdfscrub_loc_font_descriptor:
        return "FontDescriptor";
    case pdfscrub_loc_binary_signature:
        return "BinarySignature";
    }
    return "Unknown";
}

CheckResult::CheckResult(std::string const& name) :
    name(name)
{
}

void
CheckResult::addFinding(
    pdfscrub_location_e location, std::string const& key, std::string const& value)
{
    this->findings.push_back(
        {location, key, util::truncate(value, MetadataFinding::excerpt_length)});
}

void
CheckResult::addHighEntropy(EntropyReport const& report)
{
    this->high_entropy.push_back(report);
}

void
CheckResult::setError(std::string const& e)
{
    this->error = e;
}

bool
CheckResult::found() const
{
    return !(this->findings.empty() && this->high_entropy.empty());
}

std::string const&
CheckResult::getName() const
{
    return this->name;
}

std::vector<MetadataFinding> const&
CheckResult::getFindings() const
{
    return this->findings;
}

std::vector<EntropyReport> const&
CheckResult::getHighEntropy() const
{
    return this->high_entropy;
}

std::string const&
CheckResult::getError() const
{
    return this->error;
}

JSON
CheckResult::getJSON() const
{
    auto j = JSON::makeDictionary();
    j.addDictionaryMember("found", JSON::makeBool(found()));
    auto j_findings = j.addDictionaryMember("findings", JSON::makeArray());
    for (auto const& f: this->findings) {
        auto j_f = j_findings.addArrayElement(JSON::makeDictionary());
        j_f.addDictionaryMember(
            "location", JSON::makeString(MetadataFinding::locationName(f.location)));
        j_f.addDictionaryMember("key", JSON::makeString(f.key));
        j_f.addDictionaryMember("value", JSON::makeString(f.value_excerpt));
    }
    if (!this->high_entropy.empty()) {
        auto j_objects = j.addDictionaryMember("highentropyobjects", JSON::makeArray());
        for (auto const& r: this->high_entropy) {
            auto j_r = j_objects.addArrayElement(JSON::makeDictionary());
            j_r.addDictionaryMember("object", JSON::makeString(r.object_id));
            j_r.addDictionaryMember("entropy", JSON::makeReal(r.entropy));
            j_r.addDictionaryMember(
                "length", JSON::makeInt(static_cast<long long>(r.byte_length)));
        }
    }
    if (!this->error.empty()) {
        j.addDictionaryMember("error", JSON::makeString(this->error));
    }
    return j;
}

bool
StructuralReport::isValid() const
{
    return (this->readable_pages == this->total_pages) && this->corrupted_pages.empty();
}

static JSON
string_array(std::vector<std::string> const& items)
{
    auto j = JSON::makeArray();
    for (auto const& i: items) {
        j.addArrayElement(JSON::makeString(i));
    }
    return j;
}

JSON
StructuralReport::getJSON() const
{
    auto j = JSON::makeDictionary();
    j.addDictionaryMember("validpdf", JSON::makeBool(isValid()));
    j.addDictionaryMember("totalpages", JSON::makeInt(static_cast<long long>(this->total_pages)));
    j.addDictionaryMember(
        "readablepages", JSON::makeInt(static_cast<long long>(this->readable_pages)));
    j.addDictionaryMember("corruptedpages", string_array(this->corrupted_pages));
    j.addDictionaryMember("missingfonts", string_array(this->missing_fonts));
    j.addDictionaryMember("structuralissues", string_array(this->structural_issues));
    return j;
}

JSON
FileTimes::getJSON() const
{
    auto j = JSON::makeDictionary();
    if (this->available) {
        j.addDictionaryMember("creationtime", JSON::makeInt(this->creation_time));
        j.addDictionaryMember("modificationtime", JSON::makeInt(this->modification_time));
        j.addDictionaryMember("accesstime", JSON::makeInt(this->access_time));
    } else {
        j.addDictionaryMember("error", JSON::makeString(this->error));
    }
    return j;
}

ForensicReport::ForensicReport(
    std::string const& filename,
    unsigned long long file_size,
    std::string const& sha256,
    std::vector<CheckResult> const& checks,
    StructuralReport const& structure,
    FileTimes const& file_times) :
    filename(filename),
    file_size(file_size),
    sha256(sha256),
    checks(checks),
    structure(structure),
    file_times(file_times),
    metadata_detected(false)
{
    // Structural integrity and timestamps are reported but are not
    // evidence of metadata.
    for (auto const& check: this->checks) {
        if (check.found()) {
            this->metadata_detected = true;
        }
    }
}

std::string const&
ForensicReport::getFilename() const
{
    return this->filename;
}

unsigned long long
ForensicReport::getFileSize() const
{
    return this->file_size;
}

std::string const&
ForensicReport::getSHA256() const
{
    return this->sha256;
}

std::vector<CheckResult> const&
ForensicReport::getChecks() const
{
    return this->checks;
}

CheckResult const&
ForensicReport::getCheck(std::string const& name) const
{
    for (auto const& check: this->checks) {
        if (check.getName() == name) {
            return check;
        }
    }
    throw std::logic_error("ForensicReport::getCheck: no check named " + name);
}

StructuralReport const&
ForensicReport::getStructure() const
{
    return this->structure;
}

FileTimes const&
ForensicReport::getFileTimes() const
{
    return this->file_times;
}

bool
ForensicReport::metadataDetected() const
{
    return this->metadata_detected;
}

bool
ForensicReport::scrubbingSuccessful() const
{
    return !this->metadata_detected;
}

pdfscrub_confidence_e
ForensicReport::getConfidence() const
{
    return this->metadata_detected ? pdfscrub_conf_low : pdfscrub_conf_high;
}

std::string
ForensicReport::getConfidenceLevel() const
{
    return getConfidence() == pdfscrub_conf_high ? "HIGH" : "LOW";
}

JSON
ForensicReport::getJSON() const
{
    auto j = JSON::makeDictionary();
    j.addDictionaryMember("file", JSON::makeString(this->filename));
    j.addDictionaryMember("size", JSON::makeInt(static_cast<long long>(this->file_size)));
    j.addDictionaryMember("sha256", JSON::makeString(this->sha256));
    auto j_checks = j.addDictionaryMember("checks", JSON::makeDictionary());
    for (auto const& check: this->checks) {
        j_checks.addDictionaryMember(check.getName(), check.getJSON());
    }
    j.addDictionaryMember("structure", this->structure.getJSON());
    j.addDictionaryMember("filesystem", this->file_times.getJSON());
    auto j_assessment = j.addDictionaryMember("assessment", JSON::makeDictionary());
    j_assessment.addDictionaryMember("metadatadetected", JSON::makeBool(metadataDetected()));
    j_assessment.addDictionaryMember(
        "scrubbingsuccessful", JSON::makeBool(scrubbingSuccessful()));
    j_assessment.addDictionaryMember("confidence", JSON::makeString(getConfidenceLevel()));
    return j;
}
