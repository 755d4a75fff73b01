#include <pdfscrub/assert_test.h>

#include "pdf_fixtures.hh"

#include <pdfscrub/ForensicValidator.hh>
#include <pdfscrub/QPDFDocumentModel.hh>
#include <pdfscrub/ScrubError.hh>

#include <qpdf/JSON.hh>
#include <qpdf/QUtil.hh>

#include <iostream>
#include <stdexcept>

using namespace pdfscrub;

static JSON
member(JSON const& j, std::string const& key)
{
    JSON result = JSON::makeNull();
    bool seen = false;
    j.forEachDictItem([&](std::string const& k, JSON value) {
        if (k == key) {
            result = value;
            seen = true;
        }
    });
    if (!seen) {
        throw std::logic_error("JSON has no member " + key);
    }
    return result;
}

static bool
has_finding(CheckResult const& check, pdfscrub_location_e location, std::string const& key)
{
    for (auto const& f: check.getFindings()) {
        if ((f.location == location) && (f.key == key)) {
            return true;
        }
    }
    return false;
}

static void
check_invariant(ForensicReport const& report)
{
    bool any = false;
    for (auto const& check: report.getChecks()) {
        any = any || check.found();
    }
    assert(report.metadataDetected() == any);
    assert(report.scrubbingSuccessful() == !any);
    assert(report.getConfidenceLevel() == (any ? "LOW" : "HIGH"));
    assert(report.getChecks().size() == 5);
}

static void
test_detected(ForensicValidator& v, std::string const& dir)
{
    auto filename = dir + "/info.pdf";
    fixtures::write_document_with_info(filename);
    auto report = v.validate(filename);
    check_invariant(*report);
    assert(report->metadataDetected());
    assert(report->getConfidence() == pdfscrub_conf_low);

    auto const& info = report->getCheck(ForensicReport::check_document_info);
    assert(info.getError().empty());
    assert(has_finding(info, pdfscrub_loc_doc_info, "/Producer"));
    assert(has_finding(info, pdfscrub_loc_doc_info, "/Author"));
    for (auto const& f: info.getFindings()) {
        if (f.key == "/Author") {
            assert(f.value_excerpt == "Jane Doe");
        }
    }
    assert(has_finding(
        report->getCheck(ForensicReport::check_object_graph), pdfscrub_loc_doc_info, "/Producer"));
    assert(has_finding(
        report->getCheck(ForensicReport::check_binary_patterns),
        pdfscrub_loc_binary_signature,
        "/Author"));
    auto const& advanced = report->getCheck(ForensicReport::check_advanced);
    assert(has_finding(advanced, pdfscrub_loc_binary_signature, "Adobe"));
    assert(has_finding(advanced, pdfscrub_loc_font, "/BaseFont"));
    assert(!report->getCheck(ForensicReport::check_steganography).found());

    auto const& structure = report->getStructure();
    assert(structure.isValid());
    assert(structure.total_pages == 1);
    assert(structure.structural_issues.size() == 1);
    assert(structure.structural_issues.at(0) == "Document info still present");

    auto data = fixtures::read_file(filename);
    assert(report->getFileSize() == data.length());
    assert(report->getSHA256() == ForensicValidator::sha256(data));
    assert(report->getFileTimes().available);

    try {
        report->getCheck("no_such_check");
        assert(false);
    } catch (std::logic_error& e) {
        std::cout << "getCheck: " << e.what() << std::endl;
    }
}

static void
test_rich(ForensicValidator& v, std::string const& dir)
{
    auto filename = dir + "/rich.pdf";
    fixtures::write_rich_document(filename);
    auto report = v.validate(filename);
    check_invariant(*report);

    auto const& info = report->getCheck(ForensicReport::check_document_info);
    assert(has_finding(info, pdfscrub_loc_xmp, "/Metadata"));
    auto const& graph = report->getCheck(ForensicReport::check_object_graph);
    assert(has_finding(graph, pdfscrub_loc_page_metadata, "/Metadata"));
    auto const& advanced = report->getCheck(ForensicReport::check_advanced);
    for (auto const& key: {"/Metadata", "/PieceInfo", "/Tabs"}) {
        assert(has_finding(advanced, pdfscrub_loc_page_metadata, key));
    }
    for (auto const& key: {"/T", "/Contents", "/M"}) {
        assert(has_finding(advanced, pdfscrub_loc_annotation, key));
    }
    assert(has_finding(advanced, pdfscrub_loc_font_descriptor, "/FontName"));
    assert(has_finding(
        report->getCheck(ForensicReport::check_binary_patterns),
        pdfscrub_loc_binary_signature,
        "<?xpacket"));
}

static void
test_clean(ForensicValidator& v, std::string const& dir)
{
    auto filename = dir + "/clean.pdf";
    fixtures::write_clean_document(filename);
    auto report = v.validate(filename);
    check_invariant(*report);
    assert(!report->metadataDetected());
    assert(report->getConfidence() == pdfscrub_conf_high);
    for (auto const& check: report->getChecks()) {
        assert(check.getError().empty());
    }
    auto const& structure = report->getStructure();
    assert(structure.isValid());
    assert(structure.readable_pages == 1);
    assert(structure.missing_fonts.empty());
    assert(structure.structural_issues.empty());

    auto j = JSON::parse(report->getJSON().unparse());
    std::string s;
    assert(member(j, "file").getString(s) && (s == filename));
    auto assessment = member(j, "assessment");
    bool b = true;
    assert(member(assessment, "metadatadetected").getBool(b) && !b);
    assert(member(assessment, "scrubbingsuccessful").getBool(b) && b);
    assert(member(assessment, "confidence").getString(s) && (s == "HIGH"));
    auto checks = member(j, "checks");
    size_t n = 0;
    checks.forEachDictItem([&](std::string const&, JSON check) {
        bool found = true;
        assert(member(check, "found").getBool(found) && !found);
        ++n;
    });
    assert(n == 5);
    assert(member(member(j, "structure"), "validpdf").getBool(b) && b);
}

static void
test_high_entropy(std::string const& dir)
{
    auto filename = dir + "/entropy.pdf";
    fixtures::write_high_entropy_document(filename);
    auto model = std::make_shared<QPDFDocumentModel>();

    ForensicValidator v(model);
    auto report = v.validate(filename);
    check_invariant(*report);
    assert(report->metadataDetected());
    auto const& stego = report->getCheck(ForensicReport::check_steganography);
    assert(stego.getFindings().empty());
    assert(stego.getHighEntropy().size() == 1);
    auto const& r = stego.getHighEntropy().at(0);
    assert(r.byte_length == 4096);
    assert(r.entropy > EntropyAnalyzer::default_threshold);
    assert(!report->getCheck(ForensicReport::check_document_info).found());

    // Raising the minimum length past the payload hides it.
    ForensicValidator lenient(model, EntropyAnalyzer(EntropyAnalyzer::default_threshold, 5000));
    assert(lenient.getAnalyzer().getMinimumLength() == 5000);
    assert(!lenient.validate(filename)->getCheck(ForensicReport::check_steganography).found());
}

static void
test_failures(ForensicValidator& v, std::string const& dir)
{
    try {
        v.validate(dir + "/missing.pdf");
        assert(false);
    } catch (ScrubError& e) {
        assert(e.getErrorCode() == pdfscrub_e_input_not_found);
        std::cout << "missing file: " << ScrubError::codeName(e.getErrorCode()) << std::endl;
    }

    // A file that can't be parsed is never judged clean.
    auto filename = dir + "/garbage.pdf";
    fixtures::write_garbage(filename);
    auto report = v.validate(filename);
    check_invariant(*report);
    assert(report->metadataDetected());
    auto const& info = report->getCheck(ForensicReport::check_document_info);
    assert(!info.getError().empty());
    assert(has_finding(info, pdfscrub_loc_doc_info, "error"));
    assert(report->getCheck(ForensicReport::check_object_graph).found());
    assert(!report->getCheck(ForensicReport::check_steganography).getError().empty());
    auto const& structure = report->getStructure();
    assert(structure.total_pages == 0);
    assert(structure.structural_issues.size() == 1);
    assert(structure.structural_issues.at(0).find("Validation error: ") == 0);

    auto times = ForensicValidator::captureFileTimes(dir + "/missing.pdf");
    assert(!times.available);
    assert(!times.error.empty());
}

static void
test_multibyte_excerpt(ForensicValidator& v, std::string const& dir)
{
    // 'a' followed by 30 two-byte characters; byte 50 is the second
    // half of the 25th
    std::string e_acute = "\xc3\xa9";
    std::string title = "a";
    for (int i = 0; i < 30; ++i) {
        title += e_acute;
    }
    auto filename = dir + "/title.pdf";
    fixtures::write_document_with_title(filename, title);
    auto report = v.validate(filename);
    check_invariant(*report);

    std::string expected = "a";
    for (int i = 0; i < 24; ++i) {
        expected += e_acute;
    }
    bool seen = false;
    for (auto const& f: report->getCheck(ForensicReport::check_document_info).getFindings()) {
        if (f.key != "/Title") {
            continue;
        }
        seen = true;
        assert(f.value_excerpt == expected);
        bool has_8bit_chars = false;
        bool is_valid_utf8 = false;
        bool is_utf16 = false;
        QUtil::analyze_encoding(f.value_excerpt, has_8bit_chars, is_valid_utf8, is_utf16);
        assert(has_8bit_chars && is_valid_utf8);
    }
    assert(seen);

    CheckResult c("example");
    c.addFinding(pdfscrub_loc_doc_info, "/Title", std::string(49, 'x') + "\xe2\x82\xac");
    assert(c.getFindings().at(0).value_excerpt == std::string(49, 'x'));
    c.addFinding(pdfscrub_loc_doc_info, "/Title", std::string(47, 'x') + "\xe2\x82\xac!");
    assert(c.getFindings().at(1).value_excerpt == std::string(47, 'x') + "\xe2\x82\xac");
}

static void
test_report_details()
{
    CheckResult c("example");
    assert(!c.found());
    c.addFinding(pdfscrub_loc_annotation, "/Contents", std::string(80, 'x'));
    assert(c.found());
    assert(c.getFindings().at(0).value_excerpt == std::string(50, 'x'));

    CheckResult e("entropy");
    e.addHighEntropy({"3 0 R", 7.9, 4096});
    assert(e.found());
    e.setError("informational");
    assert(e.getError() == "informational");

    assert(
        ForensicValidator::sha256("abc") ==
        "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    assert(std::string(MetadataFinding::locationName(pdfscrub_loc_xmp)) == "XMP");
    assert(
        std::string(MetadataFinding::locationName(pdfscrub_loc_font_descriptor)) ==
        "FontDescriptor");
}

int
main()
{
    std::string dir;
    try {
        dir = fixtures::make_temp_dir();
        ForensicValidator v(std::make_shared<QPDFDocumentModel>());
        test_detected(v, dir);
        test_rich(v, dir);
        test_clean(v, dir);
        test_high_entropy(dir);
        test_failures(v, dir);
        test_multibyte_excerpt(v, dir);
        test_report_details();
        fixtures::remove_tree(dir);
    } catch (std::exception& e) {
        std::cout << "unexpected exception: " << e.what() << std::endl;
        return 2;
    }
    std::cout << "done" << std::endl;
    return 0;
}
