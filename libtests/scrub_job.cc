#include <pdfscrub/assert_test.h>

#include "pdf_fixtures.hh"

#include <pdfscrub/ScrubError.hh>
#include <pdfscrub/ScrubJob.hh>

#include <qpdf/JSON.hh>
#include <qpdf/Pl_String.hh>
#include <qpdf/QUtil.hh>

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <sys/stat.h>

using namespace pdfscrub;

namespace
{
    struct Run
    {
        int exit_code{-1};
        std::string out;
        std::string err;
    };
} // namespace

static std::vector<char const*>
make_argv(std::vector<std::string> const& args)
{
    std::vector<char const*> argv;
    argv.push_back("pdfscrub");
    for (auto const& a: args) {
        argv.push_back(a.c_str());
    }
    argv.push_back(nullptr);
    return argv;
}

static Run
run(std::vector<std::string> const& args)
{
    std::ostringstream out;
    std::ostringstream err;
    ScrubJob j;
    j.setOutputStreams(&out, &err);
    auto argv = make_argv(args);
    j.initializeFromArgv(argv.data());
    j.run();
    Run result;
    result.exit_code = j.getExitCode();
    result.out = out.str();
    result.err = err.str();
    return result;
}

static void
expect_usage(std::vector<std::string> const& args)
{
    try {
        run(args);
        assert(false);
    } catch (ScrubUsage& e) {
        std::cout << "usage: " << e.what() << std::endl;
    }
}

static JSON
member(JSON const& j, std::string const& key)
{
    JSON result = JSON::makeNull();
    j.forEachDictItem([&](std::string const& k, JSON value) {
        if (k == key) {
            result = value;
        }
    });
    return result;
}

static std::string
string_member(JSON const& j, std::string const& key)
{
    std::string s;
    if (!member(j, key).getString(s)) {
        throw std::logic_error("JSON member " + key + " is not a string");
    }
    return s;
}

static bool
bool_member(JSON const& j, std::string const& key)
{
    bool b = false;
    if (!member(j, key).getBool(b)) {
        throw std::logic_error("JSON member " + key + " is not a boolean");
    }
    return b;
}

static void
test_usage_errors(std::string const& dir)
{
    auto in = dir + "/info.pdf";
    expect_usage({});
    expect_usage({"--bogus", in});
    expect_usage({in, in});
    expect_usage({in, "-o"});
    expect_usage({"--json=yes", in});
    expect_usage({"--entropy-threshold=9", in});
    expect_usage({"--entropy-threshold", "high", in});
    expect_usage({"--entropy-min-length=-1", in});
    expect_usage({"--entropy-min-length=99999999999999999999999", in});
    expect_usage({"--validate-only", "--scan-signatures", in});
    expect_usage({"--validate-only", "-o", dir + "/out.pdf", in});
    expect_usage({"--quiet", "--verbose", in});
    expect_usage({in, "--output=" + in});
    expect_usage({"-o", dir + "/a.pdf", "--output", dir + "/b.pdf", in});
}

static void
test_config()
{
    ScrubJob j;
    j.config()
        ->inputFile("in.pdf")
        ->json()
        ->entropyThreshold("6.25")
        ->entropyMinLength("512")
        ->tempDirectory("/var/tmp")
        ->checkConfiguration();
    auto options = j.getScrubOptions();
    assert(options.entropy_threshold == 6.25);
    assert(options.entropy_min_length == 512);
    assert(options.temp_dir == "/var/tmp");
    // JSON output implies no progress messages.
    assert(options.quiet);
    assert(!options.verbose);
    assert(options.message_prefix == "pdfscrub");

    ScrubJob k;
    k.setMessagePrefix("scrubber");
    assert(k.getMessagePrefix() == "scrubber");
    auto argv = make_argv({"--", "-dash.pdf"});
    k.initializeFromArgv(argv.data());
    k.checkConfiguration();
    assert(!k.getScrubOptions().temp_dir.empty());
    assert(k.getScrubOptions().message_prefix == "scrubber");
}

static void
test_help_and_version()
{
    auto r = run({"--version"});
    assert(r.exit_code == ScrubJob::EXIT_CLEAN);
    assert(r.out == std::string("pdfscrub version ") + PDFSCRUB_VERSION + "\n");

    r = run({"--help"});
    assert(r.out == ScrubJob::usageText("pdfscrub"));
    assert(r.out.find("Usage: pdfscrub [options] input.pdf") == 0);
}

static void
test_validate(std::string const& dir)
{
    auto info = dir + "/info.pdf";
    auto clean = dir + "/clean.pdf";

    auto r = run({"--validate-only", clean});
    assert(r.exit_code == ScrubJob::EXIT_CLEAN);
    assert(r.out.find("FORENSIC VALIDATION REPORT") != std::string::npos);
    assert(r.out.find("  Status: CLEAN\n") != std::string::npos);
    assert(r.out.find("  Confidence: HIGH\n") != std::string::npos);

    r = run({"--validate-only", info});
    assert(r.exit_code == ScrubJob::EXIT_DETECTED);
    assert(r.out.find("  Status: METADATA DETECTED\n") != std::string::npos);
    assert(r.out.find("    DocInfo /Author: Jane Doe\n") != std::string::npos);

    r = run({"--validate-only", "--quiet", info});
    assert(r.out == "pdfscrub: " + info + ": metadata detected\n");

    r = run({"--validate-only", "--json", clean});
    assert(r.exit_code == ScrubJob::EXIT_CLEAN);
    auto j = JSON::parse(r.out);
    assert(string_member(j, "mode") == "validate");
    auto assessment = member(member(j, "report"), "assessment");
    assert(string_member(assessment, "confidence") == "HIGH");
    assert(!bool_member(assessment, "metadatadetected"));

    r = run({"--validate-only", dir + "/missing.pdf"});
    assert(r.exit_code == ScrubJob::EXIT_DETECTED);
    assert(r.out.empty());
    assert(r.err.find("pdfscrub: " + dir + "/missing.pdf: ") == 0);
}

static void
test_scrub(std::string const& dir)
{
    auto info = dir + "/info.pdf";
    auto output = dir + "/out.pdf";

    auto r = run({"--json", "--temp-dir", dir + "/tmp", "-o", output, info});
    assert(r.exit_code == ScrubJob::EXIT_CLEAN);
    auto j = JSON::parse(r.out);
    assert(string_member(j, "mode") == "scrub");
    assert(bool_member(j, "success"));
    assert(string_member(j, "strategy") == "reconstruct");
    assert(string_member(j, "output") == output);
    assert(string_member(j, "comparison") == "METADATA SUCCESSFULLY REMOVED");
    assert(bool_member(member(member(j, "original"), "assessment"), "metadatadetected"));
    assert(!bool_member(member(member(j, "final"), "assessment"), "metadatadetected"));
    assert(QUtil::file_can_be_opened(output.c_str()));
    assert(fixtures::list_dir(dir + "/tmp").empty());

    r = run({"--temp-dir=" + dir + "/tmp", "--output=" + dir + "/text.pdf", info});
    assert(r.exit_code == ScrubJob::EXIT_CLEAN);
    assert(r.out.find("pdfscrub: analyzing original file " + info) != std::string::npos);
    assert(r.out.find("ORIGINAL FILE") != std::string::npos);
    assert(r.out.find("SCRUBBED FILE") != std::string::npos);
    assert(r.out.find("  METADATA SUCCESSFULLY REMOVED\n") != std::string::npos);

    r = run({"--quiet", "--temp-dir", dir + "/tmp", "-o", dir + "/quiet.pdf", info});
    assert(r.out == "pdfscrub: " + dir + "/quiet.pdf: METADATA SUCCESSFULLY REMOVED\n");

    r = run({"--verbose", "--temp-dir", dir + "/tmp", "-o", dir + "/verbose.pdf", info});
    assert(r.out.find("pdfscrub: state TryingStrategy\n") != std::string::npos);
    assert(r.out.find("pdfscrub: entropy threshold 7.50") != std::string::npos);

    r = run({"--json", "--temp-dir", dir + "/tmp", dir + "/missing.pdf"});
    assert(r.exit_code == ScrubJob::EXIT_DETECTED);
    j = JSON::parse(r.out);
    assert(!bool_member(j, "success"));
    assert(string_member(member(j, "error"), "code") == "InputNotFound");
    assert(r.err.find("pdfscrub: InputNotFound: ") == 0);
}

static void
test_scan_signatures(std::string const& dir)
{
    auto in = dir + "/bytes.txt";
    auto out = dir + "/bytes_scrubbed.txt";
    {
        QUtil::FileCloser fc(QUtil::safe_fopen(in.c_str(), "wb"));
        std::string text = "<< /Producer (Microsoft Word) /Type /Catalog >>";
        assert(fwrite(text.data(), 1, text.length(), fc.f) == text.length());
    }
    auto r = run({"--scan-signatures", "--json", in});
    assert(r.exit_code == ScrubJob::EXIT_DETECTED);
    auto j = JSON::parse(r.out);
    assert(string_member(j, "mode") == "scan-signatures");
    assert(string_member(j, "output") == out);
    assert(bool_member(j, "changed"));
    auto data = fixtures::read_file(out);
    assert(data == "<< /Producer (" + std::string(9, ' ') + " " + std::string(4, ' ') +
           ") /Type /Catalog >>");

    r = run({"--scan-signatures", "-o", dir + "/again.txt", out});
    assert(r.exit_code == ScrubJob::EXIT_CLEAN);
    assert(r.out == "pdfscrub: no vendor signatures found; wrote " + dir + "/again.txt\n");
}

static void
test_verdicts()
{
    CheckResult found("document_info");
    found.addFinding(pdfscrub_loc_doc_info, "/Author", "Jane Doe");
    CheckResult clean("document_info");
    ForensicReport dirty_report("a.pdf", 10, "", {found}, StructuralReport(), FileTimes());
    ForensicReport clean_report("b.pdf", 10, "", {clean}, StructuralReport(), FileTimes());

    assert(
        std::string(ScrubJob::comparisonVerdict(dirty_report, clean_report)) ==
        "METADATA SUCCESSFULLY REMOVED");
    assert(
        std::string(ScrubJob::comparisonVerdict(clean_report, clean_report)) ==
        "NO METADATA IN ORIGINAL OR FINAL");
    assert(
        std::string(ScrubJob::comparisonVerdict(clean_report, dirty_report)) ==
        "METADATA STILL PRESENT");

    std::string text;
    Pl_String p("report", nullptr, text);
    ScrubJob::writeTextReport(p, dirty_report, "TITLE");
    ScrubJob::writeComparison(p, dirty_report, clean_report);
    p.finish();
    assert(text.find("TITLE\n") != std::string::npos);
    assert(text.find("  document_info: FOUND (1)\n") != std::string::npos);
    assert(text.find("  Original: metadata detected\n") != std::string::npos);
    assert(text.find("  Final: clean\n") != std::string::npos);
}

int
main()
{
    std::string dir;
    try {
        dir = fixtures::make_temp_dir();
        QUtil::os_wrapper("mkdir " + dir + "/tmp", mkdir((dir + "/tmp").c_str(), 0700));
        fixtures::write_document_with_info(dir + "/info.pdf");
        fixtures::write_clean_document(dir + "/clean.pdf");

        test_usage_errors(dir);
        test_config();
        test_help_and_version();
        test_validate(dir);
        test_scrub(dir);
        test_scan_signatures(dir);
        test_verdicts();

        fixtures::remove_tree(dir + "/tmp");
        fixtures::remove_tree(dir);
    } catch (std::exception& e) {
        std::cout << "unexpected exception: " << e.what() << std::endl;
        return 2;
    }
    std::cout << "done" << std::endl;
    return 0;
}
