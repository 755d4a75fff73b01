#include <pdfscrub/ScrubJob.hh>

#include <pdfscrub/QPDFDocumentModel.hh>
#include <pdfscrub/ScrubError.hh>
#include <pdfscrub/SignatureScanner.hh>
#include <pdfscrub/Util.hh>

#include <qpdf/JSON.hh>
#include <qpdf/QIntC.hh>
#include <qpdf/QUtil.hh>

#include <cstdlib>
#include <cstring>

using namespace pdfscrub;

ScrubJob::Members::Members() :
    log(QPDFLogger::defaultLogger())
{
}

ScrubJob::ScrubJob() :
    m(new Members())
{
}

void
ScrubJob::usage(std::string const& msg)
{
    throw ScrubUsage(msg);
}

std::string
ScrubJob::usageText(std::string const& whoami)
{
    return "Usage: " + whoami +
        " [options] input.pdf\n"
        "\n"
        "Remove identifying metadata from a PDF file and verify the result.\n"
        "\n"
        "  -o, --output=FILE           write the scrubbed file to FILE\n"
        "                              (default: <input>_scrubbed.pdf)\n"
        "  --validate-only             only report what metadata the file contains\n"
        "  --scan-signatures           blank vendor names in the raw bytes and write\n"
        "                              the result to the output file; this is a\n"
        "                              byte-level pass that can damage PDF syntax\n"
        "  --quiet                     print only the outcome\n"
        "  --verbose                   describe each step\n"
        "  --json                      print reports as JSON\n"
        "  --entropy-threshold=BITS    flag streams above this entropy (0 to 8,\n"
        "                              default 7.5)\n"
        "  --entropy-min-length=BYTES  ignore streams this short or shorter\n"
        "                              (default 100)\n"
        "  --temp-dir=DIR              directory for intermediate files\n"
        "  --version                   show version and exit\n"
        "  --help                      show this text and exit\n"
        "\n"
        "Exit status is 0 if no metadata was detected, 1 if metadata was detected or\n"
        "the operation failed, and 2 for usage errors.\n";
}

void
ScrubJob::initializeFromArgv(char const* const argv[])
{
    auto c = config();
    bool options_done = false;
    for (int i = 1; argv[i]; ++i) {
        std::string arg = argv[i];
        if (options_done || arg.empty() || (arg.at(0) != '-') || (arg == "-")) {
            c->inputFile(arg);
            continue;
        }
        std::string parameter;
        bool has_parameter = false;
        auto eq = arg.find('=');
        if ((arg.substr(0, 2) == "--") && (eq != std::string::npos)) {
            parameter = arg.substr(eq + 1);
            arg = arg.substr(0, eq);
            has_parameter = true;
        }
        auto need_parameter = [&]() {
            if (!has_parameter) {
                if (argv[i + 1] == nullptr) {
                    usage(arg + " requires a parameter");
                }
                parameter = argv[++i];
            }
            return parameter;
        };
        auto no_parameter = [&]() {
            if (has_parameter) {
                usage(arg + " does not take a parameter");
            }
        };

        if (arg == "--") {
            no_parameter();
            options_done = true;
        } else if ((arg == "-o") || (arg == "--output")) {
            c->outputFile(need_parameter());
        } else if (arg == "--validate-only") {
            no_parameter();
            c->validateOnly();
        } else if (arg == "--scan-signatures") {
            no_parameter();
            c->scanSignatures();
        } else if (arg == "--quiet") {
            no_parameter();
            c->quiet();
        } else if (arg == "--verbose") {
            no_parameter();
            c->verbose();
        } else if (arg == "--json") {
            no_parameter();
            c->json();
        } else if (arg == "--entropy-threshold") {
            c->entropyThreshold(need_parameter());
        } else if (arg == "--entropy-min-length") {
            c->entropyMinLength(need_parameter());
        } else if (arg == "--temp-dir") {
            c->tempDirectory(need_parameter());
        } else if (arg == "--version") {
            no_parameter();
            m->show_version = true;
        } else if (arg == "--help") {
            no_parameter();
            m->show_help = true;
        } else {
            usage("unrecognized argument " + std::string(argv[i]));
        }
    }
}

std::shared_ptr<ScrubJob::Config>
ScrubJob::config()
{
    return std::shared_ptr<Config>(new Config(*this));
}

void
ScrubJob::Config::checkConfiguration()
{
    o.checkConfiguration();
}

ScrubJob::Config*
ScrubJob::Config::inputFile(std::string const& filename)
{
    if (!o.m->infilename.empty()) {
        usage("input file has already been given");
    }
    o.m->infilename = filename;
    return this;
}

ScrubJob::Config*
ScrubJob::Config::outputFile(std::string const& filename)
{
    if (!o.m->outfilename.empty()) {
        usage("output file has already been given");
    }
    o.m->outfilename = filename;
    return this;
}

ScrubJob::Config*
ScrubJob::Config::validateOnly()
{
    o.m->validate_only = true;
    return this;
}

ScrubJob::Config*
ScrubJob::Config::scanSignatures()
{
    o.m->scan_signatures = true;
    return this;
}

ScrubJob::Config*
ScrubJob::Config::quiet()
{
    o.m->quiet = true;
    return this;
}

ScrubJob::Config*
ScrubJob::Config::verbose()
{
    o.m->verbose = true;
    return this;
}

ScrubJob::Config*
ScrubJob::Config::json()
{
    o.m->json = true;
    return this;
}

ScrubJob::Config*
ScrubJob::Config::entropyThreshold(std::string const& parameter)
{
    char* end = nullptr;
    double value = strtod(parameter.c_str(), &end);
    if (parameter.empty() || (*end != '\0') || !(value >= 0.0 && value <= 8.0)) {
        usage("--entropy-threshold must be a number from 0 to 8");
    }
    o.m->entropy_threshold = value;
    return this;
}

ScrubJob::Config*
ScrubJob::Config::entropyMinLength(std::string const& parameter)
{
    if (parameter.empty() ||
        (parameter.find_first_not_of("0123456789") != std::string::npos)) {
        usage("--entropy-min-length must be a non-negative integer");
    }
    try {
        o.m->entropy_min_length = QIntC::to_size(QUtil::string_to_ull(parameter.c_str()));
    } catch (std::runtime_error&) {
        usage("--entropy-min-length is out of range");
    }
    return this;
}

ScrubJob::Config*
ScrubJob::Config::tempDirectory(std::string const& directory)
{
    o.m->temp_dir = directory;
    return this;
}

void
ScrubJob::checkConfiguration()
{
    if (m->show_version || m->show_help) {
        return;
    }
    if (m->infilename.empty()) {
        usage("an input file name is required");
    }
    if (m->validate_only && m->scan_signatures) {
        usage("--validate-only and --scan-signatures may not be used together");
    }
    if (m->validate_only && !m->outfilename.empty()) {
        usage("--validate-only does not write an output file");
    }
    if (m->quiet && m->verbose) {
        usage("--quiet and --verbose may not be used together");
    }
    if (!m->outfilename.empty() &&
        QUtil::same_file(m->infilename.c_str(), m->outfilename.c_str())) {
        usage("the output file must be different from the input file");
    }
}

int
ScrubJob::getExitCode() const
{
    return m->exit_code;
}

std::shared_ptr<QPDFLogger>
ScrubJob::getLogger()
{
    return m->log;
}

void
ScrubJob::setLogger(std::shared_ptr<QPDFLogger> l)
{
    m->log = l;
}

void
ScrubJob::setOutputStreams(std::ostream* out, std::ostream* err)
{
    setLogger(QPDFLogger::create());
    m->log->setOutputStreams(out, err);
}

void
ScrubJob::setMessagePrefix(std::string const& message_prefix)
{
    m->message_prefix = message_prefix;
}

std::string
ScrubJob::getMessagePrefix() const
{
    return m->message_prefix;
}

void
ScrubJob::doIfVerbose(std::function<void(Pipeline&, std::string const& prefix)> fn)
{
    if (m->verbose) {
        fn(*m->log->getInfo(), m->message_prefix);
    }
}

ScrubOptions
ScrubJob::getScrubOptions() const
{
    ScrubOptions options;
    options.entropy_threshold = m->entropy_threshold;
    options.entropy_min_length = m->entropy_min_length;
    options.temp_dir = m->temp_dir;
    if (options.temp_dir.empty()) {
        if (!QUtil::get_env("TMPDIR", &options.temp_dir) || options.temp_dir.empty()) {
            options.temp_dir = "/tmp";
        }
    }
    options.verbose = m->verbose;
    // Progress lines would corrupt JSON on standard output.
    options.quiet = m->quiet || m->json;
    options.message_prefix = m->message_prefix;
    options.logger = m->log;
    return options;
}

static std::string
yes_no(bool value)
{
    return value ? "yes" : "no";
}

void
ScrubJob::writeTextReport(Pipeline& p, ForensicReport const& report, std::string const& title)
{
    std::string rule(64, '=');
    p << rule << "\n" << title << "\n" << rule << "\n";
    p << "File: " << report.getFilename() << "\n";
    p << "Size: " << report.getFileSize() << " bytes\n";
    p << "SHA-256: " << report.getSHA256() << "\n";
    p << "\nAssessment\n";
    p << "  Status: " << (report.metadataDetected() ? "METADATA DETECTED" : "CLEAN") << "\n";
    p << "  Confidence: " << report.getConfidenceLevel() << "\n";
    p << "  Scrubbing successful: " << yes_no(report.scrubbingSuccessful()) << "\n";

    p << "\nChecks\n";
    for (auto const& check: report.getChecks()) {
        p << "  " << check.getName() << ": ";
        if (check.found()) {
            p << "FOUND (" << (check.getFindings().size() + check.getHighEntropy().size())
              << ")\n";
        } else {
            p << "clean\n";
        }
        for (auto const& f: check.getFindings()) {
            p << "    " << MetadataFinding::locationName(f.location) << " " << f.key;
            if (!f.value_excerpt.empty()) {
                p << ": " << f.value_excerpt;
            }
            p << "\n";
        }
        for (auto const& r: check.getHighEntropy()) {
            p << "    " << r.object_id << ": entropy " << QUtil::double_to_string(r.entropy, 3)
              << ", " << r.byte_length << " bytes\n";
        }
        if (!check.getError().empty()) {
            p << "    error: " << check.getError() << "\n";
        }
    }

    auto const& s = report.getStructure();
    p << "\nStructure\n";
    p << "  Valid: " << yes_no(s.isValid()) << "\n";
    p << "  Readable pages: " << s.readable_pages << " of " << s.total_pages << "\n";
    for (auto const& c: s.corrupted_pages) {
        p << "  Corrupted: " << c << "\n";
    }
    for (auto const& f: s.missing_fonts) {
        p << "  Font without /BaseFont: " << f << "\n";
    }
    for (auto const& i: s.structural_issues) {
        p << "  Issue: " << i << "\n";
    }

    auto const& t = report.getFileTimes();
    p << "\nFilesystem\n";
    if (t.available) {
        p << "  Changed: " << t.creation_time << "\n";
        p << "  Modified: " << t.modification_time << "\n";
        p << "  Accessed: " << t.access_time << "\n";
    } else {
        p << "  error: " << t.error << "\n";
    }
    p << "\n";
}

char const*
ScrubJob::comparisonVerdict(ForensicReport const& original, ForensicReport const& final)
{
    if (final.metadataDetected()) {
        return "METADATA STILL PRESENT";
    }
    return original.metadataDetected() ? "METADATA SUCCESSFULLY REMOVED"
                                       : "NO METADATA IN ORIGINAL OR FINAL";
}

void
ScrubJob::writeComparison(
    Pipeline& p, ForensicReport const& original, ForensicReport const& final)
{
    p << "Comparison\n";
    p << "  Original: " << (original.metadataDetected() ? "metadata detected" : "clean") << "\n";
    p << "  Final: " << (final.metadataDetected() ? "metadata detected" : "clean") << "\n";
    p << "  " << comparisonVerdict(original, final) << "\n";
}

void
ScrubJob::writeJSON(JSON const& j)
{
    *m->log->getInfo() << j.unparse() << "\n";
}

void
ScrubJob::doValidate(Scrubber& scrubber)
{
    std::shared_ptr<ForensicReport> report;
    try {
        report = scrubber.validateOnly(m->infilename);
    } catch (ScrubError& e) {
        *m->log->getError() << m->message_prefix << ": " << e.what() << "\n";
        m->exit_code = EXIT_DETECTED;
        return;
    }
    m->exit_code = report->metadataDetected() ? EXIT_DETECTED : EXIT_CLEAN;
    if (m->json) {
        auto j = JSON::makeDictionary();
        j.addDictionaryMember("version", JSON::makeInt(1));
        j.addDictionaryMember("mode", JSON::makeString("validate"));
        j.addDictionaryMember("report", report->getJSON());
        writeJSON(j);
    } else if (m->quiet) {
        *m->log->getInfo() << m->message_prefix << ": " << m->infilename << ": "
                           << (report->metadataDetected() ? "metadata detected" : "clean")
                           << "\n";
    } else {
        writeTextReport(*m->log->getInfo(), *report, "FORENSIC VALIDATION REPORT");
    }
}

void
ScrubJob::doScrub(Scrubber& scrubber)
{
    auto result = scrubber.scrub(m->infilename, m->outfilename);
    if (result.success) {
        m->exit_code = result.final_report->metadataDetected() ? EXIT_DETECTED : EXIT_CLEAN;
    } else {
        m->exit_code = EXIT_DETECTED;
        *m->log->getError() << m->message_prefix << ": "
                            << ScrubError::codeName(result.error_code) << ": "
                            << result.error_message << "\n";
    }

    if (m->json) {
        auto j = JSON::makeDictionary();
        j.addDictionaryMember("version", JSON::makeInt(1));
        j.addDictionaryMember("mode", JSON::makeString("scrub"));
        j.addDictionaryMember("success", JSON::makeBool(result.success));
        if (result.success) {
            j.addDictionaryMember("strategy", JSON::makeString(result.strategy));
            j.addDictionaryMember("output", JSON::makeString(result.output_path));
        } else {
            auto j_error = j.addDictionaryMember("error", JSON::makeDictionary());
            j_error.addDictionaryMember(
                "code", JSON::makeString(ScrubError::codeName(result.error_code)));
            j_error.addDictionaryMember("message", JSON::makeString(result.error_message));
        }
        if (result.original_report) {
            j.addDictionaryMember("original", result.original_report->getJSON());
        }
        if (result.final_report) {
            j.addDictionaryMember("final", result.final_report->getJSON());
            j.addDictionaryMember(
                "comparison",
                JSON::makeString(
                    comparisonVerdict(*result.original_report, *result.final_report)));
        }
        writeJSON(j);
        return;
    }

    auto& info = *m->log->getInfo();
    if (m->quiet) {
        if (result.success) {
            info << m->message_prefix << ": " << result.output_path << ": "
                 << comparisonVerdict(*result.original_report, *result.final_report) << "\n";
        }
        return;
    }
    if (result.original_report) {
        writeTextReport(info, *result.original_report, "ORIGINAL FILE");
    }
    if (result.final_report) {
        writeTextReport(info, *result.final_report, "SCRUBBED FILE");
        writeComparison(info, *result.original_report, *result.final_report);
    }
}

void
ScrubJob::doScanSignatures()
{
    std::string outfilename =
        m->outfilename.empty() ? Scrubber::defaultOutputPath(m->infilename) : m->outfilename;
    std::string data;
    try {
        std::shared_ptr<char> buf;
        size_t size = 0;
        QUtil::read_file_into_memory(m->infilename.c_str(), buf, size);
        data.assign(buf.get(), size);
    } catch (std::exception& e) {
        *m->log->getError() << m->message_prefix << ": " << e.what() << "\n";
        m->exit_code = EXIT_DETECTED;
        return;
    }

    SignatureScanner scanner;
    bool unscoped = scanner.scanUnscoped(data);
    bool scoped = scanner.scanScoped(data);
    try {
        util::write_file(outfilename, data);
    } catch (std::exception& e) {
        *m->log->getError() << m->message_prefix << ": " << e.what() << "\n";
        m->exit_code = EXIT_DETECTED;
        return;
    }
    m->exit_code = (unscoped || scoped) ? EXIT_DETECTED : EXIT_CLEAN;
    if (m->json) {
        auto j = JSON::makeDictionary();
        j.addDictionaryMember("version", JSON::makeInt(1));
        j.addDictionaryMember("mode", JSON::makeString("scan-signatures"));
        j.addDictionaryMember("output", JSON::makeString(outfilename));
        j.addDictionaryMember("changed", JSON::makeBool(unscoped || scoped));
        writeJSON(j);
    } else {
        *m->log->getInfo() << m->message_prefix << ": "
                           << ((unscoped || scoped) ? "vendor signatures blanked"
                                                    : "no vendor signatures found")
                           << "; wrote " << outfilename << "\n";
    }
}

void
ScrubJob::run()
{
    checkConfiguration();
    if (m->show_help) {
        *m->log->getInfo() << usageText(m->message_prefix);
        return;
    }
    if (m->show_version) {
        *m->log->getInfo() << m->message_prefix << " version " << PDFSCRUB_VERSION << "\n";
        return;
    }
    if (m->scan_signatures) {
        doScanSignatures();
        return;
    }

    auto options = getScrubOptions();
    auto model = std::make_shared<QPDFDocumentModel>();
    model->setLogger(m->log);
    Scrubber scrubber(model, options);
    doIfVerbose([&](Pipeline& v, std::string const& prefix) {
        v << prefix << ": entropy threshold " << QUtil::double_to_string(options.entropy_threshold, 2)
          << ", minimum length " << options.entropy_min_length << ", temporary files in "
          << options.temp_dir << "\n";
    });
    if (m->validate_only) {
        doValidate(scrubber);
    } else {
        doScrub(scrubber);
    }
}
