#include <pdfscrub/assert_test.h>

#include "pdf_fixtures.hh"

#include <pdfscrub/QPDFDocumentModel.hh>
#include <pdfscrub/ScrubError.hh>
#include <pdfscrub/Scrubber.hh>

#include <qpdf/QPDFLogger.hh>
#include <qpdf/QUtil.hh>

#include <iostream>
#include <sstream>
#include <sys/stat.h>

using namespace pdfscrub;

namespace
{
    // Either fails outright or writes a copy of a fixed document,
    // counting how often it was asked to do so.
    class FakeStrategy: public ScrubStrategy
    {
      public:
        FakeStrategy(std::string const& name, std::string const& source = "") :
            name(name),
            source(source)
        {
        }
        ~FakeStrategy() override = default;

        std::string
        getName() const override
        {
            return this->name;
        }

        void
        apply(std::string const& input, std::string const& output) override
        {
            ++this->calls;
            if (this->source.empty()) {
                throw ScrubError(pdfscrub_e_parse, input, "fake strategy failure");
            }
            fixtures::copy_file(this->source, output);
        }

        int calls{0};

      private:
        std::string name;
        std::string source;
    };

    struct Context
    {
        std::string dir;
        std::string temp_dir;
        std::string info;
        std::string clean;
        std::string noisy;
        std::ostringstream out;
        std::ostringstream err;

        ScrubOptions
        options(bool verbose = false)
        {
            ScrubOptions o;
            o.temp_dir = this->temp_dir;
            o.verbose = verbose;
            o.logger = QPDFLogger::create();
            o.logger->setOutputStreams(&this->out, &this->err);
            return o;
        }

        void
        reset()
        {
            this->out.str("");
            this->err.str("");
        }
    };
} // namespace

static void
test_all_failed(Context& c)
{
    auto first = std::make_shared<FakeStrategy>("first");
    auto second = std::make_shared<FakeStrategy>("second");
    // Survives sanitizing but not validation
    auto third = std::make_shared<FakeStrategy>("third", c.noisy);
    auto model = std::make_shared<QPDFDocumentModel>();
    Scrubber s(model, c.options(), {first, second, third});
    std::vector<Scrubber::State> states;
    s.registerStateObserver([&](Scrubber::State st) { states.push_back(st); });

    auto output = c.dir + "/all-failed.pdf";
    auto result = s.scrub(c.info, output);
    assert(!result.success);
    assert(result.error_code == pdfscrub_e_all_methods_failed);
    assert(result.strategy.empty());
    assert(result.original_report && result.original_report->metadataDetected());
    assert(!result.final_report);
    assert((first->calls == 1) && (second->calls == 1) && (third->calls == 1));
    assert(!QUtil::file_can_be_opened(output.c_str()));
    assert(fixtures::list_dir(c.temp_dir).empty());

    size_t tried = 0;
    size_t validated = 0;
    for (auto st: states) {
        if (st == Scrubber::State::trying_strategy) {
            ++tried;
        } else if (st == Scrubber::State::validating) {
            ++validated;
        }
    }
    assert(tried == 3);
    assert(validated == 1);
    assert(states.back() == Scrubber::State::all_failed);

    auto err = c.err.str();
    assert(err.find("pdfscrub: first failed: ParseError") != std::string::npos);
    assert(err.find("pdfscrub: candidate from third still contains metadata") != std::string::npos);
    std::cout << "all failed: " << result.error_message << std::endl;
    c.reset();
}

static void
test_first_wins(Context& c)
{
    auto first = std::make_shared<FakeStrategy>("first", c.clean);
    auto second = std::make_shared<FakeStrategy>("second");
    auto third = std::make_shared<FakeStrategy>("third");
    auto model = std::make_shared<QPDFDocumentModel>();
    Scrubber s(model, c.options(true), {first, second, third});
    std::vector<Scrubber::State> states;
    s.registerStateObserver([&](Scrubber::State st) { states.push_back(st); });

    auto output = c.dir + "/first-wins.pdf";
    auto result = s.scrub(c.info, output);
    assert(result.success);
    assert(result.error_code == pdfscrub_e_success);
    assert(result.strategy == "first");
    assert(result.output_path == output);
    assert((first->calls == 1) && (second->calls == 0) && (third->calls == 0));
    assert(result.final_report && !result.final_report->metadataDetected());
    assert(QUtil::file_can_be_opened(output.c_str()));
    assert(fixtures::list_dir(c.temp_dir).empty());

    std::vector<Scrubber::State> expected = {
        Scrubber::State::init,
        Scrubber::State::analyzing_original,
        Scrubber::State::trying_strategy,
        Scrubber::State::sanitizing,
        Scrubber::State::validating,
        Scrubber::State::accepted};
    assert(states == expected);

    auto out = c.out.str();
    assert(out.find("pdfscrub: state Accepted") != std::string::npos);
    assert(out.find("pdfscrub: accepted candidate from first") != std::string::npos);
    c.reset();
}

static void
test_end_to_end(Context& c)
{
    auto input = c.dir + "/rich.pdf";
    fixtures::write_rich_document(input);
    auto model = std::make_shared<QPDFDocumentModel>();
    auto options = c.options();
    options.quiet = true;
    Scrubber s(model, options);

    auto result = s.scrub(input);
    assert(result.success);
    assert(result.strategy == "reconstruct");
    assert(result.output_path == c.dir + "/rich_scrubbed.pdf");
    assert(result.original_report->metadataDetected());
    assert(!result.final_report->metadataDetected());
    assert(result.final_report->getConfidenceLevel() == "HIGH");
    assert(result.final_report->getStructure().isValid());
    assert(result.final_report->getStructure().total_pages == 1);
    assert(fixtures::list_dir(c.temp_dir).empty());
    // quiet suppresses progress but not warnings
    assert(c.out.str().empty());

    // Scrubbing the output again still succeeds on the first strategy.
    auto again = s.scrub(result.output_path, c.dir + "/rich_again.pdf");
    assert(again.success);
    assert(!again.original_report->metadataDetected());
    assert(again.strategy == "reconstruct");

    auto report = s.validateOnly(result.output_path);
    assert(report->scrubbingSuccessful());
    c.reset();
}

static void
test_input_not_found(Context& c)
{
    auto model = std::make_shared<QPDFDocumentModel>();
    auto strategy = std::make_shared<FakeStrategy>("only", c.clean);
    Scrubber s(model, c.options(), {strategy});
    std::vector<Scrubber::State> states;
    s.registerStateObserver([&](Scrubber::State st) { states.push_back(st); });

    auto result = s.scrub(c.dir + "/missing.pdf");
    assert(!result.success);
    assert(result.error_code == pdfscrub_e_input_not_found);
    assert(!result.original_report);
    assert(strategy->calls == 0);
    assert(states.size() == 1);
    assert(states.at(0) == Scrubber::State::init);
    assert(!QUtil::file_can_be_opened((c.dir + "/missing_scrubbed.pdf").c_str()));

    try {
        s.validateOnly(c.dir + "/missing.pdf");
        assert(false);
    } catch (ScrubError& e) {
        assert(e.getErrorCode() == pdfscrub_e_input_not_found);
    }

    // No strategies at all
    Scrubber none(model, c.options(), {});
    auto r = none.scrub(c.info, c.dir + "/none.pdf");
    assert(r.error_code == pdfscrub_e_all_methods_failed);
    assert(fixtures::list_dir(c.temp_dir).empty());
    c.reset();
}

static void
test_missing_temp_dir(Context& c)
{
    auto model = std::make_shared<QPDFDocumentModel>();
    auto strategy = std::make_shared<FakeStrategy>("only", c.clean);
    auto options = c.options();
    options.temp_dir = c.dir + "/no-such-dir";
    Scrubber s(model, options, {strategy});
    auto output = c.dir + "/temp.pdf";
    auto result = s.scrub(c.info, output);
    assert(!result.success);
    assert(result.error_code == pdfscrub_e_write);
    assert(result.error_message.find("no-such-dir") != std::string::npos);
    assert(result.original_report);
    assert(strategy->calls == 0);
    assert(!QUtil::file_can_be_opened(output.c_str()));
    std::cout << "missing temp dir: " << ScrubError::codeName(result.error_code) << std::endl;
    c.reset();
}

static void
test_names()
{
    assert(Scrubber::defaultOutputPath("a/b/report.pdf") == "a/b/report_scrubbed.pdf");
    assert(Scrubber::defaultOutputPath("report") == "report_scrubbed");
    assert(Scrubber::defaultOutputPath("dir.v2/report") == "dir.v2/report_scrubbed");
    assert(Scrubber::defaultOutputPath(".hidden") == ".hidden_scrubbed");
    assert(Scrubber::defaultOutputPath("x/.hidden") == "x/.hidden_scrubbed");
    assert(Scrubber::defaultOutputPath("archive.tar.pdf") == "archive.tar_scrubbed.pdf");

    assert(std::string(Scrubber::stateName(Scrubber::State::init)) == "Init");
    assert(
        std::string(Scrubber::stateName(Scrubber::State::analyzing_original)) ==
        "AnalyzingOriginal");
    assert(std::string(Scrubber::stateName(Scrubber::State::all_failed)) == "AllFailed");
}

int
main()
{
    Context c;
    try {
        c.dir = fixtures::make_temp_dir();
        c.temp_dir = c.dir + "/tmp";
        QUtil::os_wrapper("mkdir " + c.temp_dir, mkdir(c.temp_dir.c_str(), 0700));
        c.info = c.dir + "/info.pdf";
        c.clean = c.dir + "/clean.pdf";
        c.noisy = c.dir + "/noisy.pdf";
        fixtures::write_document_with_info(c.info);
        fixtures::write_clean_document(c.clean);
        fixtures::write_high_entropy_document(c.noisy);

        test_all_failed(c);
        test_first_wins(c);
        test_end_to_end(c);
        test_input_not_found(c);
        test_missing_temp_dir(c);
        test_names();

        fixtures::remove_tree(c.temp_dir);
        fixtures::remove_tree(c.dir);
    } catch (std::exception& e) {
        std::cout << "unexpected exception: " << e.what() << std::endl;
        return 2;
    }
    std::cout << "done" << std::endl;
    return 0;
}
