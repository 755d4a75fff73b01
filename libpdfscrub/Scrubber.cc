#include <pdfscrub/Scrubber.hh>

#include <pdfscrub/ForensicValidator.hh>
#include <pdfscrub/ScrubError.hh>
#include <pdfscrub/StructuralSanitizer.hh>
#include <pdfscrub/TempFileSet.hh>
#include <pdfscrub/Util.hh>

#include <qpdf/QUtil.hh>

#include <cstdio>
#include <stdexcept>

using namespace pdfscrub;

Scrubber::Scrubber(std::shared_ptr<DocumentModel> model, ScrubOptions const& options) :
    Scrubber(model, options, defaultStrategies(model))
{
}

Scrubber::Scrubber(
    std::shared_ptr<DocumentModel> model,
    ScrubOptions const& options,
    std::vector<std::shared_ptr<ScrubStrategy>> const& strategies) :
    model(model),
    options(options),
    strategies(strategies),
    log(options.logger ? options.logger : QPDFLogger::defaultLogger())
{
}

char const*
Scrubber::stateName(State state)
{
    switch (state) {
    case State::init:
        return "Init";
    case State::analyzing_original:
        return "AnalyzingOriginal";
    case State::trying_strategy:
        return "TryingStrategy";
    case State::sanitizing:
        return "Sanitizing";
    case State::validating:
        return "Validating";
    case State::next_strategy:
        return "NextStrategy";
    case State::accepted:
        return "Accepted";
    case State::all_failed:
        return "AllFailed";
    }
    return "Unknown";
}

std::string
Scrubber::defaultOutputPath(std::string const& input)
{
    auto slash = input.rfind('/');
    size_t basename_start = (slash == std::string::npos) ? 0 : slash + 1;
    auto dot = input.rfind('.');
    // A leading dot names a hidden file, not an extension.
    if ((dot == std::string::npos) || (dot <= basename_start)) {
        return input + "_scrubbed";
    }
    return input.substr(0, dot) + "_scrubbed" + input.substr(dot);
}

void
Scrubber::registerStateObserver(std::function<void(State)> observer)
{
    this->state_observer = observer;
}

void
Scrubber::doIfVerbose(std::function<void(Pipeline&, std::string const& prefix)> fn)
{
    if (this->options.verbose) {
        fn(*this->log->getInfo(), this->options.message_prefix);
    }
}

void
Scrubber::enter(State state)
{
    doIfVerbose([&](Pipeline& v, std::string const& prefix) {
        v << prefix << ": state " << stateName(state) << "\n";
    });
    if (this->state_observer) {
        this->state_observer(state);
    }
}

void
Scrubber::info(std::string const& msg)
{
    if (!this->options.quiet) {
        *this->log->getInfo() << this->options.message_prefix << ": " << msg << "\n";
    }
}

void
Scrubber::warn(std::string const& msg)
{
    *this->log->getWarn() << this->options.message_prefix << ": " << msg << "\n";
}

void
Scrubber::logRejection(std::string const& strategy, ForensicReport const& report)
{
    warn("candidate from " + strategy + " still contains metadata");
    doIfVerbose([&](Pipeline& v, std::string const& prefix) {
        for (auto const& check: report.getChecks()) {
            if (!check.found()) {
                continue;
            }
            v << prefix << ":   " << check.getName() << "\n";
            for (auto const& f: check.getFindings()) {
                v << prefix << ":     " << MetadataFinding::locationName(f.location) << " "
                  << f.key;
                if (!f.value_excerpt.empty()) {
                    v << " = " << f.value_excerpt;
                }
                v << "\n";
            }
            for (auto const& r: check.getHighEntropy()) {
                v << prefix << ":     " << r.object_id << ": entropy "
                  << QUtil::double_to_string(r.entropy, 3) << ", " << r.byte_length
                  << " bytes\n";
            }
        }
    });
}

void
Scrubber::installOutput(std::string const& candidate, std::string const& output)
{
    // Write next to the output and rename so that output is either
    // absent or complete.
    auto slash = output.rfind('/');
    std::string dir =
        (slash == std::string::npos) ? "." : ((slash == 0) ? "/" : output.substr(0, slash));
    TempFileSet sibling(dir);
    auto tmp = sibling.create();

    std::shared_ptr<char> buf;
    size_t size = 0;
    QUtil::read_file_into_memory(candidate.c_str(), buf, size);
    std::string data(buf.get(), size);

    util::write_file(tmp, data);
    QUtil::rename_file(tmp.c_str(), output.c_str());
}

bool
Scrubber::createTemp(TempFileSet& temps, std::string& path, ScrubResult& result)
{
    try {
        path = temps.create();
    } catch (std::runtime_error& e) {
        result.error_code = pdfscrub_e_write;
        result.error_message = e.what();
        return false;
    }
    return true;
}

std::shared_ptr<ForensicReport>
Scrubber::validateOnly(std::string const& path)
{
    ForensicValidator validator(
        this->model,
        EntropyAnalyzer(this->options.entropy_threshold, this->options.entropy_min_length));
    return validator.validate(path);
}

ScrubResult
Scrubber::scrub(std::string const& input, std::string const& output_arg)
{
    ScrubResult result;
    ForensicValidator validator(
        this->model,
        EntropyAnalyzer(this->options.entropy_threshold, this->options.entropy_min_length));
    TempFileSet temps(this->options.temp_dir);

    std::string output = output_arg.empty() ? defaultOutputPath(input) : output_arg;
    size_t index = 0;
    std::shared_ptr<ScrubStrategy> strategy;
    std::string candidate;
    std::string sanitized;

    State state = State::init;
    bool done = false;
    while (!done) {
        enter(state);
        switch (state) {
        case State::init:
            if (!QUtil::file_can_be_opened(input.c_str())) {
                result.error_code = pdfscrub_e_input_not_found;
                result.error_message = input + ": input file does not exist or can't be read";
                done = true;
            } else {
                state = State::analyzing_original;
            }
            break;

        case State::analyzing_original:
            info("analyzing original file " + input);
            try {
                result.original_report = validator.validate(input);
            } catch (ScrubError& e) {
                result.error_code = e.getErrorCode();
                result.error_message = e.what();
                done = true;
                break;
            }
            state = this->strategies.empty() ? State::all_failed : State::trying_strategy;
            break;

        case State::trying_strategy:
            strategy = this->strategies.at(index);
            info("applying strategy " + strategy->getName());
            if (!createTemp(temps, candidate, result)) {
                done = true;
                break;
            }
            try {
                strategy->apply(input, candidate);
                state = State::sanitizing;
            } catch (ScrubError& e) {
                warn(strategy->getName() + " failed: " + ScrubError::codeName(e.getErrorCode()));
                doIfVerbose([&](Pipeline& v, std::string const& prefix) {
                    v << prefix << ":   " << e.what() << "\n";
                });
                state = State::next_strategy;
            }
            break;

        case State::sanitizing:
            info("sanitizing candidate from " + strategy->getName());
            if (!createTemp(temps, sanitized, result)) {
                done = true;
                break;
            }
            {
                StructuralSanitizer sanitizer;
                try {
                    sanitizer.sanitizeFile(*this->model, candidate, sanitized);
                    state = State::validating;
                } catch (ScrubError& e) {
                    warn(
                        "sanitizing " + strategy->getName() +
                        " candidate failed: " + ScrubError::codeName(e.getErrorCode()));
                    doIfVerbose([&](Pipeline& v, std::string const& prefix) {
                        v << prefix << ":   " << e.what() << "\n";
                    });
                    state = State::next_strategy;
                }
                auto const& stats = sanitizer.getStats();
                doIfVerbose([&](Pipeline& v, std::string const& prefix) {
                    v << prefix << ": removed " << stats.fields_removed << " fields, replaced "
                      << stats.fields_replaced << ", dropped " << stats.annotations_dropped
                      << " annotations, skipped " << stats.fields_skipped << " fields\n";
                    for (auto const& s: stats.skipped) {
                        v << prefix << ":   skipped " << s << "\n";
                    }
                });
            }
            break;

        case State::validating:
            info("validating candidate from " + strategy->getName());
            try {
                auto report = validator.validate(sanitized);
                if (report->scrubbingSuccessful()) {
                    state = State::accepted;
                } else {
                    logRejection(strategy->getName(), *report);
                    state = State::next_strategy;
                }
            } catch (ScrubError& e) {
                warn("validating " + strategy->getName() + " candidate failed: " + e.what());
                state = State::next_strategy;
            }
            break;

        case State::next_strategy:
            ++index;
            state = (index < this->strategies.size()) ? State::trying_strategy : State::all_failed;
            break;

        case State::accepted:
            try {
                installOutput(sanitized, output);
            } catch (std::runtime_error& e) {
                result.error_code = pdfscrub_e_write;
                result.error_message = output + ": " + e.what();
                done = true;
                break;
            }
            info("accepted candidate from " + strategy->getName() + "; wrote " + output);
            try {
                result.final_report = validator.validate(output);
            } catch (ScrubError& e) {
                (void)remove(output.c_str());
                result.error_code = e.getErrorCode();
                result.error_message = e.what();
                done = true;
                break;
            }
            result.success = true;
            result.strategy = strategy->getName();
            result.output_path = output;
            done = true;
            break;

        case State::all_failed:
            result.error_code = pdfscrub_e_all_methods_failed;
            result.error_message = "all scrubbing methods failed for " + input;
            done = true;
            break;
        }
    }

    for (auto const& path: temps.cleanup()) {
        warn("unable to remove intermediate file " + path);
    }
    return result;
}
