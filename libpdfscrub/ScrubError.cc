#include <pdfscrub/ScrubError.hh>

using namespace pdfscrub;

ScrubError::ScrubError(
    pdfscrub_error_code_e error_code,
    std::string const& filename,
    std::string const& message) :
    std::runtime_error(createWhat(filename, message)),
    error_code(error_code),
    filename(filename),
    message(message)
{
}

std::string
ScrubError::createWhat(std::string const& filename, std::string const& message)
{
    std::string result;
    if (!filename.empty()) {
        result += filename + ": ";
    }
    result += message;
    return result;
}

pdfscrub_error_code_e
ScrubError::getErrorCode() const
{
    return this->error_code;
}

std::string const&
ScrubError::getFilename() const
{
    return this->filename;
}

std::string const&
ScrubError::getMessageDetail() const
{
    return this->message;
}

char const*
ScrubError::codeName(pdfscrub_error_code_e code)
{
    switch (code) {
    case pdfscrub_e_success:
        return "Success";
    case pdfscrub_e_input_not_found:
        return "InputNotFound";
    case pdfscrub_e_parse:
        return "ParseError";
    case pdfscrub_e_write:
        return "WriteError";
    case pdfscrub_e_sanitization:
        return "SanitizationFailed";
    case pdfscrub_e_all_methods_failed:
        return "AllMethodsFailed";
    }
    return "UnknownError";
}

ScrubUsage::ScrubUsage(std::string const& msg) :
    std::runtime_error(msg)
{
}
