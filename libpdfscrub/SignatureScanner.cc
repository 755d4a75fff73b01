#include <pdfscrub/SignatureScanner.hh>

#include <pdfscrub/Util.hh>

using namespace pdfscrub;

static char const* vendor_terms[] = {
    "Adobe",
    "Microsoft",
    "LibreOffice",
    "OpenOffice",
    "Word",
    "Acrobat",
    "Writer",
    "Pages",
    "LaTeX",
    "PDFCreator",
    "PDFMaker",
    "Distiller",
    "PowerPoint",
    "Excel",
    "Keynote",
};

SignatureScanner::SignatureScanner() :
    SignatureScanner(vendorTokens(), metadataKeys())
{
}

SignatureScanner::SignatureScanner(
    std::vector<std::string> const& tokens, std::vector<std::string> const& keys) :
    tokens(tokens),
    keys(keys)
{
}

std::vector<std::string>
SignatureScanner::caseVariants(std::string const& term)
{
    std::vector<std::string> result;
    for (auto const& v: {term, util::upper(term), util::lower(term)}) {
        if (!util::contains(result, v)) {
            result.push_back(v);
        }
    }
    return result;
}

std::vector<std::string>
SignatureScanner::vendorTokens()
{
    std::vector<std::string> result;
    for (auto term: vendor_terms) {
        for (auto const& v: caseVariants(term)) {
            result.push_back(v);
        }
    }
    return result;
}

std::vector<std::string>
SignatureScanner::narrowVendorTokens()
{
    return caseVariants("Adobe");
}

std::vector<std::string>
SignatureScanner::metadataKeys()
{
    return {
        "/Producer",
        "/Creator",
        "/Author",
        "/Title",
        "/Subject",
        "/Keywords",
        "/Application",
        "/CreationDate",
        "/ModDate"};
}

bool
SignatureScanner::scanUnscoped(std::string& data) const
{
    bool changed = false;
    for (auto const& token: this->tokens) {
        if (token.empty()) {
            continue;
        }
        size_t pos = 0;
        while ((pos = data.find(token, pos)) != std::string::npos) {
            data.replace(pos, token.length(), token.length(), ' ');
            pos += token.length();
            changed = true;
        }
    }
    return changed;
}

size_t
SignatureScanner::findValueEnd(std::string const& data, size_t start)
{
    size_t const n = data.length();
    size_t depth = 0;
    size_t i = start;
    while (i < n) {
        char ch = data.at(i);
        if (depth > 0) {
            if (ch == '\\') {
                // The escaped character can't open or close the string.
                i += 2;
                continue;
            }
            if (ch == '(') {
                ++depth;
            } else if (ch == ')') {
                if (--depth == 0) {
                    return i + 1;
                }
            }
        } else if (ch == '(') {
            depth = 1;
        } else if (ch == '/') {
            return i;
        } else if ((ch == '>') && (i + 1 < n) && (data.at(i + 1) == '>')) {
            return i;
        }
        ++i;
    }
    return n;
}

size_t
SignatureScanner::blankTokensInSpan(std::string& data, size_t begin, size_t end) const
{
    size_t replaced = 0;
    std::string span = util::lower(data.substr(begin, end - begin));
    for (auto const& token: this->tokens) {
        if (token.empty()) {
            continue;
        }
        auto needle = util::lower(token);
        size_t pos = 0;
        while ((pos = span.find(needle, pos)) != std::string::npos) {
            data.replace(begin + pos, needle.length(), needle.length(), ' ');
            span.replace(pos, needle.length(), needle.length(), ' ');
            pos += needle.length();
            ++replaced;
        }
    }
    return replaced;
}

bool
SignatureScanner::scanScoped(std::string& data) const
{
    bool changed = false;
    for (auto const& key: this->keys) {
        if (key.empty()) {
            continue;
        }
        size_t start = 0;
        size_t pos = 0;
        while ((pos = data.find(key, start)) != std::string::npos) {
            size_t value_start = pos + key.length();
            size_t value_end = findValueEnd(data, value_start);
            if (blankTokensInSpan(data, value_start, value_end) > 0) {
                changed = true;
            }
            // Resume after the value so nothing inside it is matched as a
            // key.
            start = value_end;
        }
    }
    return changed;
}
