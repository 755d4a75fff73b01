#ifndef PDFSCRUB_UTIL_HH
#define PDFSCRUB_UTIL_HH

#include <qpdf/Pl_StdioFile.hh>
#include <qpdf/QUtil.hh>

#include <cstdio>
#include <stdexcept>
#include <string>
#include <vector>

namespace pdfscrub::util
{
    // Internal helpers shared by the scanner, sanitizer and validator.
    // All comparisons are ASCII-only; PDF names and the token lists are
    // ASCII.

    inline char
    to_lower(char ch)
    {
        return (ch >= 'A' && ch <= 'Z') ? static_cast<char>(ch - 'A' + 'a') : ch;
    }

    inline char
    to_upper(char ch)
    {
        return (ch >= 'a' && ch <= 'z') ? static_cast<char>(ch - 'a' + 'A') : ch;
    }

    inline std::string
    lower(std::string s)
    {
        for (auto& ch: s) {
            ch = to_lower(ch);
        }
        return s;
    }

    inline std::string
    upper(std::string s)
    {
        for (auto& ch: s) {
            ch = to_upper(ch);
        }
        return s;
    }

    // True if value contains any of terms, ignoring case. terms must
    // already be lower case.
    inline bool
    contains_any_nocase(std::string const& value, std::vector<std::string> const& terms)
    {
        auto haystack = lower(value);
        for (auto const& term: terms) {
            if (haystack.find(term) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    inline bool
    contains(std::vector<std::string> const& list, std::string const& item)
    {
        for (auto const& i: list) {
            if (i == item) {
                return true;
            }
        }
        return false;
    }

    // At most max_length bytes of s, cut on a UTF-8 character boundary
    inline std::string
    truncate(std::string const& s, size_t max_length)
    {
        if (s.length() <= max_length) {
            return s;
        }
        size_t n = max_length;
        while ((n > 0) && ((static_cast<unsigned char>(s.at(n)) & 0xC0) == 0x80)) {
            --n;
        }
        return s.substr(0, n);
    }

    // Replace the contents of filename with data. If anything fails,
    // filename is removed and the exception is rethrown.
    inline void
    write_file(std::string const& filename, std::string const& data)
    {
        try {
            QUtil::FileCloser fc(QUtil::safe_fopen(filename.c_str(), "wb"));
            Pl_StdioFile out(filename.c_str(), fc.f);
            out.writeString(data);
            out.finish();
            FILE* f = fc.f;
            fc.f = nullptr;
            if (fclose(f) != 0) {
                QUtil::throw_system_error("close " + filename);
            }
        } catch (std::exception&) {
            (void)remove(filename.c_str());
            throw;
        }
    }
} // namespace pdfscrub::util

#endif // PDFSCRUB_UTIL_HH
