#include <pdfscrub/assert_test.h>

#include <pdfscrub/SignatureScanner.hh>

#include <iostream>
#include <string>

using namespace pdfscrub;

static void
test_case_variants()
{
    auto v = SignatureScanner::caseVariants("Adobe");
    assert(v.size() == 3);
    assert(v.at(0) == "Adobe");
    assert(v.at(1) == "ADOBE");
    assert(v.at(2) == "adobe");

    // Duplicates collapse.
    v = SignatureScanner::caseVariants("latex");
    assert(v.size() == 2);
    assert(v.at(0) == "latex");
    assert(v.at(1) == "LATEX");
    assert(SignatureScanner::caseVariants("PDF").size() == 2);

    assert(SignatureScanner::narrowVendorTokens() == SignatureScanner::caseVariants("Adobe"));
    auto all = SignatureScanner::vendorTokens();
    for (auto const& t: {"Microsoft", "MICROSOFT", "microsoft", "PDFCreator", "Keynote"}) {
        bool seen = false;
        for (auto const& token: all) {
            if (token == t) {
                seen = true;
            }
        }
        assert(seen);
    }
}

static void
test_find_value_end()
{
    // Literal string with nesting and an escaped parenthesis
    std::string data = "/Producer (Adobe (nested) \\) text)/Title (x)";
    assert(SignatureScanner::findValueEnd(data, 9) == data.find("/Title"));

    // Names and numbers end before the next key or the dictionary end
    data = "/Author 42>>";
    assert(SignatureScanner::findValueEnd(data, 7) == data.find(">>"));
    data = "/Creator /Name/Title";
    assert(SignatureScanner::findValueEnd(data, 8) == 9);

    // A single ">" is not a delimiter
    data = "/Title <4142>/Author";
    assert(SignatureScanner::findValueEnd(data, 6) == data.find("/Author"));

    // A stray ")" outside a string is ignored
    data = "/Author 1)2/Title";
    assert(SignatureScanner::findValueEnd(data, 7) == data.find("/Title"));

    // Unclosed values run to the end
    data = "/Producer (never closed / >>";
    assert(SignatureScanner::findValueEnd(data, 9) == data.length());
    data = "/Producer (ends in escape \\";
    assert(SignatureScanner::findValueEnd(data, 9) == data.length());
    assert(SignatureScanner::findValueEnd(data, data.length()) == data.length());
}

static void
test_scoped()
{
    SignatureScanner scanner;
    std::string data = "/Producer (Adobe Acrobat 9.0)/Title (Report)";
    std::string expected = "/Producer (" + std::string(13, ' ') + " 9.0)/Title (Report)";
    auto length = data.length();
    assert(scanner.scanScoped(data));
    assert(data == expected);
    assert(data.length() == length);

    // Matching inside a value ignores case; keywords outside values
    // are left alone.
    data = "<< /Type /Pages /Count 1 /Creator (MiCrOsOfT wOrD) >>";
    expected = "<< /Type /Pages /Count 1 /Creator (" + std::string(9, ' ') + " " +
        std::string(4, ' ') + ") >>";
    assert(scanner.scanScoped(data));
    assert(data == expected);

    // Nothing to do
    data = "/Producer (pdfscrub)/Title (Quarterly)";
    std::string before = data;
    assert(!scanner.scanScoped(data));
    assert(data == before);

    // A second pass finds nothing.
    data = "/Author (Adobe)";
    assert(scanner.scanScoped(data));
    assert(!scanner.scanScoped(data));
}

static void
test_unscoped()
{
    SignatureScanner narrow(SignatureScanner::narrowVendorTokens());
    std::string data = "/Pages 2 0 R /Producer (ADOBE adobe Adobe) %Word";
    std::string expected = "/Pages 2 0 R /Producer (" + std::string(17, ' ') + ") %Word";
    assert(narrow.scanUnscoped(data));
    assert(data == expected);
    assert(!narrow.scanUnscoped(data));

    // The full list would damage syntax, which is why it is only ever
    // used in scoped mode.
    SignatureScanner full;
    data = "/Type /Pages";
    assert(full.scanUnscoped(data));
    assert(data == "/Type /     ");

    SignatureScanner none(std::vector<std::string>{""});
    data = "Adobe";
    assert(!none.scanUnscoped(data));
    assert(!none.scanScoped(data));
}

int
main()
{
    try {
        test_case_variants();
        test_find_value_end();
        test_scoped();
        test_unscoped();
    } catch (std::exception& e) {
        std::cout << "unexpected exception: " << e.what() << std::endl;
        return 2;
    }
    std::cout << "done" << std::endl;
    return 0;
}
