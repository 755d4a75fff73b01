#include <pdfscrub/assert_test.h>

#include <pdfscrub/EntropyAnalyzer.hh>

#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace pdfscrub;

static bool
close_to(double a, double b)
{
    return std::fabs(a - b) < 1e-9;
}

// n distinct byte values, once each
static std::string
distinct_bytes(size_t n)
{
    std::string result;
    for (size_t i = 0; i < n; ++i) {
        result.append(1, static_cast<char>(i));
    }
    return result;
}

static void
test_entropy_values()
{
    assert(EntropyAnalyzer::entropy("") == 0.0);
    assert(EntropyAnalyzer::entropy(std::string(1000, 'x')) == 0.0);
    assert(close_to(EntropyAnalyzer::entropy(distinct_bytes(256)), 8.0));
    assert(close_to(EntropyAnalyzer::entropy("abababab"), 1.0));
    assert(close_to(EntropyAnalyzer::entropy("abcd"), 2.0));

    // Order doesn't matter, only the byte histogram.
    assert(EntropyAnalyzer::entropy("aabbbc") == EntropyAnalyzer::entropy("bcabab"));

    std::string mixed = "The quick brown fox jumps over the lazy dog";
    double h = EntropyAnalyzer::entropy(mixed);
    assert((h > 0.0) && (h < 8.0));
    unsigned char const* raw = reinterpret_cast<unsigned char const*>(mixed.data());
    assert(EntropyAnalyzer::entropy(raw, mixed.length()) == h);
}

static void
test_length_boundary()
{
    EntropyAnalyzer a(5.0, 100);
    // log2(100) and log2(101) are both above 5, so only the length
    // decides.
    assert(!a.isHighEntropy(distinct_bytes(100)));
    assert(a.isHighEntropy(distinct_bytes(101)));

    EntropyReport report;
    report.object_id = "untouched";
    assert(!a.analyze("7 0 R", distinct_bytes(100), report));
    assert(report.object_id == "untouched");
    assert(a.analyze("7 0 R", distinct_bytes(101), report));
    assert(report.object_id == "7 0 R");
    assert(report.byte_length == 101);
    assert(close_to(report.entropy, std::log2(101.0)));

    a.setMinimumLength(101);
    assert(a.getMinimumLength() == 101);
    assert(!a.isHighEntropy(distinct_bytes(101)));
}

static void
test_threshold()
{
    EntropyAnalyzer a;
    assert(a.getThreshold() == EntropyAnalyzer::default_threshold);
    assert(a.getMinimumLength() == EntropyAnalyzer::default_min_length);

    // Low-entropy data is never flagged regardless of length.
    assert(!a.isHighEntropy(std::string(100000, 'a')));
    // 512 bytes covering every value evenly is exactly 8.0.
    assert(a.isHighEntropy(distinct_bytes(256) + distinct_bytes(256)));

    // Strictly above: data at exactly the threshold is not flagged.
    a.setThreshold(8.0);
    assert(!a.isHighEntropy(distinct_bytes(256) + distinct_bytes(256)));

    try {
        a.setThreshold(9.0);
        assert(false);
    } catch (std::invalid_argument& e) {
        std::cout << "setThreshold: " << e.what() << std::endl;
    }
    try {
        a.setThreshold(-0.5);
        assert(false);
    } catch (std::invalid_argument&) {
    }
    assert(a.getThreshold() == 8.0);

    try {
        EntropyAnalyzer bad(8.5);
        assert(false);
    } catch (std::invalid_argument&) {
    }
}

int
main()
{
    try {
        test_entropy_values();
        test_length_boundary();
        test_threshold();
    } catch (std::exception& e) {
        std::cout << "unexpected exception: " << e.what() << std::endl;
        return 2;
    }
    std::cout << "done" << std::endl;
    return 0;
}
