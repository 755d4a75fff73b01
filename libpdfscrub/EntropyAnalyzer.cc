#include <pdfscrub/EntropyAnalyzer.hh>

#include <cmath>
#include <stdexcept>

using namespace pdfscrub;

EntropyAnalyzer::EntropyAnalyzer(double threshold, size_t min_length) :
    threshold(threshold),
    min_length(min_length)
{
    setThreshold(threshold);
}

double
EntropyAnalyzer::entropy(unsigned char const* data, size_t len)
{
    if (len == 0) {
        return 0.0;
    }
    size_t counts[256] = {0};
    for (size_t i = 0; i < len; ++i) {
        ++counts[data[i]];
    }
    double result = 0.0;
    auto total = static_cast<double>(len);
    for (auto count: counts) {
        if (count > 0) {
            double p = static_cast<double>(count) / total;
            result -= p * std::log2(p);
        }
    }
    return result;
}

double
EntropyAnalyzer::entropy(std::string const& data)
{
    return entropy(reinterpret_cast<unsigned char const*>(data.data()), data.length());
}

bool
EntropyAnalyzer::isHighEntropy(std::string const& data) const
{
    if (data.length() <= this->min_length) {
        return false;
    }
    return entropy(data) > this->threshold;
}

bool
EntropyAnalyzer::analyze(
    std::string const& object_id, std::string const& data, EntropyReport& report) const
{
    if (data.length() <= this->min_length) {
        return false;
    }
    double value = entropy(data);
    if (value <= this->threshold) {
        return false;
    }
    report.object_id = object_id;
    report.entropy = value;
    report.byte_length = data.length();
    return true;
}

void
EntropyAnalyzer::setThreshold(double value)
{
    if (!((value >= 0.0) && (value <= 8.0))) {
        throw std::invalid_argument("entropy threshold must be between 0 and 8");
    }
    this->threshold = value;
}

double
EntropyAnalyzer::getThreshold() const
{
    return this->threshold;
}

void
EntropyAnalyzer::setMinimumLength(size_t value)
{
    this->min_length = value;
}

size_t
EntropyAnalyzer::getMinimumLength() const
{
    return this->min_length;
}
