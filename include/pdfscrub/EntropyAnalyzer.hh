// Copyright (c) 2026 The pdfscrub Authors
//
// This file is part of pdfscrub.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef ENTROPYANALYZER_HH
#define ENTROPYANALYZER_HH

#include <pdfscrub/DLL.h>

#include <cstddef>
#include <string>

namespace pdfscrub
{
    // One high-entropy object. entropy is in bits per byte, 0.0 to 8.0.
    struct EntropyReport
    {
        std::string object_id;
        double entropy{0.0};
        size_t byte_length{0};
    };

    // Shannon entropy over byte buffers, used as a heuristic for
    // compressed, encrypted, or steganographic payloads hidden in
    // objects that should hold ordinary text or graphics data.
    class EntropyAnalyzer
    {
      public:
        static constexpr double default_threshold = 7.5;
        static constexpr size_t default_min_length = 100;

        PDFSCRUB_DLL
        EntropyAnalyzer(
            double threshold = default_threshold,
            size_t min_length = default_min_length);

        // Entropy of an empty buffer is 0.0. A buffer of one repeated
        // byte value is 0.0; a buffer holding every byte value equally
        // often approaches 8.0.
        PDFSCRUB_DLL
        static double entropy(unsigned char const* data, size_t len);
        PDFSCRUB_DLL
        static double entropy(std::string const& data);

        // Data is anomalous when it is strictly longer than the minimum
        // length and its entropy is strictly above the threshold.
        // Buffers at or below the minimum length are never flagged.
        PDFSCRUB_DLL
        bool isHighEntropy(std::string const& data) const;

        // Like isHighEntropy, but fills in report when the data is
        // anomalous. report is untouched otherwise.
        PDFSCRUB_DLL
        bool analyze(
            std::string const& object_id,
            std::string const& data,
            EntropyReport& report) const;

        PDFSCRUB_DLL
        void setThreshold(double);
        PDFSCRUB_DLL
        double getThreshold() const;
        PDFSCRUB_DLL
        void setMinimumLength(size_t);
        PDFSCRUB_DLL
        size_t getMinimumLength() const;

      private:
        double threshold;
        size_t min_length;
    };
} // namespace pdfscrub

#endif // ENTROPYANALYZER_HH
