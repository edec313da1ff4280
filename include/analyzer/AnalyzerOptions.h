/***
 * Name: tyflow::analyzer::AnalyzerOptions
 * Purpose: Evaluator configuration.
 */
#pragma once

#include <iosfwd>

namespace tyflow::obs { class Metrics; }

namespace tyflow::analyzer {

    struct AnalyzerOptions {
        std::ostream* trace{nullptr};     // scope push/pop log, one line per event
        obs::Metrics* metrics{nullptr};   // analyzer.* counters
        bool reportNullishReads{true};    // diagnose property reads on null/undefined
    };

} // namespace tyflow::analyzer
