/**
 * @file  fuzz_panel_loader.cpp
 * @brief libFuzzer target for PanelLoader and the pipeline behind it
 *
 * Build:
 *   cmake -DQMJ_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_panel_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_panel_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Malformed input is reported only as ConfigError or DataError.
 *   3. If a panel parses, the pipeline runs to completion and:
 *      a. factor rows are strictly ascending by period
 *      b. every row satisfies 1 ≤ n_quality + n_junk ≤ n_ranked
 *      c. qmj is present iff both bucket returns are present
 *
 * Fuzzer strategy:
 *   Input is passed directly as the CSV document. Seeding the corpus with a
 *   valid header line lets the fuzzer reach the row parser quickly.
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "qmj/data_loader.hpp"
#include "qmj/errors.hpp"
#include "qmj/pipeline.hpp"

using namespace qmj;
using namespace qmj::core;
using namespace qmj::engine;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{
        reinterpret_cast<const char*>(data), size
    };

    try {
        const auto panel  = PanelLoader::parse_csv_string(input);
        const auto result = Pipeline{}.run(panel);

        const auto& rows = result.factor_returns;
        for (std::size_t i = 0; i < rows.size(); ++i) {
            // Invariant 3a
            if (i > 0) assert(rows[i - 1].period < rows[i].period);
            // Invariant 3b
            assert(rows[i].n_quality + rows[i].n_junk >= 1);
            assert(rows[i].n_quality + rows[i].n_junk <= rows[i].n_ranked);
            // Invariant 3c
            assert(rows[i].qmj.has_value() ==
                   (rows[i].quality_return.has_value() && rows[i].junk_return.has_value()));
        }
    } catch (const ConfigError&) {
        // Invariant 2: rejected header
    } catch (const DataError&) {
        // Invariant 2: rejected row
    }
    return 0;
}
