#pragma once

#include <ostream>

#include "options.hpp"

namespace cli {

/**
 * @brief Execute one scan: discover, classify, filter and print.
 *
 * The report goes to @a out. Whole-scan failures (root not accessible, no
 * repositories, nothing left after filtering) are written to @a err.
 *
 * @return `0` when at least one repository was printed, `1` otherwise.
 */
int run_scan(const Options& opts, std::ostream& out, std::ostream& err);

} // namespace cli
