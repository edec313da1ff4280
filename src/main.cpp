/***
 * Name: tyflow::main
 * Purpose: Entry point for the tyflow command-line tool.
 * Inputs:
 *   - argc, argv: Standard process arguments.
 * Outputs:
 *   - int: POSIX process status code (0 on success, 2 on errors).
 * Theory of Operation:
 *   Parses CLI flags, folds the given type spellings through the union
 *   algebra, prints the result and, on request, the metrics summary.
 */
#include <iostream>

#include "observability/Metrics.h"
#include "tyflow/driver/app.h"
#include "tyflow/driver/cli.h"
#include "tyflow/exceptions/tyflow_exception.h"

using tyflow::driver::CliOptions;

int main(int argc, char** argv) {
    try {
    using tyflow::driver::ParseCli;
    using tyflow::driver::PrintUsage;
    CliOptions opts;
    if (!ParseCli(argc, (const char* const*)argv, opts, std::cerr)) {
        PrintUsage(std::cerr, argv[0]); // NOLINT(*-pro-bounds-pointer-arithmetic)
        return 2;
    }
    if (opts.show_help) {
        PrintUsage(std::cout, argv[0]); // NOLINT(*-pro-bounds-pointer-arithmetic)
        return 0;
    }
    tyflow::obs::Metrics metrics;
    const int ret_code = tyflow::driver::RunOnce(opts, metrics, std::cout);
    tyflow::driver::ReportMetricsIfRequested(opts, metrics, std::cout);
    return ret_code;
    }
    catch (const tyflow::exceptions::TyflowException& ex) {
        std::cerr << "tyflow: " << ex.label() << ": " << ex.what() << '\n';
        return 2;
    }
    catch (const std::exception& ex) {
        std::cerr << "tyflow: internal error: " << ex.what() << '\n';
        return 2;
    }
}
