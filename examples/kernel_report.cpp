/*
 * kernel_report.cpp - Host vs self-contained kernel deviation report
 *
 * Usage: portmath_kernel_report [config.ini]
 *
 * Loads the report settings (writing a default file first if none exists),
 * compares every enabled kernel function and exits non-zero when any of
 * them is outside its tolerance.
 */

#include "report/kernel_report.hpp"
#include <cstdio>
#include <fstream>

using namespace portmath;

int main(int argc, char** argv) {
    const char* config_file = argc > 1 ? argv[1] : "kernel_report.ini";

    if (!std::ifstream(config_file)) {
        report::ReportConfig defaults = report::ReportConfig::default_config();
        if (!defaults.save(config_file)) {
            printf("Failed to write default configuration to %s\n", config_file);
            return 1;
        }
        printf("Wrote default configuration to %s\n", config_file);
    }

    report::ReportConfig config;
    if (!report::ReportConfig::load(config_file, &config)) {
        printf("Failed to load configuration from %s\n", config_file);
        return 1;
    }

    printf("Kernel report: %d samples per function, tolerance %g\n\n",
           config.samples, config.tolerance);

    report::KernelReport kernel_report;
    report::ReportResult result = report::run_kernel_report(config, &kernel_report);
    if (result == report::ReportResult::ErrorInvalidParameter ||
        result == report::ReportResult::ErrorInvalidConfig) {
        printf("Report failed: %s\n", report::report_result_to_string(result));
        return 1;
    }

    report::log_kernel_report(kernel_report);

    printf("\n%s\n", report::report_result_to_string(result));
    return result == report::ReportResult::Success ? 0 : 1;
}
