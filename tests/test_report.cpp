/*
 * test_report.cpp - Unit tests for the kernel deviation report
 *
 * Covers the function tables, INI config round trips and validation, and
 * a full host vs self-contained comparison over the default domains.
 */

#include "report/kernel_report.hpp"
#include "test_common.hpp"

#include <cstdio>
#include <fstream>

using namespace portmath::report;
using portmath::math::Range;

//=============================================================================
// Function Tables
//=============================================================================

TEST(kernel_function_names) {
    ASSERT_STREQ(kernel_function_to_string(KernelFunction::Sin), "sin");
    ASSERT_STREQ(kernel_function_to_string(KernelFunction::Acosh), "acosh");
    ASSERT_STREQ(kernel_function_to_string(KernelFunction::Log10), "log10");
    ASSERT_STREQ(kernel_function_to_string(KernelFunction::Sqrt), "sqrt");
    ASSERT_STREQ(kernel_function_to_string(KernelFunction::Count), "unknown");

    for (int i = 0; i < KERNEL_FUNCTION_COUNT; ++i) {
        KernelFunction function = static_cast<KernelFunction>(i);
        KernelFunction parsed = KernelFunction::Count;
        ASSERT(parse_kernel_function(kernel_function_to_string(function), &parsed));
        ASSERT(parsed == function);
    }
}

TEST(parse_kernel_function_input) {
    KernelFunction parsed = KernelFunction::Sin;
    ASSERT(parse_kernel_function("  EXP2\t", &parsed));
    ASSERT(parsed == KernelFunction::Exp2);
    ASSERT(parse_kernel_function("Tanh", &parsed));
    ASSERT(parsed == KernelFunction::Tanh);

    parsed = KernelFunction::Sin;
    ASSERT(!parse_kernel_function("cbrt", &parsed));
    ASSERT(!parse_kernel_function("", &parsed));
    ASSERT(parsed == KernelFunction::Sin);
    ASSERT(!parse_kernel_function("sin", nullptr));
}

TEST(default_domains) {
    for (int i = 0; i < KERNEL_FUNCTION_COUNT; ++i) {
        Range domain = default_domain(static_cast<KernelFunction>(i));
        ASSERT(domain.start < domain.end);
    }
    ASSERT_EQ(default_domain(KernelFunction::Asin).start, -1.0f);
    ASSERT_EQ(default_domain(KernelFunction::Asin).end, 1.0f);
    ASSERT_EQ(default_domain(KernelFunction::Acosh).start, 1.0f);
    ASSERT_EQ(default_domain(KernelFunction::Sqrt).start, 0.0f);
}

TEST(evaluate_realizations) {
    ASSERT_EQ(evaluate_host(KernelFunction::Sqrt, 16.0f), 4.0f);
    ASSERT_EQ(evaluate_soft(KernelFunction::Sqrt, 16.0f), 4.0f);
    ASSERT_NEAR(evaluate_host(KernelFunction::Cos, 0.5f), 0.87758256f, 1e-6f);
    ASSERT_NEAR(evaluate_soft(KernelFunction::Cos, 0.5f), 0.87758256f, 1e-5f);
    ASSERT_NAN(evaluate_host(KernelFunction::Ln, -1.0f));
    ASSERT_NAN(evaluate_soft(KernelFunction::Ln, -1.0f));
}

TEST(report_result_names) {
    ASSERT_STREQ(report_result_to_string(ReportResult::Success), "Success");
    ASSERT_STREQ(report_result_to_string(ReportResult::ErrorInvalidParameter), "Invalid parameter");
    ASSERT_STREQ(report_result_to_string(ReportResult::ErrorInvalidConfig), "Invalid report configuration");
    ASSERT_STREQ(report_result_to_string(ReportResult::ErrorToleranceExceeded), "Tolerance exceeded");
}

//=============================================================================
// Configuration
//=============================================================================

TEST(config_defaults) {
    ReportConfig config = ReportConfig::default_config();
    ASSERT_EQ(config.samples, 1000);
    ASSERT_NEAR(config.tolerance, 1e-4f, 1e-9f);
    ASSERT(config.validate());

    for (int i = 0; i < KERNEL_FUNCTION_COUNT; ++i) {
        ASSERT(config.functions[i].enabled);
    }
    ASSERT_NEAR(config.effective_tolerance(KernelFunction::Sin), 1e-4f, 1e-9f);
    ASSERT_NEAR(config.effective_tolerance(KernelFunction::Asin), 2e-4f, 1e-9f);
    ASSERT_NEAR(config.effective_tolerance(KernelFunction::Acos), 2e-4f, 1e-9f);
}

TEST(config_validate_repairs) {
    ReportConfig config;
    config.samples = 0;
    config.tolerance = -1.0f;
    config.settings(KernelFunction::Exp).domain = {3.0f, 3.0f};
    config.settings(KernelFunction::Ln).domain = {1.0f, INFINITY};
    config.settings(KernelFunction::Sinh).tolerance = -0.5f;

    ASSERT(!config.validate());
    ASSERT_EQ(config.samples, 1000);
    ASSERT_NEAR(config.tolerance, 1e-4f, 1e-9f);
    ASSERT_EQ(config.settings(KernelFunction::Exp).domain.start, -10.0f);
    ASSERT_EQ(config.settings(KernelFunction::Exp).domain.end, 10.0f);
    ASSERT_EQ(config.settings(KernelFunction::Ln).domain.end, 1000.0f);
    ASSERT_EQ(config.settings(KernelFunction::Sinh).tolerance, 0.0f);

    // Repaired config is valid as-is
    ASSERT(config.validate());
}

TEST(config_validate_enables_all) {
    ReportConfig config;
    for (int i = 0; i < KERNEL_FUNCTION_COUNT; ++i) {
        config.functions[i].enabled = false;
    }
    ASSERT(!config.validate());
    for (int i = 0; i < KERNEL_FUNCTION_COUNT; ++i) {
        ASSERT(config.functions[i].enabled);
    }
}

TEST(config_save_load) {
    ReportConfig save_config;
    save_config.samples = 250;
    save_config.tolerance = 5e-4f;
    save_config.settings(KernelFunction::Tan).enabled = false;
    save_config.settings(KernelFunction::Atanh).enabled = false;
    save_config.settings(KernelFunction::Exp).domain = {-2.5f, 7.25f};
    save_config.settings(KernelFunction::Exp).tolerance = 0.001f;

    const char* temp_file = "test_report_config.ini";
    ASSERT(save_config.save(temp_file));

    ReportConfig load_config;
    bool load_result = ReportConfig::load(temp_file, &load_config);
    remove(temp_file);
    ASSERT(load_result);

    ASSERT_EQ(load_config.samples, 250);
    ASSERT_NEAR(load_config.tolerance, 5e-4f, 1e-9f);
    ASSERT(!load_config.settings(KernelFunction::Tan).enabled);
    ASSERT(!load_config.settings(KernelFunction::Atanh).enabled);
    ASSERT(load_config.settings(KernelFunction::Sin).enabled);
    ASSERT(load_config.settings(KernelFunction::Sqrt).enabled);
    ASSERT_EQ(load_config.settings(KernelFunction::Exp).domain.start, -2.5f);
    ASSERT_EQ(load_config.settings(KernelFunction::Exp).domain.end, 7.25f);
    ASSERT_NEAR(load_config.effective_tolerance(KernelFunction::Exp), 0.001f, 1e-9f);
    ASSERT_NEAR(load_config.effective_tolerance(KernelFunction::Sin), 5e-4f, 1e-9f);
    ASSERT_NEAR(load_config.effective_tolerance(KernelFunction::Acos), 2e-4f, 1e-9f);
}

TEST(config_load_handwritten) {
    const char* temp_file = "test_report_handwritten.ini";
    {
        std::ofstream file(temp_file);
        file << "# hand edited\n";
        file << "[report]\n";
        file << "samples = 0\n";
        file << "functions = Sin, COS ,bogus\n";
        file << "\n";
        file << "; only the cosine domain is narrowed\n";
        file << "[function.cos]\n";
        file << "min = -1\n";
        file << "max = 1\n";
    }

    ReportConfig config;
    bool load_result = ReportConfig::load(temp_file, &config);
    remove(temp_file);
    ASSERT(load_result);

    // samples = 0 is repaired on load
    ASSERT_EQ(config.samples, 1000);
    ASSERT_NEAR(config.tolerance, 1e-4f, 1e-9f);
    ASSERT(config.settings(KernelFunction::Sin).enabled);
    ASSERT(config.settings(KernelFunction::Cos).enabled);
    ASSERT(!config.settings(KernelFunction::Tan).enabled);
    ASSERT(!config.settings(KernelFunction::Sqrt).enabled);
    ASSERT_EQ(config.settings(KernelFunction::Cos).domain.start, -1.0f);
    ASSERT_EQ(config.settings(KernelFunction::Cos).domain.end, 1.0f);
    ASSERT_EQ(config.settings(KernelFunction::Sin).domain.start, -10.0f);
}

TEST(config_load_bad_value) {
    const char* temp_file = "test_report_bad_value.ini";
    {
        std::ofstream file(temp_file);
        file << "[report]\n";
        file << "samples = many\n";
    }

    ReportConfig config;
    bool load_result = ReportConfig::load(temp_file, &config);
    remove(temp_file);
    ASSERT(!load_result);
}

TEST(config_load_bad_domain) {
    const char* temp_file = "test_report_bad_domain.ini";
    {
        std::ofstream file(temp_file);
        file << "[report]\n";
        file << "samples = 200\n";
        file << "\n";
        file << "[function.sqrt]\n";
        file << "min = 0\n";
        file << "max = lots\n";
    }

    ReportConfig config;
    bool load_result = ReportConfig::load(temp_file, &config);
    remove(temp_file);
    ASSERT(!load_result);
}

TEST(config_load_non_ascii_name) {
    const char* temp_file = "test_report_non_ascii.ini";
    {
        std::ofstream file(temp_file);
        file << "[report]\n";
        file << "functions = sin, \xC3\x84" "cos, LN\n";
    }

    ReportConfig config;
    bool load_result = ReportConfig::load(temp_file, &config);
    remove(temp_file);
    ASSERT(load_result);

    ASSERT(config.settings(KernelFunction::Sin).enabled);
    ASSERT(config.settings(KernelFunction::Ln).enabled);
    ASSERT(!config.settings(KernelFunction::Cos).enabled);

    KernelFunction parsed = KernelFunction::Sin;
    ASSERT(!parse_kernel_function("\xE9" "xp", &parsed));
    ASSERT(parsed == KernelFunction::Sin);
}

TEST(config_load_nonexistent) {
    ReportConfig config;
    ASSERT(!ReportConfig::load("nonexistent_report.ini", &config));
    ASSERT(!ReportConfig::load("nonexistent_report.ini", nullptr));
}

//=============================================================================
// Deviation Report
//=============================================================================

TEST(measure_deviation_sqrt) {
    FunctionDeviation result = measure_deviation(KernelFunction::Sqrt, {0.0f, 100.0f}, 11, 1e-4f);
    ASSERT(result.function == KernelFunction::Sqrt);
    ASSERT_EQ(result.samples, 11);
    ASSERT_EQ(result.non_finite_mismatches, 0);
    ASSERT(result.max_error <= 1e-6f);
    ASSERT(result.within_tolerance);
    ASSERT(result.worst_input >= 0.0f && result.worst_input <= 100.0f);

    FunctionDeviation single = measure_deviation(KernelFunction::Sqrt, {4.0f, 9.0f}, 0, 1e-4f);
    ASSERT_EQ(single.samples, 1);
    ASSERT(single.within_tolerance);
}

TEST(measure_deviation_non_finite) {
    // ln(0) is -inf and acosh below 1 is NaN on both sides
    FunctionDeviation ln = measure_deviation(KernelFunction::Ln, {0.0f, 1.0f}, 101, 1e-4f);
    ASSERT_EQ(ln.non_finite_mismatches, 0);
    ASSERT(ln.within_tolerance);

    FunctionDeviation acosh = measure_deviation(KernelFunction::Acosh, {-1.0f, 2.0f}, 31, 1e-4f);
    ASSERT_EQ(acosh.non_finite_mismatches, 0);
    ASSERT(acosh.within_tolerance);
}

TEST(measure_deviation_tight_tolerance) {
    FunctionDeviation result = measure_deviation(KernelFunction::Asin, {-1.0f, 1.0f}, 1000, 1e-9f);
    ASSERT(!result.within_tolerance);
    ASSERT(result.max_error > 1e-9f);
    ASSERT(result.max_error < 2e-4f);
}

TEST(run_report_defaults) {
    KernelReport report;
    ReportResult result = run_kernel_report(ReportConfig::default_config(), &report);
    ASSERT(result == ReportResult::Success);
    ASSERT_EQ(static_cast<int>(report.results.size()), KERNEL_FUNCTION_COUNT);
    ASSERT_EQ(report.failure_count(), 0);
    ASSERT(report.passed());
    log_kernel_report(report);
}

TEST(run_report_subset) {
    ReportConfig config;
    for (int i = 0; i < KERNEL_FUNCTION_COUNT; ++i) {
        config.functions[i].enabled = false;
    }
    config.settings(KernelFunction::Asin).enabled = true;
    config.settings(KernelFunction::Sqrt).enabled = true;
    config.settings(KernelFunction::Asin).tolerance = 1e-9f;

    KernelReport report;
    ASSERT(run_kernel_report(config, &report) == ReportResult::ErrorToleranceExceeded);
    ASSERT_EQ(static_cast<int>(report.results.size()), 2);
    ASSERT(report.results[0].function == KernelFunction::Asin);
    ASSERT(!report.results[0].within_tolerance);
    ASSERT(report.results[1].within_tolerance);
    ASSERT_EQ(report.failure_count(), 1);
    ASSERT(!report.passed());
    log_kernel_report(report);
}

TEST(run_report_rejects_invalid) {
    KernelReport report;
    ASSERT(run_kernel_report(ReportConfig::default_config(), nullptr) == ReportResult::ErrorInvalidParameter);

    ReportConfig config;
    config.samples = -5;
    ASSERT(run_kernel_report(config, &report) == ReportResult::ErrorInvalidConfig);
    ASSERT(report.results.empty());
}

int main() {
    printf("=== Kernel Report Unit Tests ===\n\n");

    // Function tables
    RUN_TEST(kernel_function_names);
    RUN_TEST(parse_kernel_function_input);
    RUN_TEST(default_domains);
    RUN_TEST(evaluate_realizations);
    RUN_TEST(report_result_names);

    // Configuration
    RUN_TEST(config_defaults);
    RUN_TEST(config_validate_repairs);
    RUN_TEST(config_validate_enables_all);
    RUN_TEST(config_save_load);
    RUN_TEST(config_load_handwritten);
    RUN_TEST(config_load_bad_value);
    RUN_TEST(config_load_bad_domain);
    RUN_TEST(config_load_non_ascii_name);
    RUN_TEST(config_load_nonexistent);

    // Deviation report
    RUN_TEST(measure_deviation_sqrt);
    RUN_TEST(measure_deviation_non_finite);
    RUN_TEST(measure_deviation_tight_tolerance);
    RUN_TEST(run_report_defaults);
    RUN_TEST(run_report_subset);
    RUN_TEST(run_report_rejects_invalid);

    TEST_SUMMARY();
    return g_tests_failed > 0 ? 1 : 0;
}
