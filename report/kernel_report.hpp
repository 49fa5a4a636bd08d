/*
 * kernel_report.hpp - Host vs self-contained kernel deviation report
 *
 * Samples each kernel function over a domain, evaluates both realizations
 * and records the worst relative error |host - soft| / max(1, |host|).
 * Used to check that the self-contained kernel stays within tolerance of
 * the platform math library.
 *
 * Report settings are stored in INI format:
 *
 *   [report]
 *   samples = 1000
 *   tolerance = 0.0001
 *   # "all" or a comma separated list such as sin,cos,ln
 *   functions = all
 *
 *   [function.asin]
 *   min = -1
 *   max = 1
 *   # 0 inherits the [report] tolerance
 *   tolerance = 0.0002
 */

#ifndef PORTMATH_REPORT_KERNEL_REPORT_HPP
#define PORTMATH_REPORT_KERNEL_REPORT_HPP

#include "../kernel/kernel.hpp"

#if !defined(PORTMATH_HAS_HOST_KERNEL)
#error "The kernel report compares against the host kernel and needs a hosted build"
#endif

#include <cstdint>
#include <string>
#include <vector>

namespace portmath {
namespace report {

// ============================================================================
// Kernel Functions
// ============================================================================

enum class KernelFunction : uint8_t {
    Sin = 0,
    Cos,
    Tan,
    Asin,
    Acos,
    Atan,
    Sinh,
    Cosh,
    Tanh,
    Asinh,
    Acosh,
    Atanh,
    Exp,
    Exp2,
    Ln,
    Log2,
    Log10,
    Sqrt,
    Count
};

static constexpr int KERNEL_FUNCTION_COUNT = static_cast<int>(KernelFunction::Count);

const char* kernel_function_to_string(KernelFunction function);

// Case-insensitive; returns false for unknown names
bool parse_kernel_function(const std::string& name, KernelFunction* out);

// Domain the function is sampled over when the config does not say otherwise
math::Range default_domain(KernelFunction function);

// Evaluate one realization directly
float evaluate_host(KernelFunction function, float value);
float evaluate_soft(KernelFunction function, float value);

// ============================================================================
// Result Codes
// ============================================================================

enum class ReportResult {
    Success = 0,
    ErrorInvalidParameter,
    ErrorInvalidConfig,
    ErrorToleranceExceeded
};

const char* report_result_to_string(ReportResult result);

// ============================================================================
// Configuration
// ============================================================================

struct FunctionSettings {
    bool enabled = true;
    math::Range domain = {0.0f, 0.0f};
    float tolerance = 0.0f;                 // 0 = use ReportConfig::tolerance
};

struct ReportConfig {
    int samples = 1000;
    float tolerance = 1e-4f;
    FunctionSettings functions[KERNEL_FUNCTION_COUNT];

    // Every function enabled over its default domain
    ReportConfig();

    FunctionSettings& settings(KernelFunction function) {
        return functions[static_cast<int>(function)];
    }
    const FunctionSettings& settings(KernelFunction function) const {
        return functions[static_cast<int>(function)];
    }

    float effective_tolerance(KernelFunction function) const;

    // Create default configuration
    static ReportConfig default_config() {
        return ReportConfig();
    }

    // Save report config to INI file
    bool save(const char* filepath) const;

    // Load report config from INI file
    static bool load(const char* filepath, ReportConfig* out_config);

    // Validate and fix invalid settings; false if anything was repaired
    bool validate();
};

// ============================================================================
// Report
// ============================================================================

struct FunctionDeviation {
    KernelFunction function = KernelFunction::Sin;
    math::Range domain = {0.0f, 0.0f};
    int samples = 0;
    float max_error = 0.0f;
    float worst_input = 0.0f;
    float tolerance = 0.0f;
    int non_finite_mismatches = 0;          // one side finite, the other not
    bool within_tolerance = true;
};

struct KernelReport {
    std::vector<FunctionDeviation> results;

    int failure_count() const;
    bool passed() const { return failure_count() == 0; }
};

// Samples are spread evenly over the closed domain. samples < 1 is treated
// as 1.
FunctionDeviation measure_deviation(KernelFunction function, math::Range domain,
                                    int samples, float tolerance);

// Measures every enabled function. The config is validated on a copy; an
// invalid config is rejected without running anything.
ReportResult run_kernel_report(const ReportConfig& config, KernelReport* out_report);

void log_kernel_report(const KernelReport& report);

} // namespace report
} // namespace portmath

#endif // PORTMATH_REPORT_KERNEL_REPORT_HPP
