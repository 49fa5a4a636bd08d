/*
 * kernel_report.cpp - Kernel deviation report implementation
 */

#include "kernel_report.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <sstream>

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/ini_parser.hpp>
namespace pt = boost::property_tree;

#if defined(__ANDROID__)
#include <android/log.h>
#define LOG_TAG "PortmathReport"
#define LOGI(...) __android_log_print(ANDROID_LOG_INFO, LOG_TAG, __VA_ARGS__)
#define LOGE(...) __android_log_print(ANDROID_LOG_ERROR, LOG_TAG, __VA_ARGS__)
#else
#define LOGI(...) do { printf("[Report] "); printf(__VA_ARGS__); printf("\n"); } while (0)
#define LOGE(...) do { fprintf(stderr, "[Report] "); fprintf(stderr, __VA_ARGS__); fprintf(stderr, "\n"); } while (0)
#endif

namespace portmath {
namespace report {

using math::Range;
using math::kernel::HostKernel;
using math::kernel::SoftKernel;

// ============================================================================
// Kernel Functions
// ============================================================================

const char* kernel_function_to_string(KernelFunction function) {
    switch (function) {
        case KernelFunction::Sin:   return "sin";
        case KernelFunction::Cos:   return "cos";
        case KernelFunction::Tan:   return "tan";
        case KernelFunction::Asin:  return "asin";
        case KernelFunction::Acos:  return "acos";
        case KernelFunction::Atan:  return "atan";
        case KernelFunction::Sinh:  return "sinh";
        case KernelFunction::Cosh:  return "cosh";
        case KernelFunction::Tanh:  return "tanh";
        case KernelFunction::Asinh: return "asinh";
        case KernelFunction::Acosh: return "acosh";
        case KernelFunction::Atanh: return "atanh";
        case KernelFunction::Exp:   return "exp";
        case KernelFunction::Exp2:  return "exp2";
        case KernelFunction::Ln:    return "ln";
        case KernelFunction::Log2:  return "log2";
        case KernelFunction::Log10: return "log10";
        case KernelFunction::Sqrt:  return "sqrt";
        default:                    return "unknown";
    }
}

static std::string to_lower_trimmed(const std::string& value) {
    size_t begin = value.find_first_not_of(" \t");
    if (begin == std::string::npos) return std::string();
    size_t end = value.find_last_not_of(" \t");

    std::string lower = value.substr(begin, end - begin + 1);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

bool parse_kernel_function(const std::string& name, KernelFunction* out) {
    if (!out) return false;
    std::string lower = to_lower_trimmed(name);

    for (int i = 0; i < KERNEL_FUNCTION_COUNT; ++i) {
        KernelFunction function = static_cast<KernelFunction>(i);
        if (lower == kernel_function_to_string(function)) {
            *out = function;
            return true;
        }
    }
    return false;
}

Range default_domain(KernelFunction function) {
    switch (function) {
        case KernelFunction::Sin:
        case KernelFunction::Cos:   return {-10.0f, 10.0f};
        case KernelFunction::Tan:   return {-1.4f, 1.4f};
        case KernelFunction::Asin:
        case KernelFunction::Acos:  return {-1.0f, 1.0f};
        case KernelFunction::Atan:  return {-10.0f, 10.0f};
        case KernelFunction::Sinh:
        case KernelFunction::Cosh:
        case KernelFunction::Tanh:  return {-5.0f, 5.0f};
        case KernelFunction::Asinh: return {-100.0f, 100.0f};
        case KernelFunction::Acosh: return {1.0f, 100.0f};
        case KernelFunction::Atanh: return {-0.99f, 0.99f};
        case KernelFunction::Exp:
        case KernelFunction::Exp2:  return {-10.0f, 10.0f};
        case KernelFunction::Ln:
        case KernelFunction::Log2:
        case KernelFunction::Log10: return {0.001f, 1000.0f};
        case KernelFunction::Sqrt:  return {0.0f, 10000.0f};
        default:                    return {0.0f, 1.0f};
    }
}

template<typename Kernel>
static float evaluate(KernelFunction function, float value) {
    switch (function) {
        case KernelFunction::Sin:   return Kernel::sin_cos(value).sin;
        case KernelFunction::Cos:   return Kernel::sin_cos(value).cos;
        case KernelFunction::Tan:   return Kernel::tan(value);
        case KernelFunction::Asin:  return Kernel::asin(value);
        case KernelFunction::Acos:  return Kernel::acos(value);
        case KernelFunction::Atan:  return Kernel::atan(value);
        case KernelFunction::Sinh:  return Kernel::sinh(value);
        case KernelFunction::Cosh:  return Kernel::cosh(value);
        case KernelFunction::Tanh:  return Kernel::tanh(value);
        case KernelFunction::Asinh: return Kernel::asinh(value);
        case KernelFunction::Acosh: return Kernel::acosh(value);
        case KernelFunction::Atanh: return Kernel::atanh(value);
        case KernelFunction::Exp:   return Kernel::exp(value);
        case KernelFunction::Exp2:  return Kernel::exp2(value);
        case KernelFunction::Ln:    return Kernel::ln(value);
        case KernelFunction::Log2:  return Kernel::log2(value);
        case KernelFunction::Log10: return Kernel::log10(value);
        case KernelFunction::Sqrt:  return Kernel::sqrt(value);
        default:                    return NAN;
    }
}

float evaluate_host(KernelFunction function, float value) {
    return evaluate<HostKernel>(function, value);
}

float evaluate_soft(KernelFunction function, float value) {
    return evaluate<SoftKernel>(function, value);
}

// ============================================================================
// Result Codes
// ============================================================================

const char* report_result_to_string(ReportResult result) {
    switch (result) {
        case ReportResult::Success:                return "Success";
        case ReportResult::ErrorInvalidParameter:  return "Invalid parameter";
        case ReportResult::ErrorInvalidConfig:     return "Invalid report configuration";
        case ReportResult::ErrorToleranceExceeded: return "Tolerance exceeded";
        default:                                   return "Unknown error";
    }
}

// ============================================================================
// Configuration
// ============================================================================

static constexpr int MAX_SAMPLES = 10000000;
static constexpr float DEFAULT_TOLERANCE = 1e-4f;
// asin/acos use a three term polynomial and need a looser bound
static constexpr float ARC_TOLERANCE = 2e-4f;

// Missing keys keep the fallback; a present key that does not convert throws
// ptree_bad_data
template<typename T>
static T read_value(const pt::ptree& section, const char* key, T fallback) {
    if (auto child = section.get_child_optional(key)) {
        return child->get_value<T>();
    }
    return fallback;
}

static std::string function_section(KernelFunction function) {
    return std::string("function.") + kernel_function_to_string(function);
}

float ReportConfig::effective_tolerance(KernelFunction function) const {
    float own = settings(function).tolerance;
    return own > 0.0f ? own : tolerance;
}

ReportConfig::ReportConfig() {
    for (int i = 0; i < KERNEL_FUNCTION_COUNT; ++i) {
        functions[i].domain = default_domain(static_cast<KernelFunction>(i));
    }
    settings(KernelFunction::Asin).tolerance = ARC_TOLERANCE;
    settings(KernelFunction::Acos).tolerance = ARC_TOLERANCE;
}

bool ReportConfig::save(const char* filepath) const {
    try {
        std::ofstream file(filepath);
        if (!file) return false;

        bool all_enabled = true;
        std::string enabled_list;
        for (int i = 0; i < KERNEL_FUNCTION_COUNT; ++i) {
            if (!functions[i].enabled) {
                all_enabled = false;
                continue;
            }
            if (!enabled_list.empty()) enabled_list += ",";
            enabled_list += kernel_function_to_string(static_cast<KernelFunction>(i));
        }

        file << "# Kernel Report Configuration File\n";
        file << "# Generated by portmath\n\n";

        file << "[report]\n";
        file << "samples = " << samples << "\n";
        file << "tolerance = " << tolerance << "\n";
        file << "functions = " << (all_enabled ? std::string("all") : enabled_list) << "\n";
        file << "\n";

        for (int i = 0; i < KERNEL_FUNCTION_COUNT; ++i) {
            const FunctionSettings& fs = functions[i];
            file << "[" << function_section(static_cast<KernelFunction>(i)) << "]\n";
            file << "min = " << fs.domain.start << "\n";
            file << "max = " << fs.domain.end << "\n";
            file << "tolerance = " << fs.tolerance << "\n";
            file << "\n";
        }

        return file.good();
    } catch (const std::exception&) {
        return false;
    }
}

bool ReportConfig::load(const char* filepath, ReportConfig* out_config) {
    if (!out_config) return false;

    try {
        pt::ptree tree;
        pt::read_ini(filepath, tree);

        // Initialize with defaults
        *out_config = default_config();

        if (auto section = tree.get_child_optional("report")) {
            out_config->samples = read_value<int>(*section, "samples", 1000);
            out_config->tolerance = read_value<float>(*section, "tolerance", DEFAULT_TOLERANCE);

            std::string list = to_lower_trimmed(section->get<std::string>("functions", "all"));
            if (list != "all") {
                for (int i = 0; i < KERNEL_FUNCTION_COUNT; ++i) {
                    out_config->functions[i].enabled = false;
                }

                std::stringstream stream(list);
                std::string name;
                while (std::getline(stream, name, ',')) {
                    KernelFunction function;
                    if (parse_kernel_function(name, &function)) {
                        out_config->settings(function).enabled = true;
                    } else if (!to_lower_trimmed(name).empty()) {
                        LOGE("Ignoring unknown kernel function '%s' in %s", name.c_str(), filepath);
                    }
                }
            }
        }

        for (int i = 0; i < KERNEL_FUNCTION_COUNT; ++i) {
            KernelFunction function = static_cast<KernelFunction>(i);
            FunctionSettings& fs = out_config->functions[i];

            // Section names contain '.', so address them with a '/' separated path
            pt::ptree::path_type path(function_section(function), '/');
            if (auto section = tree.get_child_optional(path)) {
                fs.domain.start = read_value<float>(*section, "min", fs.domain.start);
                fs.domain.end = read_value<float>(*section, "max", fs.domain.end);
                fs.tolerance = read_value<float>(*section, "tolerance", fs.tolerance);
            }
        }

        // Validate after loading
        out_config->validate();

        return true;
    } catch (const pt::ini_parser_error& e) {
        LOGE("Failed to read %s: %s", filepath, e.message().c_str());
        return false;
    } catch (const pt::ptree_bad_data& e) {
        LOGE("Bad value in %s: %s", filepath, e.what());
        return false;
    } catch (const std::exception& e) {
        LOGE("Failed to load %s: %s", filepath, e.what());
        return false;
    }
}

bool ReportConfig::validate() {
    bool all_valid = true;

    if (samples < 1 || samples > MAX_SAMPLES) {
        samples = 1000;
        all_valid = false;
    }

    if (!(tolerance > 0.0f) || std::isinf(tolerance)) {
        tolerance = DEFAULT_TOLERANCE;
        all_valid = false;
    }

    bool any_enabled = false;
    for (int i = 0; i < KERNEL_FUNCTION_COUNT; ++i) {
        FunctionSettings& fs = functions[i];
        any_enabled = any_enabled || fs.enabled;

        // Empty, inverted or non-finite domains fall back to the default
        if (!std::isfinite(fs.domain.start) || !std::isfinite(fs.domain.end) ||
            !(fs.domain.start < fs.domain.end)) {
            fs.domain = default_domain(static_cast<KernelFunction>(i));
            all_valid = false;
        }

        if (!(fs.tolerance >= 0.0f) || std::isinf(fs.tolerance)) {
            fs.tolerance = 0.0f;
            all_valid = false;
        }
    }

    if (!any_enabled) {
        for (int i = 0; i < KERNEL_FUNCTION_COUNT; ++i) {
            functions[i].enabled = true;
        }
        all_valid = false;
    }

    return all_valid;
}

// ============================================================================
// Report
// ============================================================================

int KernelReport::failure_count() const {
    int failures = 0;
    for (const FunctionDeviation& result : results) {
        if (!result.within_tolerance) ++failures;
    }
    return failures;
}

// Both non-finite and of the same kind (NaN, +inf or -inf)
static bool same_non_finite(float a, float b) {
    if (std::isnan(a) || std::isnan(b)) return std::isnan(a) && std::isnan(b);
    return a == b;
}

FunctionDeviation measure_deviation(KernelFunction function, Range domain,
                                    int samples, float tolerance) {
    FunctionDeviation result;
    result.function = function;
    result.domain = domain;
    result.samples = std::max(samples, 1);
    result.tolerance = tolerance;
    result.worst_input = domain.start;

    float span = domain.end - domain.start;
    for (int i = 0; i < result.samples; ++i) {
        float t = result.samples > 1 ? static_cast<float>(i) / static_cast<float>(result.samples - 1) : 0.0f;
        float x = (i == result.samples - 1 && result.samples > 1) ? domain.end : domain.start + span * t;

        float host = evaluate_host(function, x);
        float soft = evaluate_soft(function, x);

        if (!std::isfinite(host) || !std::isfinite(soft)) {
            if (!same_non_finite(host, soft)) {
                if (result.non_finite_mismatches == 0) result.worst_input = x;
                ++result.non_finite_mismatches;
            }
            continue;
        }

        float error = std::fabs(host - soft) / std::max(1.0f, std::fabs(host));
        if (error > result.max_error) {
            result.max_error = error;
            if (result.non_finite_mismatches == 0) result.worst_input = x;
        }
    }

    result.within_tolerance = result.non_finite_mismatches == 0 && result.max_error <= tolerance;
    return result;
}

ReportResult run_kernel_report(const ReportConfig& config, KernelReport* out_report) {
    if (!out_report) return ReportResult::ErrorInvalidParameter;

    ReportConfig checked = config;
    if (!checked.validate()) {
        LOGE("Rejecting report configuration with invalid settings");
        return ReportResult::ErrorInvalidConfig;
    }

    out_report->results.clear();
    for (int i = 0; i < KERNEL_FUNCTION_COUNT; ++i) {
        KernelFunction function = static_cast<KernelFunction>(i);
        const FunctionSettings& fs = checked.settings(function);
        if (!fs.enabled) continue;

        out_report->results.push_back(measure_deviation(function, fs.domain, checked.samples,
                                                        checked.effective_tolerance(function)));
    }

    return out_report->passed() ? ReportResult::Success : ReportResult::ErrorToleranceExceeded;
}

void log_kernel_report(const KernelReport& report) {
    LOGI("%-6s %22s %12s %12s %12s  %s", "func", "domain", "max error", "tolerance", "worst at", "status");

    for (const FunctionDeviation& r : report.results) {
        const char* name = kernel_function_to_string(r.function);
        if (r.within_tolerance) {
            LOGI("%-6s [%9.3g, %9.3g] %12.3e %12.3e %12.5g  ok",
                 name, r.domain.start, r.domain.end, r.max_error, r.tolerance, r.worst_input);
        } else if (r.non_finite_mismatches > 0) {
            LOGE("%-6s [%9.3g, %9.3g] %d non-finite mismatches, first at %g",
                 name, r.domain.start, r.domain.end, r.non_finite_mismatches, r.worst_input);
        } else {
            LOGE("%-6s [%9.3g, %9.3g] %12.3e %12.3e %12.5g  FAILED",
                 name, r.domain.start, r.domain.end, r.max_error, r.tolerance, r.worst_input);
        }
    }

    int failures = report.failure_count();
    if (failures == 0) {
        LOGI("%d functions within tolerance", static_cast<int>(report.results.size()));
    } else {
        LOGE("%d of %d functions out of tolerance", failures, static_cast<int>(report.results.size()));
    }
}

} // namespace report
} // namespace portmath
