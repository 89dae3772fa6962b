// options.cpp - DiffOptions merge and validation

#include <diffx/options.h>
#include <diffx/error.h>
#include <diffx/value.h>

#include <cmath>

namespace diffx {

namespace {

[[noreturn]] void reject(std::string_view field, const std::string& message)
{
    detail::log_access_error("DiffOptions::from", std::string(field) + ": " + message);
    throw InvalidOptions(message);
}

} // anonymous namespace

std::string_view to_string(OutputFormat format) noexcept
{
    switch (format) {
        case OutputFormat::Diffx: return "diffx";
        case OutputFormat::Json:  return "json";
        case OutputFormat::Yaml:  return "yaml";
    }
    return "diffx";
}

OutputFormat parse_output_format(std::string_view name)
{
    if (name == "diffx") return OutputFormat::Diffx;
    if (name == "json")  return OutputFormat::Json;
    if (name == "yaml")  return OutputFormat::Yaml;
    detail::log_access_error("parse_output_format", "unknown format '" + std::string(name) + "'");
    throw UnsupportedFormat(std::string(name));
}

DiffOptions DiffOptions::from(const DiffOptionsOverrides& overrides)
{
    DiffOptions opts;

    if (overrides.epsilon) {
        const double eps = *overrides.epsilon;
        if (!std::isfinite(eps) || eps < 0.0) {
            reject("epsilon", "invalid epsilon");
        }
        opts.epsilon_ = eps;
    }

    if (overrides.array_id_key) {
        if (overrides.array_id_key->empty()) {
            reject("array_id_key", "invalid array id key");
        }
        opts.array_id_key_ = overrides.array_id_key;
    }

    if (overrides.ignore_keys_regex) {
        const std::string& pattern = *overrides.ignore_keys_regex;
        if (pattern.empty()) {
            reject("ignore_keys_regex", "invalid pattern");
        }
        try {
            opts.ignore_keys_regex_ = std::make_shared<std::regex>(pattern, std::regex::ECMAScript);
        } catch (const std::regex_error& e) {
            detail::log_access_error("DiffOptions::from", std::string("regex_error: ") + e.what());
            throw InvalidOptions("invalid pattern");
        }
        opts.ignore_keys_pattern_ = pattern;
    }

    if (overrides.path_filter) {
        if (overrides.path_filter->empty()) {
            reject("path_filter", "invalid pattern");
        }
        opts.path_filter_ = overrides.path_filter;
    }

    if (overrides.output_format) {
        opts.output_format_ = *overrides.output_format;
    }

    opts.ignore_whitespace_ = overrides.ignore_whitespace.value_or(false);
    opts.ignore_case_       = overrides.ignore_case.value_or(false);
    opts.brief_mode_        = overrides.brief_mode.value_or(false);
    opts.quiet_mode_        = overrides.quiet_mode.value_or(false);

    return opts;
}

bool DiffOptions::ignores_key(const std::string& key) const
{
    return ignore_keys_regex_ && std::regex_search(key, *ignore_keys_regex_);
}

bool DiffOptions::keeps_path(std::string_view path) const noexcept
{
    return !path_filter_ || path.find(*path_filter_) != std::string_view::npos;
}

} // namespace diffx
