/**
 * @file Settings.cpp
 * @brief Environment lookup for process-level merge settings
 */

#include "strata/Settings.hpp"
#include "strata/Errors.hpp"
#include "strata/Value.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace strata {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

} // anonymous namespace

std::optional<std::string> get_env_var(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

bool parse_flag(const std::string& name, const std::string& raw) {
    const std::string text = to_lower(trim(raw));
    if (text.empty()) {
        return false;
    }

    if (text == "yes" || text == "on") return true;
    if (text == "no" || text == "off") return false;

    // JSON scalars: true, false, 0, 1, 2.5 ...
    Value parsed = Value::parse(text, nullptr, false);
    if (parsed.is_boolean()) {
        return parsed.get<bool>();
    }
    if (parsed.is_number()) {
        return parsed.get<double>() != 0.0;
    }

    throw InvalidConfiguration(name + " must be a boolean, got '" + raw + "'");
}

bool legacy_array_concat_from_env() {
    auto raw = get_env_var(kArrayConcatEnvVar);
    if (!raw) {
        return false;
    }
    return parse_flag(kArrayConcatEnvVar, *raw);
}

} // namespace strata
