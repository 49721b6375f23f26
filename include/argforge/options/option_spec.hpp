/*
 * Option declarations - argforge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace argforge {

enum class ValueType { Bool, String, Integer, Float };

// monostate means "not given and no default".
using OptionValue = std::variant<std::monostate, bool, std::int64_t, double, std::string>;

struct OptionSpec {
    std::vector<std::string> names;  // invocation strings, e.g. "-u", "--url"
    std::string dest;                // destination name, e.g. "url"
    ValueType type = ValueType::String;
    std::string help;
    bool hidden = false;             // never listed in help output
    OptionValue default_value{};

    bool takes_value() const { return type != ValueType::Bool; }
};

// Title-less group holds the top-level options.
struct OptionGroup {
    std::string title;
    std::string description;
    std::vector<OptionSpec> options;
};

const char* type_name(ValueType type);

// Converts raw text into the option's type; nullopt when it does not parse.
std::optional<OptionValue> convert_value(ValueType type, const std::string& raw);

std::string to_string(const OptionValue& value);

// Destination -> value, as produced by the option parser.
class OptionValues {
public:
    void set(const std::string& dest, OptionValue value) { m_values[dest] = std::move(value); }
    bool has(const std::string& dest) const { return m_values.count(dest) != 0; }
    const OptionValue& get(const std::string& dest) const;

    // Truthiness: false, 0, "" and unset are all false.
    bool truthy(const std::string& dest) const;
    bool flag(const std::string& dest) const;
    std::optional<std::string> str(const std::string& dest) const;
    std::optional<std::int64_t> integer(const std::string& dest) const;

    const std::map<std::string, OptionValue>& all() const { return m_values; }
private:
    std::map<std::string, OptionValue> m_values;
};

} // namespace argforge
