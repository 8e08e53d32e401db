/**
 * @file config_reader.cpp
 * @brief Configuration reader implementation
 */

#include <compfail/io/config_reader.hpp>
#include <compfail/core/logger.hpp>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>

namespace cfl {
namespace io {

namespace {

// Whole-string numeric conversion; trailing garbage means "not a number".
// Integers outside the Int range are kept as Real.
bool parse_number(const std::string& text, ConfigValue& out) {
    if (text.empty()) return false;

    const bool is_real = text.find_first_of(".eE") != std::string::npos;
    try {
        std::size_t pos = 0;
        if (!is_real) {
            long long val = std::stoll(text, &pos);
            if (pos != text.size()) return false;
            if (val >= std::numeric_limits<Int>::min() && val <= std::numeric_limits<Int>::max()) {
                out = static_cast<Int>(val);
                return true;
            }
        }
        Real val = std::stod(text, &pos);
        if (pos != text.size()) return false;
        out = val;
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

std::string unquote(const std::string& text) {
    if (text.size() >= 2 &&
        ((text.front() == '"' && text.back() == '"') ||
         (text.front() == '\'' && text.back() == '\''))) {
        return text.substr(1, text.size() - 2);
    }
    return text;
}

} // namespace

// ============================================================================
// ConfigSection Implementation
// ============================================================================

std::string ConfigSection::get_string(const std::string& key, const std::string& default_val) const {
    if (!has(key)) return default_val;

    const auto& val = values_.at(key);
    if (std::holds_alternative<std::string>(val)) {
        return std::get<std::string>(val);
    }
    return default_val;
}

Real ConfigSection::get_real(const std::string& key, Real default_val) const {
    return find_real(key).value_or(default_val);
}

std::optional<Real> ConfigSection::find_real(const std::string& key) const {
    if (!has(key)) return std::nullopt;

    const auto& val = values_.at(key);
    if (std::holds_alternative<Real>(val)) {
        return std::get<Real>(val);
    } else if (std::holds_alternative<Int>(val)) {
        return static_cast<Real>(std::get<Int>(val));
    }
    throw InvalidArgumentError("Key '" + key + "' in section '" + name_ + "' is not a number");
}

Real ConfigSection::require_real(const std::string& key) const {
    std::optional<Real> val = find_real(key);
    if (!val) {
        throw InvalidArgumentError("Missing required key '" + key + "' in section '" + name_ + "'");
    }
    return *val;
}

Int ConfigSection::get_int(const std::string& key, Int default_val) const {
    if (!has(key)) return default_val;

    const auto& val = values_.at(key);
    if (std::holds_alternative<Int>(val)) {
        return std::get<Int>(val);
    } else if (std::holds_alternative<Real>(val)) {
        return static_cast<Int>(std::get<Real>(val));
    }
    return default_val;
}

bool ConfigSection::get_bool(const std::string& key, bool default_val) const {
    if (!has(key)) return default_val;

    const auto& val = values_.at(key);
    if (std::holds_alternative<bool>(val)) {
        return std::get<bool>(val);
    }
    return default_val;
}

std::vector<Real> ConfigSection::get_real_array(const std::string& key) const {
    if (!has(key)) return {};

    const auto& val = values_.at(key);
    if (std::holds_alternative<std::vector<Real>>(val)) {
        return std::get<std::vector<Real>>(val);
    } else if (std::holds_alternative<std::vector<Int>>(val)) {
        const auto& int_vec = std::get<std::vector<Int>>(val);
        std::vector<Real> real_vec(int_vec.size());
        for (std::size_t i = 0; i < int_vec.size(); ++i) {
            real_vec[i] = static_cast<Real>(int_vec[i]);
        }
        return real_vec;
    }
    return {};
}

std::vector<std::string> ConfigSection::get_string_array(const std::string& key) const {
    if (!has(key)) return {};

    const auto& val = values_.at(key);
    if (std::holds_alternative<std::vector<std::string>>(val)) {
        return std::get<std::vector<std::string>>(val);
    }
    return {};
}

ConfigSection& ConfigSection::subsection(const std::string& name) {
    if (!has_subsection(name)) {
        subsections_[name] = std::make_shared<ConfigSection>(name);
    }
    return *subsections_[name];
}

const ConfigSection& ConfigSection::subsection(const std::string& name) const {
    if (!has_subsection(name)) {
        throw InvalidArgumentError("Subsection not found: " + name);
    }
    return *subsections_.at(name);
}

std::vector<const ConfigSection*> ConfigSection::list_items() const {
    std::vector<const ConfigSection*> items;
    for (std::size_t i = 0; has_subsection(std::to_string(i)); ++i) {
        items.push_back(subsections_.at(std::to_string(i)).get());
    }
    return items;
}

// ============================================================================
// ConfigReader Implementation
// ============================================================================

ConfigSection ConfigReader::read(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw FileIOError(filename, "open config");
    }

    CFL_LOG_INFO("Reading config file: {}", filename);

    std::stringstream buffer;
    buffer << file.rdbuf();
    file.close();

    return read_string(buffer.str());
}

ConfigSection ConfigReader::read_string(const std::string& content) {
    ConfigSection root("root");
    parse(content, root);
    return root;
}

void ConfigReader::parse(const std::string& content, ConfigSection& root) {
    std::istringstream stream(content);
    std::string line;
    int line_number = 0;

    section_stack_.clear();
    indent_stack_.clear();
    list_counts_.clear();
    section_stack_.push_back(&root);
    indent_stack_.push_back(-1);

    while (std::getline(stream, line)) {
        ++line_number;

        // Skip empty lines and comments
        std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#') {
            continue;
        }

        int indent = get_indent_level(line);

        // A section or list item owns the lines indented deeper than its own line
        while (section_stack_.size() > 1 && indent <= indent_stack_.back()) {
            indent_stack_.pop_back();
            section_stack_.pop_back();
        }

        ConfigSection* current_section = section_stack_.back();

        // Check for list items FIRST (before checking for colons)
        if (trimmed[0] == '-' && (trimmed.size() == 1 || std::isspace(static_cast<unsigned char>(trimmed[1])))) {
            std::string item_content = trim(trimmed.substr(1));

            int& count = list_counts_[current_section];
            std::string item_name = std::to_string(count++);
            CFL_LOG_DEBUG("Creating list item '{}' under '{}'", item_name, current_section->name());
            ConfigSection& item_section = current_section->subsection(item_name);

            // Inline key-value on the item line
            std::size_t item_colon = item_content.find(':');
            if (item_colon != std::string::npos) {
                std::string item_key = trim(item_content.substr(0, item_colon));
                std::string item_value = trim(item_content.substr(item_colon + 1));

                if (!item_value.empty()) {
                    item_section.set(item_key, parse_value(item_value));
                }
            } else if (!item_content.empty()) {
                CFL_LOG_WARN("Line {}: scalar list item '{}' ignored", line_number, item_content);
            }

            // Nested properties of this item follow on deeper lines
            section_stack_.push_back(&item_section);
            indent_stack_.push_back(indent);
            continue;
        }

        std::size_t colon_pos = trimmed.find(':');
        if (colon_pos == std::string::npos) {
            CFL_LOG_WARN("Line {}: expected 'key: value', ignoring '{}'", line_number, trimmed);
            continue;
        }

        std::string key = trim(trimmed.substr(0, colon_pos));
        std::string value_str = trim(trimmed.substr(colon_pos + 1));

        if (value_str.empty() || value_str[0] == '#') {
            // Section header
            CFL_LOG_DEBUG("Creating subsection '{}' under '{}'", key, current_section->name());
            ConfigSection& new_section = current_section->subsection(key);
            section_stack_.push_back(&new_section);
            indent_stack_.push_back(indent);
        } else {
            current_section->set(key, parse_value(value_str));
        }
    }
}

ConfigValue ConfigReader::parse_value(const std::string& value_str) const {
    std::string trimmed = trim(value_str);

    // Quoted strings are taken verbatim
    if (trimmed.size() >= 2 && (trimmed.front() == '"' || trimmed.front() == '\'')
        && trimmed.back() == trimmed.front()) {
        return trimmed.substr(1, trimmed.size() - 2);
    }

    // Array [...]: numeric if every element is a number, otherwise strings
    if (!trimmed.empty() && trimmed.front() == '[' && trimmed.back() == ']') {
        std::string array_str = trimmed.substr(1, trimmed.size() - 2);
        std::vector<std::string> items;

        std::istringstream iss(array_str);
        std::string item;
        while (std::getline(iss, item, ',')) {
            item = trim(item);
            if (!item.empty()) items.push_back(item);
        }

        std::vector<Real> real_array;
        std::vector<Int> int_array;
        bool is_int = true;
        bool is_numeric = true;

        for (const auto& text : items) {
            ConfigValue number;
            if (!parse_number(text, number)) {
                is_numeric = false;
                break;
            }
            if (std::holds_alternative<Int>(number)) {
                Int val = std::get<Int>(number);
                int_array.push_back(val);
                real_array.push_back(static_cast<Real>(val));
            } else {
                real_array.push_back(std::get<Real>(number));
                is_int = false;
            }
        }

        if (!is_numeric) {
            std::vector<std::string> string_array;
            string_array.reserve(items.size());
            for (const auto& text : items) {
                string_array.push_back(unquote(text));
            }
            return string_array;
        }
        if (is_int) {
            return int_array;
        }
        return real_array;
    }

    // Boolean
    if (trimmed == "true" || trimmed == "True" || trimmed == "TRUE") {
        return true;
    }
    if (trimmed == "false" || trimmed == "False" || trimmed == "FALSE") {
        return false;
    }

    ConfigValue number;
    if (parse_number(trimmed, number)) {
        return number;
    }

    // Not a number, keep as string
    return trimmed;
}

int ConfigReader::get_indent_level(const std::string& line) const {
    int count = 0;
    for (char c : line) {
        if (c == ' ') {
            count++;
        } else if (c == '\t') {
            count += 4;  // Treat tab as 4 spaces
        } else {
            break;
        }
    }
    return count;
}

std::string ConfigReader::trim(const std::string& str) const {
    if (str.empty()) return str;

    std::size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";

    std::size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

} // namespace io
} // namespace cfl
