#pragma once

/**
 * @file config_reader.hpp
 * @brief Configuration file reader for analysis cases
 *
 * Supports a simple YAML-like format:
 * ```
 * material:
 *   name: "cfrp_spar_cap"
 *   Xc: 4.206e8
 *   Xt: 5.629e8
 *
 * section:
 *   height: 20.0e-3
 *
 * load_cases:
 *   - name: "root"
 *     bending_moment: 100.0
 *   - name: "mid_span"
 *     bending_moment: 40.0
 *
 * stress_states:
 *   - name: "uniaxial"
 *     stress: [1.0e8, 0, 0, 0, 0, 0]
 * ```
 *
 * Sibling list items must share the indentation of their leading "- ".
 * List items become subsections named "0", "1", ... in order.
 */

#include <compfail/core/core.hpp>
#include <string>
#include <vector>
#include <map>
#include <variant>
#include <memory>
#include <optional>

namespace cfl {
namespace io {

/**
 * @brief Configuration value types
 */
using ConfigValue = std::variant<
    std::string,
    Real,
    Int,
    bool,
    std::vector<Real>,
    std::vector<Int>,
    std::vector<std::string>
>;

/**
 * @brief Configuration section (hierarchical key-value storage)
 */
class ConfigSection {
public:
    ConfigSection() = default;
    explicit ConfigSection(const std::string& name) : name_(name) {}

    const std::string& name() const { return name_; }

    bool has(const std::string& key) const {
        return values_.count(key) > 0;
    }

    std::string get_string(const std::string& key, const std::string& default_val = "") const;

    /**
     * @brief Get value as real number (integers are converted)
     */
    Real get_real(const std::string& key, Real default_val = 0.0) const;

    /**
     * @brief Get a real value that must be present
     * @throws InvalidArgumentError if the key is missing or not numeric
     */
    Real require_real(const std::string& key) const;

    /**
     * @brief Get a real value if the key is present
     * @throws InvalidArgumentError if the key is present but not numeric
     */
    std::optional<Real> find_real(const std::string& key) const;

    Int get_int(const std::string& key, Int default_val = 0) const;

    bool get_bool(const std::string& key, bool default_val = false) const;

    /**
     * @brief Get value as real array (integer arrays are converted)
     */
    std::vector<Real> get_real_array(const std::string& key) const;

    std::vector<std::string> get_string_array(const std::string& key) const;

    void set(const std::string& key, const ConfigValue& value) {
        values_[key] = value;
    }

    /**
     * @brief Get subsection, creating it if needed
     */
    ConfigSection& subsection(const std::string& name);

    /**
     * @brief Get subsection (const)
     * @throws InvalidArgumentError if it does not exist
     */
    const ConfigSection& subsection(const std::string& name) const;

    bool has_subsection(const std::string& name) const {
        return subsections_.count(name) > 0;
    }

    /**
     * @brief List items ("0", "1", ...) in document order
     */
    std::vector<const ConfigSection*> list_items() const;

private:
    std::string name_;
    std::map<std::string, ConfigValue> values_;
    std::map<std::string, std::shared_ptr<ConfigSection>> subsections_;
};

/**
 * @brief Simple configuration file reader
 */
class ConfigReader {
public:
    ConfigReader() = default;

    /**
     * @brief Read configuration from file
     * @throws FileIOError if the file cannot be opened
     */
    ConfigSection read(const std::string& filename);

    ConfigSection read_string(const std::string& content);

private:
    void parse(const std::string& content, ConfigSection& root);

    ConfigValue parse_value(const std::string& value_str) const;

    int get_indent_level(const std::string& line) const;

    std::string trim(const std::string& str) const;

    std::vector<ConfigSection*> section_stack_;
    std::vector<int> indent_stack_;
    std::map<const ConfigSection*, int> list_counts_;
};

} // namespace io
} // namespace cfl
