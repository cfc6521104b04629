#ifndef PERSONDIR_CONFIG_HPP
#define PERSONDIR_CONFIG_HPP

#include "persondir/Errors.hpp"
#include "persondir/Merger.hpp"
#include "persondir/Value.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace persondir {

/**
 * @brief Built-in defaults for every setting.
 *
 * ```json
 * {
 *   "lookup":  {"username": "username"},
 *   "merger":  {"strategy": "multivalued", "distinct": false, "recover": false},
 *   "sources": {"files": []}
 * }
 * ```
 */
Value default_settings();

/**
 * @brief Options for constructing a Config from multiple sources.
 */
struct LoadOptions {
    std::optional<std::string> file_path;
    std::optional<std::string> prefix; // Environment variable prefix, e.g. "PERSONDIR"
    std::map<std::string, Value> overrides; // final precedence
    Value defaults = default_settings();
    std::vector<std::string> mandatory;
};

/**
 * @brief Configuration tree with dot-notation helpers.
 *
 * Loaded with the precedence defaults -> file (JSON or TOML) -> env
 * (prefix) -> overrides.
 */
class Config {
public:
    Config() = default;
    explicit Config(Value data) : data_(std::move(data)) {}

    static Config load(const LoadOptions& opts);

    // Access the underlying tree
    const Value& data() const noexcept { return data_; }

    // Dot helpers
    // at() throws ConfigError if the path is missing
    const Value& at(const std::string& path) const;
    bool contains(const std::string& path) const;
    void set(const std::string& path, const Value& v);

    // Enforcement
    void enforce_mandatory(const std::vector<std::string>& keys) const;

    // ENV / Overrides
    void apply_env_prefix(const std::string& prefix);
    void apply_overrides(const std::map<std::string, Value>& kv);

private:
    Value data_ = Value::object();
};

/**
 * @brief Typed view of a loaded Config.
 */
struct Settings {
    std::string username_attribute = "username";
    std::string strategy = "multivalued";
    bool distinct_values = false;
    bool recover_exceptions = false;
    std::vector<std::string> source_files;

    /**
     * @throws ConfigError if a setting has the wrong type
     */
    static Settings from_config(const Config& cfg);

    /**
     * @brief Build the merger described by strategy / distinct_values
     * @throws InvalidArgument if the strategy name is unknown
     */
    std::shared_ptr<AttributeMerger> make_merger() const;
};

} // namespace persondir

#endif // PERSONDIR_CONFIG_HPP
