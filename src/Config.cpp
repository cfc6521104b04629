#include "persondir/Config.hpp"
#include "persondir/Loader.hpp"
#include "persondir/Strategies.hpp"
#include "persondir/Util.hpp"

#include <algorithm>
#include <cctype>

namespace persondir {

Value default_settings() {
    Value defaults = Value::object();
    defaults["lookup"]["username"] = "username";
    defaults["merger"]["strategy"] = "multivalued";
    defaults["merger"]["distinct"] = false;
    defaults["merger"]["recover"] = false;
    defaults["sources"]["files"] = Value::array();
    return defaults;
}

Config Config::load(const LoadOptions& opts) {
    Value merged = Value::object();

    // 1) defaults
    deep_merge(merged, opts.defaults);

    // 2) file
    if (opts.file_path.has_value()) {
        deep_merge(merged, load_config_file(*opts.file_path));
    }

    Config cfg(merged);

    // 3) env
    if (opts.prefix.has_value() && !opts.prefix->empty()) {
        cfg.apply_env_prefix(*opts.prefix);
    }

    // 4) overrides
    cfg.apply_overrides(opts.overrides);

    // 5) mandatory
    cfg.enforce_mandatory(opts.mandatory);

    return cfg;
}

const Value& Config::at(const std::string& path) const {
    const Value* v = find_by_dot(data_, path);
    if (v == nullptr) {
        throw ConfigError("Key not found: '" + path + "'");
    }
    return *v;
}

bool Config::contains(const std::string& path) const {
    return exists_by_dot(data_, path);
}

void Config::set(const std::string& path, const Value& v) {
    set_by_dot(data_, path, v);
}

void Config::enforce_mandatory(const std::vector<std::string>& keys) const {
    std::vector<std::string> missing;
    for (const auto& k : keys) {
        if (!contains(k)) missing.push_back(k);
    }
    if (!missing.empty()) throw MissingMandatoryConfig(missing);
}

void Config::apply_env_prefix(const std::string& prefix) {
    // prefix is normalized to end with '_'
    std::string normalized = prefix;
    while (!normalized.empty() && normalized.back() == '_') normalized.pop_back();
    normalized += "_";

    for (const auto& [name, value] : enumerate_environment()) {
        if (name.rfind(normalized, 0) == 0) {
            // remainder -> lower, underscores become dots
            std::string key = to_lower(name.substr(normalized.size()));
            std::replace(key.begin(), key.end(), '_', '.');

            if (key.empty()) continue;
            set_by_dot(data_, key, parse_json_or_string(value));
        }
    }
}

void Config::apply_overrides(const std::map<std::string, Value>& kv) {
    for (const auto& [k, v] : kv) {
        set_by_dot(data_, k, v);
    }
}

// ---- Settings ---------------------------------------------------------------
namespace {

    const Value* setting(const Config& cfg, const std::string& path, bool (Value::*is_type)() const noexcept,
                         const char* expected) {
        if (!cfg.contains(path)) return nullptr;
        const Value& v = cfg.at(path);
        if (!(v.*is_type)()) {
            throw ConfigError("Invalid value for '" + path + "': expected " + expected +
                              ", got " + type_name(v));
        }
        return &v;
    }

} // namespace

Settings Settings::from_config(const Config& cfg) {
    Settings s;

    if (auto v = setting(cfg, "lookup.username", &Value::is_string, "string")) {
        s.username_attribute = v->get<std::string>();
    }
    if (auto v = setting(cfg, "merger.strategy", &Value::is_string, "string")) {
        s.strategy = v->get<std::string>();
    }
    if (auto v = setting(cfg, "merger.distinct", &Value::is_boolean, "boolean")) {
        s.distinct_values = v->get<bool>();
    }
    if (auto v = setting(cfg, "merger.recover", &Value::is_boolean, "boolean")) {
        s.recover_exceptions = v->get<bool>();
    }
    if (auto v = setting(cfg, "sources.files", &Value::is_array, "array")) {
        for (const auto& file : *v) {
            if (!file.is_string()) {
                throw ConfigError("Invalid entry in 'sources.files': expected string, got " +
                                  type_name(file));
            }
            s.source_files.push_back(file.get<std::string>());
        }
    }

    return s;
}

std::shared_ptr<AttributeMerger> Settings::make_merger() const {
    return make_additive_merger(strategy, distinct_values);
}

} // namespace persondir
