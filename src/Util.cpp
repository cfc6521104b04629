#include "persondir/Util.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <unistd.h>

extern char **environ;

namespace persondir {

void deep_merge(Value& a, const Value& b) {
    if (!a.is_object() || !b.is_object()) {
        a = b;
        return;
    }
    for (auto it = b.begin(); it != b.end(); ++it) {
        const auto& key = it.key();
        const auto& bv  = it.value();
        if (a.contains(key) && a[key].is_object() && bv.is_object()) {
            deep_merge(a[key], bv);
        } else {
            a[key] = bv;
        }
    }
}

const Value* find_by_dot(const Value& obj, const std::string& path) {
    const Value* cur = &obj;
    std::string token;
    std::istringstream iss(path);
    while (std::getline(iss, token, '.')) {
        if (!cur->is_object()) return nullptr;
        auto it = cur->find(token);
        if (it == cur->end()) return nullptr;
        cur = &(*it);
    }
    return cur;
}

bool exists_by_dot(const Value& obj, const std::string& path) {
    return find_by_dot(obj, path) != nullptr;
}

void set_by_dot(Value& obj, const std::string& path, const Value& value) {
    Value* cur = &obj;
    std::vector<std::string> parts = split(path, '.');
    if (parts.empty()) return;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        auto& p = parts[i];
        if (!cur->is_object()) *cur = Value::object();
        if (!cur->contains(p) || !(*cur)[p].is_object()) {
            (*cur)[p] = Value::object();
        }
        cur = &(*cur)[p];
    }
    if (!cur->is_object()) *cur = Value::object();
    (*cur)[parts.back()] = value;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::string tok;
    std::istringstream iss(s);
    while (std::getline(iss, tok, delim)) {
        if (!tok.empty()) parts.push_back(tok);
    }
    return parts;
}

namespace {

std::string trim(const std::string& x) {
    size_t i = 0, j = x.size();
    while (i < j && std::isspace(static_cast<unsigned char>(x[i]))) ++i;
    while (j > i && std::isspace(static_cast<unsigned char>(x[j - 1]))) --j;
    return x.substr(i, j - i);
}

// Split on commas outside of quotes, brackets and braces
std::vector<std::string> split_top_level(const std::string& s) {
    std::vector<std::string> pieces;
    std::string current;
    int depth = 0;
    char quote = '\0';

    for (size_t i = 0; i < s.size(); ++i) {
        const char c = s[i];
        if (quote != '\0') {
            if (c == quote && s[i - 1] != '\\') quote = '\0';
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '{' || c == '[') {
            ++depth;
        } else if (c == '}' || c == ']') {
            --depth;
        } else if (c == ',' && depth == 0) {
            pieces.push_back(current);
            current.clear();
            continue;
        }
        current += c;
    }
    if (!current.empty()) pieces.push_back(current);
    return pieces;
}

} // anonymous namespace

std::map<std::string, Value> parse_overrides(const std::string& s) {
    std::map<std::string, Value> out;
    for (const auto& piece : split_top_level(s)) {
        auto colon = piece.find(':');
        if (colon == std::string::npos) continue;
        std::string key = trim(piece.substr(0, colon));
        if (key.empty()) continue;
        out[key] = parse_json_or_string(trim(piece.substr(colon + 1)));
    }
    return out;
}

std::vector<std::pair<std::string, std::string>> enumerate_environment() {
    std::vector<std::pair<std::string, std::string>> envs;
    if (environ) {
        for (char **env = environ; *env; ++env) {
            std::string entry(*env);
            auto pos = entry.find('=');
            if (pos == std::string::npos) continue;
            envs.emplace_back(entry.substr(0,pos), entry.substr(pos+1));
        }
    }
    return envs;
}

Value parse_json_or_string(const std::string& raw) {
    // Non-JSON text is kept verbatim as a string
    Value parsed = Value::parse(raw, nullptr, false);
    if (parsed.is_discarded()) {
        return Value(raw);
    }
    return parsed;
}

} // namespace persondir
