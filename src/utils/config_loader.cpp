#include "wirehdr/utils/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

#include "wirehdr/utils/env.hpp"

namespace wirehdr::utils {

void ConfigLoader::load_defaults(const std::unordered_map<std::string, ConfigValue>& d) {
    std::lock_guard<std::mutex> lk(config_mutex_);
    for (auto& [k, v] : d) config_data_[k] = v;
}

size_t ConfigLoader::load_from_environment(const std::string& prefix) {
    size_t n = 0;
    for (const auto& key : get_all_keys()) {
        auto v = config_utils::get_env_var(config_utils::normalize_env_var_name(key, prefix));
        if (!v) continue;
        set(key, *v);
        ++n;
    }
    return n;
}

size_t ConfigLoader::load_from_command_line(int argc, char* argv[]) {
    size_t n = 0;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto eq = a.find('=');
        if (a.rfind("--", 0) == 0 && eq != std::string::npos && eq > 2) {
            set(a.substr(2, eq - 2), a.substr(eq + 1));
            n++;
        }
    }
    return n;
}

std::optional<ConfigValue> ConfigLoader::find_value(const std::string& key) const {
    std::lock_guard<std::mutex> lk(config_mutex_);
    auto it = config_data_.find(key);
    if (it == config_data_.end()) return std::nullopt;
    return it->second;
}

std::string ConfigLoader::get_string(const std::string& key, const std::string& def) const {
    auto v = find_value(key);
    if (!v) return def;
    if (auto* s = std::get_if<std::string>(&*v)) return *s;
    if (auto* i = std::get_if<int64_t>(&*v)) return std::to_string(*i);
    return std::get<bool>(*v) ? "true" : "false";
}

int64_t ConfigLoader::get_int(const std::string& key, int64_t def) const {
    auto v = find_value(key);
    if (!v) return def;
    if (auto* i = std::get_if<int64_t>(&*v)) return *i;
    if (auto* s = std::get_if<std::string>(&*v)) return config_utils::parse_int(*s).value_or(def);
    return std::get<bool>(*v) ? 1 : 0;
}

uint64_t ConfigLoader::get_uint(const std::string& key, uint64_t def) const {
    auto v = find_value(key);
    if (!v) return def;
    if (auto* i = std::get_if<int64_t>(&*v)) return *i < 0 ? def : static_cast<uint64_t>(*i);
    if (auto* s = std::get_if<std::string>(&*v)) return config_utils::parse_uint(*s).value_or(def);
    return std::get<bool>(*v) ? 1u : 0u;
}

bool ConfigLoader::get_bool(const std::string& key, bool def) const {
    auto v = find_value(key);
    if (!v) return def;
    if (auto* b = std::get_if<bool>(&*v)) return *b;
    if (auto* i = std::get_if<int64_t>(&*v)) return *i != 0;
    return config_utils::parse_bool(std::get<std::string>(*v));
}

bool ConfigLoader::has(const std::string& key) const { return find_value(key).has_value(); }
bool ConfigLoader::remove(const std::string& key) { std::lock_guard<std::mutex> lk(config_mutex_); return config_data_.erase(key) > 0; }
void ConfigLoader::clear() { std::lock_guard<std::mutex> lk(config_mutex_); config_data_.clear(); }

std::vector<std::string> ConfigLoader::get_all_keys() const {
    std::lock_guard<std::mutex> lk(config_mutex_);
    std::vector<std::string> keys;
    keys.reserve(config_data_.size());
    for (auto& [k, _] : config_data_) keys.push_back(k);
    std::sort(keys.begin(), keys.end());
    return keys;
}

// utils
namespace config_utils {
std::string normalize_env_var_name(const std::string& k, const std::string& p) {
    std::string r = p;
    for (char c : k) r += (c == '.' ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    return r;
}

std::optional<std::string> get_env_var(const std::string& n) {
    return getenv_os(n);
}

bool parse_bool(const std::string& str) {
    std::string s = str;
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s == "1" || s == "true" || s == "yes" || s == "on";
}

template<typename T>
static std::optional<T> parse_number(const std::string& str) {
    if (str.empty()) return std::nullopt;
    int base = 10;
    const char* first = str.data();
    const char* last = str.data() + str.size();
    if (str.size() > 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X')) {
        base = 16;
        first += 2;
    }
    T out = 0;
    auto [ptr, ec] = std::from_chars(first, last, out, base);
    if (ec != std::errc{} || ptr != last) return std::nullopt;
    return out;
}

std::optional<int64_t> parse_int(const std::string& str) { return parse_number<int64_t>(str); }
std::optional<uint64_t> parse_uint(const std::string& str) { return parse_number<uint64_t>(str); }
} // namespace config_utils

} // namespace wirehdr::utils
