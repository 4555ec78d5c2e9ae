#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <unordered_map>

#include <raylib.h>

namespace rres::core {

Config& Config::instance() {
    static Config inst;
    return inst;
}

Config::Config() {
    // Logging defaults
    config_.logging.enabled = true;
    config_.logging.level = LOG_INFO;
    config_.logging.file = "";
}

std::string Config::trim(std::string s) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

    while (!s.empty() && is_space(static_cast<unsigned char>(s.front()))) s.erase(s.begin());
    while (!s.empty() && is_space(static_cast<unsigned char>(s.back()))) s.pop_back();

    return s;
}

std::string Config::to_lower(std::string s) {
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

std::string Config::strip_quotes(std::string s) {
    s = trim(std::move(s));

    if (s.size() >= 2) {
        const char a = s.front();
        const char b = s.back();
        if ((a == '"' && b == '"') || (a == '\'' && b == '\'')) {
            return s.substr(1, s.size() - 2);
        }
    }
    return s;
}

bool Config::parse_bool(const std::string& v, bool default_value) {
    std::string s = to_lower(trim(v));
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return default_value;
}

int Config::parse_int(const std::string& v, int default_value) {
    const std::string s = trim(v);
    try {
        std::size_t idx = 0;
        int out = std::stoi(s, &idx, 10);
        if (idx != s.size()) return default_value;
        return out;
    } catch (const std::logic_error&) {
        // invalid_argument / out_of_range
        return default_value;
    }
}

std::uint32_t Config::parse_u32(const std::string& v, std::uint32_t default_value) {
    const std::string s = trim(v);
    if (s.empty() || s.front() == '-') return default_value;

    try {
        std::size_t idx = 0;
        unsigned long long out = std::stoull(s, &idx, 10);
        if (idx != s.size() || out > std::numeric_limits<std::uint32_t>::max()) return default_value;
        return static_cast<std::uint32_t>(out);
    } catch (const std::logic_error&) {
        return default_value;
    }
}

int Config::log_level_from_string(const std::string& v, int default_value) {
    std::string s = to_lower(strip_quotes(v));

    static const std::unordered_map<std::string, int> map = {
        {"all", LOG_ALL},
        {"trace", LOG_TRACE},
        {"debug", LOG_DEBUG},
        {"info", LOG_INFO},
        {"warning", LOG_WARNING}, {"warn", LOG_WARNING},
        {"error", LOG_ERROR},
        {"fatal", LOG_FATAL},
        {"none", LOG_NONE}, {"off", LOG_NONE},
    };

    auto it = map.find(s);
    if (it != map.end()) return it->second;

    // Allow numeric.
    return parse_int(s, default_value);
}

void Config::apply_kv(const std::string& section, const std::string& key, const std::string& value) {
    const std::string sec = to_lower(trim(section));
    const std::string k = to_lower(trim(key));
    const std::string v = strip_quotes(value);

    if (sec == "logging") {
        if (k == "enabled") config_.logging.enabled = parse_bool(v, config_.logging.enabled);
        else if (k == "level") config_.logging.level = log_level_from_string(v, config_.logging.level);
        else if (k == "file") config_.logging.file = v;
        return;
    }

    if (sec == "reader") {
        auto& limits = config_.reader;
        if (k == "max_name_length") limits.maxNameLength = parse_u32(v, limits.maxNameLength);
        else if (k == "max_directory_entries") limits.maxDirectoryEntries = parse_u32(v, limits.maxDirectoryEntries);
        else if (k == "max_chain_length") limits.maxChainLength = parse_u32(v, limits.maxChainLength);
        return;
    }

    if (sec == "inspect") {
        if (k == "hexdump_bytes") config_.inspect.hexdump_bytes = parse_u32(v, config_.inspect.hexdump_bytes);
        else if (k == "show_properties") config_.inspect.show_properties = parse_bool(v, config_.inspect.show_properties);
        return;
    }
}

bool Config::load_from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return false;
    }

    std::string section;
    std::string line;

    while (std::getline(in, line)) {
        // Strip comments (# or ;) - cut at first occurrence.
        auto hash = line.find('#');
        auto semi = line.find(';');
        size_t cut = std::string::npos;
        if (hash != std::string::npos) cut = hash;
        if (semi != std::string::npos) cut = (cut == std::string::npos) ? semi : std::min(cut, semi);
        if (cut != std::string::npos) line = line.substr(0, cut);

        line = trim(line);
        if (line.empty()) continue;

        if (line.front() == '[' && line.back() == ']') {
            section = trim(line.substr(1, line.size() - 2));
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (key.empty()) continue;

        apply_kv(section, key, value);
    }

    loaded_from_path_ = path;
    return true;
}

} // namespace rres::core
