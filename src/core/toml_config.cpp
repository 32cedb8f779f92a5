#include "facewatch/core/toml_config.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace facewatch {

std::string TomlConfig::trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

void TomlConfig::parse_line(std::string line, std::string& section) {
    // Strip trailing comments outside of quotes
    bool in_quotes = false;
    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '"') in_quotes = !in_quotes;
        if (line[i] == '#' && !in_quotes) {
            line = line.substr(0, i);
            break;
        }
    }

    line = trim(line);
    if (line.empty()) return;

    if (line.front() == '[' && line.back() == ']') {
        section = trim(line.substr(1, line.length() - 2));
        return;
    }

    auto eq = line.find('=');
    if (eq == std::string::npos) {
        spdlog::warn("Config: ignoring malformed line '{}'", line);
        return;
    }

    std::string key = trim(line.substr(0, eq));
    std::string val = trim(line.substr(eq + 1));

    if (val.size() >= 2 && val.front() == '"' && val.back() == '"') {
        val = val.substr(1, val.length() - 2);
    }

    std::string full_key = section.empty() ? key : section + "." + key;
    values[full_key] = val;
}

bool TomlConfig::load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) return false;

    std::string line, section;
    while (std::getline(file, line)) {
        parse_line(line, section);
    }
    return true;
}

void TomlConfig::load_string(const std::string& content) {
    std::istringstream in(content);
    std::string line, section;
    while (std::getline(in, line)) {
        parse_line(line, section);
    }
}

bool TomlConfig::has(const std::string& key) const {
    return values.find(key) != values.end();
}

std::string TomlConfig::get(const std::string& key, const std::string& def) const {
    auto it = values.find(key);
    return it != values.end() ? it->second : def;
}

int TomlConfig::get_int(const std::string& key, int def) const {
    if (!has(key)) return def;
    try {
        return std::stoi(get(key));
    } catch (const std::exception& e) {
        spdlog::warn("Config: '{}' is not an integer ({}), using {}", key, get(key), def);
        return def;
    }
}

float TomlConfig::get_float(const std::string& key, float def) const {
    if (!has(key)) return def;
    try {
        return std::stof(get(key));
    } catch (const std::exception& e) {
        spdlog::warn("Config: '{}' is not a number ({}), using {}", key, get(key), def);
        return def;
    }
}

bool TomlConfig::get_bool(const std::string& key, bool def) const {
    if (!has(key)) return def;
    std::string v = get(key);
    if (v == "true" || v == "1") return true;
    if (v == "false" || v == "0") return false;
    spdlog::warn("Config: '{}' is not a boolean ({}), using {}", key, v, def);
    return def;
}

std::vector<std::string> TomlConfig::keys() const {
    std::vector<std::string> out;
    out.reserve(values.size());
    for (const auto& [key, value] : values) {
        out.push_back(key);
    }
    return out;
}

} // namespace facewatch
