#pragma once
#include <map>
#include <string>
#include <vector>

namespace facewatch {

// Minimal TOML reader: [sections], key = value, "quoted strings", # comments.
// Keys are addressed as "section.key".
class TomlConfig {
public:
    bool load(const std::string& filename);
    void load_string(const std::string& content);

    bool has(const std::string& key) const;
    std::string get(const std::string& key, const std::string& def = "") const;
    int get_int(const std::string& key, int def = 0) const;
    float get_float(const std::string& key, float def = 0.0f) const;
    bool get_bool(const std::string& key, bool def = false) const;

    void set(const std::string& key, const std::string& value) { values[key] = value; }
    std::vector<std::string> keys() const;

private:
    std::map<std::string, std::string> values;

    void parse_line(std::string line, std::string& section);
    static std::string trim(const std::string& s);
};

} // namespace facewatch
