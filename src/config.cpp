#include "config.hpp"
#include "parse_utils.hpp"

#include <fstream>
#include <istream>
#include <sstream>

namespace {

std::string stripInlineComment(const std::string& s) {
    size_t hash = s.find('#');
    if (hash == std::string::npos) {
        return s;
    }
    return s.substr(0, hash);
}

Config parseStream(std::istream& in) {
    Config config;
    std::string line;
    int line_num = 0;

    while (std::getline(in, line)) {
        line_num++;

        // Strip inline comments, then skip empty lines
        std::string uncommented = stripInlineComment(line);
        std::string trimmed = parseutil::trimCopy(uncommented);
        if (trimmed.empty()) {
            continue;
        }

        if (trimmed.front() == '[') {
            throw std::runtime_error("Sections are not supported (line " +
                                     std::to_string(line_num) + "): " + trimmed);
        }

        // Find '='
        size_t eq = uncommented.find('=');
        if (eq == std::string::npos) {
            throw std::runtime_error("Invalid config line " + std::to_string(line_num) + ": " + line);
        }

        // Extract key and value
        std::string key = parseutil::trimCopy(uncommented.substr(0, eq));
        std::string value = parseutil::trimCopy(uncommented.substr(eq + 1));

        if (key.empty()) {
            throw std::runtime_error("Empty key at line " + std::to_string(line_num));
        }
        if (config.has(key)) {
            throw std::runtime_error("Duplicate key '" + key + "' at line " + std::to_string(line_num));
        }

        config.set(key, value);
    }

    return config;
}

}  // namespace

Config Config::load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + filename);
    }
    return parseStream(file);
}

Config Config::parse(const std::string& text) {
    std::istringstream in(text);
    return parseStream(in);
}

std::string Config::getString(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        throw std::runtime_error("Missing config key: " + key);
    }
    return it->second;
}

std::string Config::getString(const std::string& key, const std::string& default_val) const {
    auto it = values_.find(key);
    return (it != values_.end()) ? it->second : default_val;
}

double Config::getDouble(const std::string& key) const {
    return parseutil::parseDoubleStrict(getString(key), "'" + key + "'");
}

double Config::getDouble(const std::string& key, double default_val) const {
    if (!has(key)) return default_val;
    return getDouble(key);
}

int Config::getInt(const std::string& key) const {
    return parseutil::parseIntStrict(getString(key), "'" + key + "'");
}

int Config::getInt(const std::string& key, int default_val) const {
    if (!has(key)) return default_val;
    return getInt(key);
}

bool Config::getBool(const std::string& key, bool default_val) const {
    if (!has(key)) return default_val;
    std::string val = getString(key);
    if (val == "true" || val == "1" || val == "yes") return true;
    if (val == "false" || val == "0" || val == "no") return false;
    throw std::runtime_error("Invalid value for '" + key + "': expected bool, got '" + val + "'");
}

std::vector<double> Config::getDoubleList(const std::string& key) const {
    return parseutil::parseDoubleListStrict(getString(key), "'" + key + "'");
}

std::vector<double> Config::getDoubleList(const std::string& key,
                                          const std::vector<double>& default_val) const {
    if (!has(key)) return default_val;
    return getDoubleList(key);
}
