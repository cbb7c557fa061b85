#pragma once

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

// Simple key=value config file parser
class Config {
public:
    static Config load(const std::string& filename);
    static Config parse(const std::string& text);

    bool has(const std::string& key) const {
        return values_.find(key) != values_.end();
    }

    const std::map<std::string, std::string>& values() const {
        return values_;
    }

    void set(const std::string& key, const std::string& value) {
        values_[key] = value;
    }

    std::string getString(const std::string& key) const;
    std::string getString(const std::string& key, const std::string& default_val) const;

    double getDouble(const std::string& key) const;
    double getDouble(const std::string& key, double default_val) const;

    int getInt(const std::string& key) const;
    int getInt(const std::string& key, int default_val) const;

    bool getBool(const std::string& key, bool default_val) const;

    std::vector<double> getDoubleList(const std::string& key) const;
    std::vector<double> getDoubleList(const std::string& key,
                                      const std::vector<double>& default_val) const;

private:
    std::map<std::string, std::string> values_;
};
