#pragma once

#include <string>
#include <map>
#include <fstream>
#include <sstream>

namespace FCBForge {

class ConfigParser {
private:
    std::map<std::string, std::string> configValues;

public:
    ConfigParser() = default;

    // Load config from file
    bool loadFromFile(const std::string& filename);

    // Load config from an in-memory key=value text
    void loadFromString(const std::string& text, const std::string& sourceName = "<string>");

    // Get a config value with default
    std::string get(const std::string& key, const std::string& defaultValue = "") const;

    // Typed getters, fall back to the default (with a warning) on unparsable values
    bool getBool(const std::string& key, bool defaultValue) const;
    int getInt(const std::string& key, int defaultValue) const;
    double getDouble(const std::string& key, double defaultValue) const;

    // Set a config value
    void set(const std::string& key, const std::string& value);

    // Check if a key exists
    bool hasKey(const std::string& key) const;

    // Get all config values
    const std::map<std::string, std::string>& getAllValues() const { return configValues; }

private:
    void parseStream(std::istream& stream, const std::string& sourceName);

    // Parse a single line
    bool parseLine(const std::string& line);

    // Trim whitespace
    std::string trim(const std::string& str) const;
};

} // namespace FCBForge
