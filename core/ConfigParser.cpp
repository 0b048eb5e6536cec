#include "ConfigParser.h"
#include <algorithm>
#include <cctype>

#include "Logging/Logging.h"

namespace FCBForge {

bool ConfigParser::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    parseStream(file, filename);
    return true;
}

void ConfigParser::loadFromString(const std::string& text, const std::string& sourceName) {
    std::istringstream stream(text);
    parseStream(stream, sourceName);
}

void ConfigParser::parseStream(std::istream& stream, const std::string& sourceName) {
    std::string line;
    int lineNumber = 0;

    while (std::getline(stream, line)) {
        lineNumber++;
        if (!parseLine(line)) {
            Log(WARNING, "Config", "{}:{}: ignoring line without key=value: {}", sourceName, lineNumber, trim(line));
        }
    }
}

std::string ConfigParser::get(const std::string& key, const std::string& defaultValue) const {
    auto it = configValues.find(key);
    if (it != configValues.end()) {
        return it->second;
    }
    return defaultValue;
}

bool ConfigParser::getBool(const std::string& key, bool defaultValue) const {
    auto it = configValues.find(key);
    if (it == configValues.end()) {
        return defaultValue;
    }

    std::string value = it->second;
    std::transform(value.begin(), value.end(), value.begin(), ::tolower);
    if (value == "1" || value == "true" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "0" || value == "false" || value == "no" || value == "off") {
        return false;
    }
    Log(WARNING, "Config", "Invalid boolean '{}' for {}, using {}", it->second, key, defaultValue ? 1 : 0);
    return defaultValue;
}

int ConfigParser::getInt(const std::string& key, int defaultValue) const {
    auto it = configValues.find(key);
    if (it == configValues.end()) {
        return defaultValue;
    }

    try {
        size_t used = 0;
        int value = std::stoi(it->second, &used);
        if (used == it->second.size()) {
            return value;
        }
    } catch (const std::exception&) {
        // fall through to the warning
    }
    Log(WARNING, "Config", "Invalid integer '{}' for {}, using {}", it->second, key, defaultValue);
    return defaultValue;
}

double ConfigParser::getDouble(const std::string& key, double defaultValue) const {
    auto it = configValues.find(key);
    if (it == configValues.end()) {
        return defaultValue;
    }

    try {
        size_t used = 0;
        double value = std::stod(it->second, &used);
        if (used == it->second.size()) {
            return value;
        }
    } catch (const std::exception&) {
        // fall through to the warning
    }
    Log(WARNING, "Config", "Invalid number '{}' for {}, using {}", it->second, key, defaultValue);
    return defaultValue;
}

void ConfigParser::set(const std::string& key, const std::string& value) {
    configValues[key] = value;
}

bool ConfigParser::hasKey(const std::string& key) const {
    return configValues.find(key) != configValues.end();
}

bool ConfigParser::parseLine(const std::string& line) {
    std::string trimmedLine = trim(line);

    // Skip empty lines and comments
    if (trimmedLine.empty() || trimmedLine[0] == '#' || trimmedLine[0] == ';') {
        return true;
    }

    // Find the equals sign
    size_t equalsPos = trimmedLine.find('=');
    if (equalsPos == std::string::npos) {
        return false; // Invalid line format
    }

    // Extract key and value
    std::string key = trim(trimmedLine.substr(0, equalsPos));
    std::string value = trim(trimmedLine.substr(equalsPos + 1));

    // Remove quotes if present
    if (value.length() >= 2 &&
        ((value[0] == '"' && value[value.length()-1] == '"') ||
         (value[0] == '\'' && value[value.length()-1] == '\''))) {
        value = value.substr(1, value.length() - 2);
    }

    if (!key.empty()) {
        configValues[key] = value;
        return true;
    }

    return false;
}

std::string ConfigParser::trim(const std::string& str) const {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }

    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

} // namespace FCBForge
