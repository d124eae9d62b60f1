#pragma once
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>

namespace signal_lambda {

// Process environment with `.env.local` overrides. Values from the file win over
// the inherited environment and are exported so child libraries see them too.
class EnvLoader {
public:
    static EnvLoader& instance() {
        static EnvLoader instance;
        return instance;
    }

    std::string get(const std::string& key, const std::string& defaultValue = "") const {
        return getOptional(key).value_or(defaultValue);
    }

    // nullopt when neither the env file nor the environment defines the key
    std::optional<std::string> getOptional(const std::string& key) const {
        if (auto it = m_variables.find(key); it != m_variables.end()) {
            return it->second;
        }
        if (const char* value = std::getenv(key.c_str())) {
            return std::string{value};
        }
        return std::nullopt;
    }

    bool getBool(const std::string& key, bool defaultValue = false) const {
        std::string value = get(key);
        if (value == "true" || value == "1" || value == "yes" || value == "on") return true;
        if (value == "false" || value == "0" || value == "no" || value == "off") return false;
        return defaultValue;
    }

    void set(const std::string& key, const std::string& value) {
        m_variables[key] = value;
        setenv(key.c_str(), value.c_str(), 1);
    }

    void unset(const std::string& key) {
        m_variables.erase(key);
        unsetenv(key.c_str());
    }

    // Reads KEY=VALUE lines; missing files are ignored
    void loadFile(const std::filesystem::path& path) {
        std::ifstream file(path);
        if (!file.is_open()) return;

        std::string line;
        while (std::getline(file, line)) {
            parseLine(line);
        }
        SPDLOG_INFO("Loaded environment from {}", path.string());
    }

private:
    std::unordered_map<std::string, std::string> m_variables;

    EnvLoader() {
        if (std::filesystem::exists(".env.local")) {
            loadFile(".env.local");
        }
    }

    void parseLine(const std::string& line) {
        std::string text = trim(line);
        if (text.empty() || text.front() == '#') return;
        if (text.starts_with("export ")) text = trim(text.substr(7));

        size_t pos = text.find('=');
        if (pos == std::string::npos) return;

        std::string key = trim(text.substr(0, pos));
        std::string value = trim(text.substr(pos + 1));
        if (value.length() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
            value = value.substr(1, value.length() - 2);
        }

        if (!key.empty()) {
            set(key, expandVariables(value));
        }
    }

    // ${VAR} references resolve against what has been loaded so far
    std::string expandVariables(std::string value) const {
        size_t pos = 0;
        while ((pos = value.find("${", pos)) != std::string::npos) {
            size_t end = value.find('}', pos);
            if (end == std::string::npos) break;

            std::string replacement = get(value.substr(pos + 2, end - pos - 2));
            value.replace(pos, end - pos + 1, replacement);
            pos += replacement.length();
        }
        return value;
    }

    static std::string trim(const std::string& str) {
        const auto begin = str.find_first_not_of(" \t\r\n");
        if (begin == std::string::npos) return "";
        const auto end = str.find_last_not_of(" \t\r\n");
        return str.substr(begin, end - begin + 1);
    }
};

} // namespace signal_lambda
