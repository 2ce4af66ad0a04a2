#pragma once
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include "utils/Logger.hpp"

namespace kclick {

// Path handling helper functions
namespace ConfigPaths {
    static const std::string MAIN_CONFIG = "kclick.cfg";

    // $XDG_CONFIG_HOME/kclick, falling back to ~/.config/kclick
    inline std::filesystem::path GetConfigDir() {
        if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
            return std::filesystem::path(xdg) / "kclick";
        }
        if (const char* home = std::getenv("HOME"); home && *home) {
            return std::filesystem::path(home) / ".config" / "kclick";
        }
        return std::filesystem::path("config");
    }

    inline std::string GetConfigPath(const std::string& filename = MAIN_CONFIG) {
        if (filename.find('/') != std::string::npos) {
            // If already contains a path separator, use as-is
            return filename;
        }
        return (GetConfigDir() / filename).string();
    }
}

class Configs {
public:
    static inline const std::string CLICKS_PER_SECOND_KEY = "Clicker.ClicksPerSecond";
    static inline const std::string CLICK_MODE_KEY = "Clicker.Mode";
    static inline const std::string SHORTCUT_KEY = "Shortcut.Binding";
    static inline const std::string PAUSE_MODIFIER_KEY = "Input.PauseModifier";
    static inline const std::string VERBOSE_INPUT_KEY = "Debug.VerboseInputLogging";

    static Configs& Get() {
        static Configs instance;
        return instance;
    }

    explicit Configs(std::string path = ConfigPaths::GetConfigPath())
        : path(std::move(path)) {}

    [[nodiscard]] const std::string& getPath() const { return path; }
    void setPath(std::string newPath) { path = std::move(newPath); }

    // Writes a commented default file when none exists yet
    void EnsureConfigFile() {
        namespace fs = std::filesystem;
        std::error_code ec;
        if (fs::exists(path, ec)) return;

        const fs::path parent = fs::path(path).parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent, ec);
            if (ec) {
                warning("Failed to create config directory {}: {}", parent.string(), ec.message());
                return;
            }
        }

        std::ofstream file(path);
        if (!file.is_open()) {
            warning("Could not create config file: {}", path);
            return;
        }
        file << "# KClick settings" << "\n";
        file << "[Clicker]" << "\n";
        file << "ClicksPerSecond=10" << "\n";
        file << "Mode=Toggle" << "\n";
        file << "[Input]" << "\n";
        file << "# Fn, Shift, Ctrl, Alt or Super" << "\n";
        file << "PauseModifier=Fn" << "\n";
        file << "[Debug]" << "\n";
        file << "VerboseInputLogging=false" << "\n";
    }

    bool Load() {
        std::ifstream file(path);
        if (!file.is_open()) {
            info("No config file at {}, using defaults", path);
            return false;
        }

        settings.clear();
        std::string line, currentSection;
        while (std::getline(file, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.empty() || line[0] == '#' || line[0] == ';') continue;

            if (line[0] == '[') {
                const size_t close = line.find(']');
                if (close == std::string::npos) {
                    warning("Ignoring malformed section header in {}: {}", path, line);
                    continue;
                }
                currentSection = line.substr(1, close - 1);
            } else {
                size_t delim = line.find('=');
                if (delim == std::string::npos) {
                    warning("Ignoring malformed line in {}: {}", path, line);
                    continue;
                }
                std::string key = currentSection.empty()
                    ? line.substr(0, delim)
                    : currentSection + "." + line.substr(0, delim);
                settings[key] = line.substr(delim + 1);
            }
        }
        debug("Loaded {} settings from {}", settings.size(), path);
        return true;
    }

    // Best effort: failures are logged, never thrown
    bool Save() const {
        namespace fs = std::filesystem;
        std::error_code ec;
        const fs::path parent = fs::path(path).parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent, ec);
        }

        std::ofstream file(path, std::ios::trunc);
        if (!file.is_open()) {
            warning("Could not save config file: {}", path);
            return false;
        }

        std::string currentSection;
        for (const auto& [key, value] : settings) {
            size_t dotPos = key.find('.');
            std::string section = dotPos == std::string::npos ? "" : key.substr(0, dotPos);
            std::string name = dotPos == std::string::npos ? key : key.substr(dotPos + 1);

            if (section != currentSection) {
                file << "[" << section << "]\n";
                currentSection = section;
            }
            file << name << "=" << value << "\n";
        }
        file.flush();
        if (!file) {
            warning("Writing config file {} failed", path);
            return false;
        }
        return true;
    }

    [[nodiscard]] bool Has(const std::string& key) const {
        return settings.find(key) != settings.end();
    }

    template<typename T>
    T Get(const std::string& key, T defaultValue) const {
        auto it = settings.find(key);
        if (it == settings.end()) return defaultValue;
        try {
            return Convert<T>(it->second);
        } catch (const std::exception& e) {
            warning("Config value {}='{}' is malformed ({}), using default", key, it->second, e.what());
            return defaultValue;
        }
    }

    template<typename T>
    T Get(const std::string& key, T defaultValue, T min, T max) const {
        T value = Get(key, defaultValue);
        if (value < min || value > max) {
            warning("Config value out of range: {}={} (valid: {}-{})", key, value, min, max);
            return defaultValue;
        }
        return value;
    }

    template<typename T>
    void Set(const std::string& key, T value) {
        std::ostringstream oss;
        oss << std::setprecision(15) << value;
        settings[key] = oss.str();
    }

    void Remove(const std::string& key) {
        settings.erase(key);
    }

    [[nodiscard]] size_t Size() const { return settings.size(); }

private:
    std::string path;
    std::map<std::string, std::string> settings;

    template<typename T>
    static T Convert(const std::string& val) {
        std::istringstream iss(val);
        T result;
        if (!(iss >> result) || !(iss >> std::ws).eof()) {
            throw std::invalid_argument("cannot convert '" + val + "'");
        }
        return result;
    }
};

// Template specializations for Configs
template<>
inline std::string Configs::Convert<std::string>(const std::string& val) {
    return val;
}

template<>
inline bool Configs::Convert<bool>(const std::string& val) {
    if (val == "true" || val == "1" || val == "yes") return true;
    if (val == "false" || val == "0" || val == "no") return false;
    throw std::invalid_argument("not a boolean: '" + val + "'");
}

template<>
inline void Configs::Set<bool>(const std::string& key, bool value) {
    settings[key] = value ? "true" : "false";
}

} // namespace kclick
