#pragma once

#include <string>
#include <map>
#include <optional>
#include <iosfwd>

namespace fwdgate {
namespace common {

// INI settings read once at startup. Keys before the first [section] belong to "global".
class Config {
public:
    Config() = default;

    bool Load(const std::string& filename);
    // Parse INI text into in-memory settings (does not change loaded filename).
    bool LoadFromString(const std::string& iniText);

    // Returns the last loaded config filename if available.
    std::optional<std::string> LoadedFilename() const;

    bool Has(const std::string& section, const std::string& key) const;
    std::optional<std::string> Find(const std::string& section, const std::string& key) const;

    // Get value as string, return default if not found
    std::string GetString(const std::string& section, const std::string& key, const std::string& defaultVal = "") const;

    const std::map<std::string, std::map<std::string, std::string>>& GetAll() const { return settings_; }

private:
    static std::string Trim(const std::string& s);
    static void Parse(std::istream& in, std::map<std::string, std::map<std::string, std::string>>* out);

    // map<section, map<key, value>>
    std::map<std::string, std::map<std::string, std::string>> settings_;
    std::string loadedFilename_;
};

} // namespace common
} // namespace fwdgate
