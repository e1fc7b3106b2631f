#include "fwdgate/common/Config.h"
#include "fwdgate/common/Logger.h"

#include <fstream>
#include <algorithm>
#include <sstream>
#include <cctype>

namespace fwdgate {
namespace common {

std::string Config::Trim(const std::string& s) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    auto start = std::find_if(s.begin(), s.end(), notSpace);
    auto end = std::find_if(s.rbegin(), s.rend(), notSpace).base();
    return (start < end) ? std::string(start, end) : std::string();
}

void Config::Parse(std::istream& in, std::map<std::string, std::map<std::string, std::string>>* out) {
    std::string line, section = "global";
    while (std::getline(in, line)) {
        line = Trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line[0] == '[' && line.back() == ']') {
            section = Trim(line.substr(1, line.size() - 2));
            continue;
        }

        auto delimiterPos = line.find('=');
        if (delimiterPos != std::string::npos) {
            std::string key = Trim(line.substr(0, delimiterPos));
            std::string value = Trim(line.substr(delimiterPos + 1));
            if (!key.empty()) (*out)[section][key] = value;
        } else {
            LOG_WARN << "Config: ignoring line without '=' in [" << section << "]: " << line;
        }
    }
}

bool Config::Load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        LOG_ERROR << "Failed to open config file: " << filename;
        return false;
    }

    std::map<std::string, std::map<std::string, std::string>> parsed;
    Parse(file, &parsed);
    if (file.bad()) {
        LOG_ERROR << "Failed to read config file: " << filename;
        return false;
    }

    settings_ = std::move(parsed);
    loadedFilename_ = filename;
    LOG_INFO << "Loaded config file: " << filename;
    return true;
}

bool Config::LoadFromString(const std::string& iniText) {
    std::istringstream in(iniText);
    if (!in.good()) return false;

    std::map<std::string, std::map<std::string, std::string>> parsed;
    Parse(in, &parsed);
    settings_ = std::move(parsed);
    return true;
}

std::optional<std::string> Config::LoadedFilename() const {
    if (loadedFilename_.empty()) return std::nullopt;
    return loadedFilename_;
}

bool Config::Has(const std::string& section, const std::string& key) const {
    return Find(section, key).has_value();
}

std::optional<std::string> Config::Find(const std::string& section, const std::string& key) const {
    auto sit = settings_.find(section);
    if (sit == settings_.end()) return std::nullopt;
    auto kit = sit->second.find(key);
    if (kit == sit->second.end()) return std::nullopt;
    return kit->second;
}

std::string Config::GetString(const std::string& section, const std::string& key, const std::string& defaultVal) const {
    auto v = Find(section, key);
    return v ? *v : defaultVal;
}

} // namespace common
} // namespace fwdgate
