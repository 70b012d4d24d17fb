#include <scenelink/config/config_helpers.h>

#include <fstream>

namespace scenelink::config {

bool env_truthy(const char* value) {
    if (!value || !*value) {
        return false;
    }
    std::string v(value);
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return std::tolower(c); });
    return !(v == "0" || v == "false" || v == "off" || v == "no");
}

std::vector<std::string> parse_list(const std::string& raw) {
    std::vector<std::string> out;
    std::string s = raw;
    trim(s);
    if (s.size() >= 2 && s.front() == '[' && s.back() == ']') {
        s = s.substr(1, s.size() - 2);
    }
    std::size_t start = 0;
    while (start <= s.size()) {
        auto comma = s.find(',', start);
        auto item = unquote(s.substr(start, comma == std::string::npos ? std::string::npos
                                                                       : comma - start));
        if (!item.empty()) {
            out.push_back(std::move(item));
        }
        if (comma == std::string::npos)
            break;
        start = comma + 1;
    }
    return out;
}

std::map<std::string, std::string> parse_simple_toml_flat(const std::filesystem::path& path) {
    std::map<std::string, std::string> config;
    std::ifstream file(path);
    if (!file)
        return config;

    std::string line;
    std::string currentSection;
    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        if (line.front() == '[') {
            auto end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
            }
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos)
            continue;
        std::string key = unquote(line.substr(0, eq));
        std::string value = line.substr(eq + 1);
        trim(value);

        // Remove inline comments outside of quotes
        if (!value.empty() && (value.front() == '"' || value.front() == '\'')) {
            auto close = value.find(value.front(), 1);
            if (close != std::string::npos) {
                value = value.substr(0, close + 1);
            }
        } else {
            auto comment = value.find('#');
            if (comment != std::string::npos) {
                value = value.substr(0, comment);
            }
        }
        value = unquote(value);

        if (!currentSection.empty()) {
            config[currentSection + "." + key] = value;
        } else {
            config[key] = value;
        }
    }
    return config;
}

std::filesystem::path resolve_default_config_path() {
    if (const char* explicitPath = std::getenv("SCENELINK_CONFIG_PATH")) {
        std::filesystem::path p{explicitPath};
        if (std::filesystem::exists(p))
            return p;
    }
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME")) {
        std::filesystem::path p = std::filesystem::path(xdg) / "scenelink" / "config.toml";
        if (std::filesystem::exists(p))
            return p;
    }
    if (const char* home = std::getenv("HOME")) {
        std::filesystem::path p =
            std::filesystem::path(home) / ".config" / "scenelink" / "config.toml";
        if (std::filesystem::exists(p))
            return p;
    }
    return {};
}

} // namespace scenelink::config
