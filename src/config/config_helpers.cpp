#include <fstream>
#include <ragline/config/config_helpers.h>

namespace ragline::config {

std::optional<bool> parse_bool(std::string_view value) {
    std::string v(value);
    trim(v);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "true" || v == "yes" || v == "on" || v == "1") {
        return true;
    }
    if (v == "false" || v == "no" || v == "off" || v == "0") {
        return false;
    }
    return std::nullopt;
}

Result<ConfigMap> parse_config_file(const std::filesystem::path& config_path) {
    std::ifstream file(config_path);
    if (!file) {
        return Error{ErrorCode::NotFound, "Cannot open config file: " + config_path.string()};
    }

    ConfigMap config;
    std::string line;
    std::string currentSection;
    std::size_t lineNo = 0;

    while (std::getline(file, line)) {
        ++lineNo;
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end == std::string::npos) {
                return Error{ErrorCode::ParseError, config_path.string() + ":" +
                                                        std::to_string(lineNo) +
                                                        ": unterminated section header"};
            }
            currentSection = line.substr(1, end - 1);
            trim(currentSection);
            config[currentSection];
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            return Error{ErrorCode::ParseError, config_path.string() + ":" +
                                                    std::to_string(lineNo) + ": expected key = value"};
        }

        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Remove inline comments outside of quotes
        if (!v.empty() && v.front() != '"' && v.front() != '\'') {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        } else if (!v.empty()) {
            size_t close = v.find(v.front(), 1);
            if (close != std::string::npos) {
                v = v.substr(0, close + 1);
            }
        }

        if (k.empty()) {
            return Error{ErrorCode::ParseError,
                         config_path.string() + ":" + std::to_string(lineNo) + ": empty key"};
        }
        config[currentSection][k] = unquote(v);
    }

    return config;
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    auto parsed = parse_config_file(config_path);
    if (!parsed) {
        return "";
    }
    const auto& config = parsed.value();
    auto sec = config.find(section);
    if (sec == config.end()) {
        return "";
    }
    auto it = sec->second.find(key);
    return it == sec->second.end() ? "" : it->second;
}

std::filesystem::path get_config_dir() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    if (xdgConfigHome && *xdgConfigHome) {
        return std::filesystem::path(xdgConfigHome) / "ragline";
    }
    if (homeEnv && *homeEnv) {
        return std::filesystem::path(homeEnv) / ".config" / "ragline";
    }
    return std::filesystem::path("~/.config") / "ragline";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* env = std::getenv("RAGLINE_CONFIG"); env && *env) {
        return expand_tilde(env);
    }
    return get_config_dir() / "config.toml";
}

} // namespace ragline::config
