#include <vellum/config/config_helpers.h>

#include <fstream>
#include <sstream>

namespace vellum::config {

namespace {

void parse_lines(std::istream& in, ConfigMap& out) {
    std::string line;
    std::string currentSection;

    while (std::getline(in, line)) {
        trim(line);

        if (line.empty() || line[0] == '#') {
            continue;
        }

        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Inline comments only outside quoted values
        if (!v.empty() && v.front() != '"' && v.front() != '\'') {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        } else if (!v.empty()) {
            char quote = v.front();
            size_t close = v.find(quote, 1);
            if (close != std::string::npos) {
                v = v.substr(0, close + 1);
            }
        }

        // "section.key = v" at top level is accepted as well as [section] key = v
        std::string fullKey = currentSection.empty() ? k : currentSection + "." + k;
        out[fullKey] = unquote(v);
    }
}

} // namespace

Result<ConfigMap> parse_config_file(const std::filesystem::path& config_path) {
    std::ifstream file(config_path);
    if (!file) {
        return Error{ErrorCode::NotFound, "Cannot open config file: " + config_path.string()};
    }
    ConfigMap values;
    parse_lines(file, values);
    return values;
}

ConfigMap parse_config_text(const std::string& text) {
    std::istringstream in(text);
    ConfigMap values;
    parse_lines(in, values);
    return values;
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* env = std::getenv("VELLUM_CONFIG"); env && *env) {
        return expand_tilde(env);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("vellum.toml");
    }

    return configHome / "vellum" / "config.toml";
}

std::filesystem::path get_data_dir() {
    if (const char* xdg_data = std::getenv("XDG_DATA_HOME"); xdg_data && *xdg_data) {
        return std::filesystem::path(xdg_data) / "vellum";
    }
    if (const char* home = std::getenv("HOME")) {
        return std::filesystem::path(home) / ".local" / "share" / "vellum";
    }
    return std::filesystem::current_path() / "vellum_data";
}

} // namespace vellum::config
