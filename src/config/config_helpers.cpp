#include <graphrag/config/config_helpers.h>

#include <charconv>
#include <cmath>
#include <fstream>
#include <stdexcept>

namespace graphrag::config {

namespace {

// Strip a trailing # comment that is not inside quotes
void strip_inline_comment(std::string& v) {
    char quote = '\0';
    for (std::size_t i = 0; i < v.size(); ++i) {
        const char c = v[i];
        if (quote != '\0') {
            if (c == quote)
                quote = '\0';
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            v.erase(i);
            break;
        }
    }
    trim(v);
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

Error invalid(std::string_view key, const std::string& raw, const char* expected) {
    return Error{ErrorCode::InvalidArgument,
                 std::string(key) + ": expected " + expected + ", got '" + raw + "'"};
}

} // namespace

Result<ConfigMap> parse_config_file(const std::filesystem::path& config_path) {
    std::ifstream file(config_path);
    if (!file) {
        return Error{ErrorCode::NotFound, "Cannot open config file: " + config_path.string()};
    }

    ConfigMap values;
    std::string line;
    std::string currentSection;

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Check for section headers [section]
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
        strip_inline_comment(v);
        if (k.empty()) {
            continue;
        }

        // Dotted keys are already qualified
        const std::string fullKey =
            (currentSection.empty() || k.find('.') != std::string::npos) ? k
                                                                         : currentSection + "." + k;
        values[fullKey] = unquote(v);
    }
    return values;
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    auto parsed = parse_config_file(config_path);
    if (!parsed) {
        return "";
    }
    const auto fullKey = section.empty() ? key : section + "." + key;
    auto it = parsed.value().find(fullKey);
    return it == parsed.value().end() ? std::string{} : it->second;
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* env = std::getenv("GRAPHRAG_CONFIG"); env && *env) {
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
        return std::filesystem::path("~/.config") / "graphrag" / "config.toml";
    }

    return configHome / "graphrag" / "config.toml";
}

Result<double> parse_double(std::string_view key, const std::string& raw) {
    std::string v = raw;
    trim(v);
    if (v.empty()) {
        return invalid(key, raw, "a number");
    }
    try {
        std::size_t used = 0;
        double d = std::stod(v, &used);
        if (used != v.size() || !std::isfinite(d)) {
            return invalid(key, raw, "a finite number");
        }
        return d;
    } catch (const std::exception&) {
        return invalid(key, raw, "a number");
    }
}

Result<std::size_t> parse_size(std::string_view key, const std::string& raw) {
    std::string v = raw;
    trim(v);
    std::size_t out = 0;
    auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), out);
    if (v.empty() || ec != std::errc{} || ptr != v.data() + v.size()) {
        return invalid(key, raw, "a non-negative integer");
    }
    return out;
}

Result<bool> parse_bool(std::string_view key, const std::string& raw) {
    std::string v = raw;
    trim(v);
    v = lower(v);
    if (v == "true" || v == "1" || v == "yes" || v == "on")
        return true;
    if (v == "false" || v == "0" || v == "no" || v == "off")
        return false;
    return invalid(key, raw, "a boolean");
}

} // namespace graphrag::config
