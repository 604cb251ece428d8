#include <qbroker/config/config_helpers.h>

#include <charconv>
#include <fstream>

namespace qbroker::config {

std::optional<std::chrono::milliseconds> parse_ms(std::string_view s) {
    auto count = parse_count(s);
    if (!count ||
        *count > static_cast<std::size_t>(std::chrono::milliseconds::max().count())) {
        return std::nullopt;
    }
    return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(*count));
}

std::optional<std::size_t> parse_count(std::string_view s) {
    std::string tmp{s};
    trim(tmp);
    if (tmp.empty()) {
        return std::nullopt;
    }
    std::size_t value = 0;
    const char* first = tmp.data();
    const char* last = tmp.data() + tmp.size();
    auto res = std::from_chars(first, last, value);
    if (res.ec != std::errc() || res.ptr != last) {
        return std::nullopt;
    }
    return value;
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::ifstream file(config_path);
    if (!file) {
        return "";
    }

    std::string line;
    std::string currentSection;
    bool in_target_section = section.empty();

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
                in_target_section = (section.empty() || currentSection == section);
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

        // Inline comments only outside quotes
        if (!v.empty() && v.front() != '"' && v.front() != '\'' && v.front() != '[') {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        }

        // Accept both "[broker] key" and a dotted "broker.key" anywhere
        if ((in_target_section && k == key) || (!section.empty() && k == section + "." + key)) {
            if (!v.empty() && v.front() == '[') {
                return v;
            }
            return unquote(v);
        }
    }

    return "";
}

std::vector<std::string> parse_string_list(const std::string& raw) {
    std::string body = raw;
    trim(body);
    if (body.size() >= 2 && body.front() == '[' && body.back() == ']') {
        body = body.substr(1, body.size() - 2);
    }

    std::vector<std::string> out;
    size_t start = 0;
    while (start <= body.size()) {
        size_t comma = body.find(',', start);
        std::string item = body.substr(start, comma == std::string::npos ? std::string::npos
                                                                         : comma - start);
        item = unquote(item);
        if (!item.empty()) {
            out.push_back(std::move(item));
        }
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }
    return out;
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }

    if (const char* env = std::getenv("QBROKER_CONFIG"); env && *env) {
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
        return std::filesystem::path("~/.config") / "qbroker" / "config.toml";
    }

    return configHome / "qbroker" / "config.toml";
}

} // namespace qbroker::config
