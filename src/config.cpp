// config.cpp - evdevkit-monitor settings
#include "config.hpp"
#include <fstream>
#include <sstream>
#include <cstdio>
#include <cstdlib>
#include <cerrno>
#include <sys/stat.h>
#include <iostream>

namespace evdevkit {

namespace {

// mkdir -p without the shell
bool make_dirs(const std::string& dir) {
    if (dir.empty()) {
        return true;
    }

    struct stat st;
    if (stat(dir.c_str(), &st) == 0) {
        return S_ISDIR(st.st_mode);
    }

    size_t parent_end = dir.find_last_of('/');
    if (parent_end != std::string::npos && parent_end > 0) {
        if (!make_dirs(dir.substr(0, parent_end))) {
            return false;
        }
    }
    return mkdir(dir.c_str(), 0755) == 0 || errno == EEXIST;
}

// Returns the body of the object starting at obj_start and moves pos past it
std::optional<std::string> take_object(const std::string& str, size_t obj_start, size_t& pos) {
    int brace_count = 1;
    size_t obj_end = obj_start + 1;
    while (obj_end < str.length() && brace_count > 0) {
        if (str[obj_end] == '{') brace_count++;
        else if (str[obj_end] == '}') brace_count--;
        obj_end++;
    }
    pos = obj_end;

    if (brace_count != 0) {
        return std::nullopt;
    }
    return str.substr(obj_start, obj_end - obj_start);
}

void write_optional(std::ostream& out, const char* key, const std::optional<int32_t>& value, bool& first) {
    if (!value) return;
    if (!first) out << ", ";
    first = false;
    out << "\"" << key << "\": " << *value;
}

} // namespace

// Get config path from environment or use default
std::string ConfigManager::get_config_path() {
    const char* env_path = getenv("EVDEVKIT_CONFIG");
    if (env_path) {
        return std::string(env_path);
    }

    const char* home = getenv("HOME");
    if (!home) {
        return "/etc/evdevkit/monitor.json";
    }

    return std::string(home) + "/.config/evdevkit/monitor.json";
}

std::optional<MonitorConfig> ConfigManager::load(const std::string& config_path) {
    std::ifstream file(config_path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::string json;
    std::string line;
    while (std::getline(file, line)) {
        json += line + "\n";
    }

    MonitorConfig config;

    auto version_opt = get_json_value(json, "version");
    if (version_opt) {
        try {
            config.version = std::stoi(*version_opt);
        } catch (const std::exception&) {
            std::cerr << "Invalid config version: " << *version_opt << "\n";
            return std::nullopt;
        }
    }

    auto settings_opt = get_json_value(json, "settings");
    if (settings_opt) {
        auto device_opt = get_json_value(*settings_opt, "device");
        if (device_opt) config.device = unescape_json_string(*device_opt);

        auto grab_opt = get_json_value(*settings_opt, "grab");
        if (grab_opt) config.grab = (*grab_opt == "true");

        auto resync_opt = get_json_value(*settings_opt, "resync_on_drop");
        if (resync_opt) config.resync_on_drop = (*resync_opt == "true");

        auto debug_opt = get_json_value(*settings_opt, "debug");
        if (debug_opt) config.debug = (*debug_opt == "true");
    }

    auto disable_opt = get_json_value(json, "disable");
    if (disable_opt) {
        config.disable = parse_string_list(*disable_opt);
    }

    auto absinfo_opt = get_json_value(json, "absinfo");
    if (absinfo_opt) {
        config.absinfo = parse_absinfo(*absinfo_opt);
    }

    auto mirror_opt = get_json_value(json, "mirror");
    if (mirror_opt) {
        auto enabled_opt = get_json_value(*mirror_opt, "enabled");
        if (enabled_opt) config.mirror.enabled = (*enabled_opt == "true");

        auto name_opt = get_json_value(*mirror_opt, "name");
        if (name_opt) config.mirror.name = unescape_json_string(*name_opt);
    }

    return config;
}

bool ConfigManager::save(const std::string& config_path, const MonitorConfig& config) {
    // Create directory if needed
    size_t last_slash = config_path.find_last_of('/');
    if (last_slash != std::string::npos) {
        if (!make_dirs(config_path.substr(0, last_slash))) {
            return false;
        }
    }

    std::ofstream file(config_path);
    if (!file.is_open()) {
        return false;
    }

    file << "{\n";
    file << "  \"version\": " << config.version << ",\n";

    file << "  \"settings\": {\n";
    file << "    \"device\": \"" << escape_json_string(config.device) << "\",\n";
    file << "    \"grab\": " << (config.grab ? "true" : "false") << ",\n";
    file << "    \"resync_on_drop\": " << (config.resync_on_drop ? "true" : "false") << ",\n";
    file << "    \"debug\": " << (config.debug ? "true" : "false") << "\n";
    file << "  },\n";

    file << "  \"disable\": [";
    for (size_t i = 0; i < config.disable.size(); i++) {
        file << (i == 0 ? "" : ", ") << "\"" << escape_json_string(config.disable[i]) << "\"";
    }
    file << "],\n";

    file << "  \"absinfo\": {\n";
    bool first_axis = true;
    for (const auto& [code_name, abs] : config.absinfo) {
        if (!first_axis) file << ",\n";
        first_axis = false;

        file << "    \"" << escape_json_string(code_name) << "\": {";
        bool first_field = true;
        write_optional(file, "minimum", abs.minimum, first_field);
        write_optional(file, "maximum", abs.maximum, first_field);
        write_optional(file, "fuzz", abs.fuzz, first_field);
        write_optional(file, "flat", abs.flat, first_field);
        write_optional(file, "resolution", abs.resolution, first_field);
        write_optional(file, "value", abs.value, first_field);
        file << "}";
    }
    file << "\n  },\n";

    file << "  \"mirror\": {\n";
    file << "    \"enabled\": " << (config.mirror.enabled ? "true" : "false") << ",\n";
    file << "    \"name\": \"" << escape_json_string(config.mirror.name) << "\"\n";
    file << "  }\n";

    file << "}\n";

    return file.good();
}

std::vector<std::string> ConfigManager::parse_string_list(const std::string& json) {
    std::vector<std::string> result;
    if (json.empty() || json.front() != '[' || json.back() != ']') {
        return result;
    }

    size_t pos = 1;
    while (pos < json.length()) {
        size_t str_start = json.find('"', pos);
        if (str_start == std::string::npos) break;

        size_t str_end = str_start + 1;
        while (str_end < json.length() && !(json[str_end] == '"' && json[str_end - 1] != '\\')) {
            str_end++;
        }
        if (str_end >= json.length()) break;

        result.push_back(unescape_json_string(json.substr(str_start + 1, str_end - str_start - 1)));
        pos = str_end + 1;
    }

    return result;
}

std::optional<int32_t> ConfigManager::parse_int(const std::string& json, std::string_view key) {
    auto value_opt = get_json_value(json, key);
    if (!value_opt) {
        return std::nullopt;
    }

    try {
        size_t consumed = 0;
        int value = std::stoi(*value_opt, &consumed);
        if (consumed != value_opt->size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        std::cerr << "Ignoring invalid value for " << key << ": " << *value_opt << "\n";
        return std::nullopt;
    }
}

std::map<std::string, AbsInfo> ConfigManager::parse_absinfo(const std::string& json) {
    std::map<std::string, AbsInfo> axes;
    if (json.empty() || json.front() != '{' || json.back() != '}') {
        return axes;
    }

    std::string body = json.substr(1, json.length() - 2);

    size_t pos = 0;
    while (pos < body.length()) {
        size_t key_start = body.find('"', pos);
        if (key_start == std::string::npos) break;

        size_t key_end = body.find('"', key_start + 1);
        if (key_end == std::string::npos) break;

        std::string code_name = unescape_json_string(body.substr(key_start + 1, key_end - key_start - 1));

        size_t obj_start = body.find('{', key_end);
        if (obj_start == std::string::npos) break;

        auto obj = take_object(body, obj_start, pos);
        if (!obj) break;

        AbsInfo abs;
        abs.minimum = parse_int(*obj, "minimum");
        abs.maximum = parse_int(*obj, "maximum");
        abs.fuzz = parse_int(*obj, "fuzz");
        abs.flat = parse_int(*obj, "flat");
        abs.resolution = parse_int(*obj, "resolution");
        abs.value = parse_int(*obj, "value");
        axes[code_name] = abs;
    }

    return axes;
}

std::string ConfigManager::escape_json_string(const std::string& str) {
    std::string result;
    result.reserve(str.size() + 10);

    for (char c : str) {
        switch (c) {
            case '"': result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\t': result += "\\t"; break;
            case '\r': result += "\\r"; break;
            default: result += c; break;
        }
    }

    return result;
}

std::string ConfigManager::unescape_json_string(const std::string& str) {
    std::string result;
    result.reserve(str.size());

    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '\\' && i + 1 < str.size()) {
            switch (str[i + 1]) {
                case '"': result += '"'; ++i; break;
                case '\\': result += '\\'; ++i; break;
                case 'n': result += '\n'; ++i; break;
                case 't': result += '\t'; ++i; break;
                case 'r': result += '\r'; ++i; break;
                case '/': result += '/'; ++i; break;
                default: result += str[i]; break;
            }
        } else {
            result += str[i];
        }
    }

    return result;
}

// Finds the first "key": value pair and returns the raw value. Objects and
// arrays are returned whole, strings without their quotes.
std::optional<std::string> ConfigManager::get_json_value(const std::string& json, std::string_view key) {
    std::string search_key = "\"";
    search_key += key;
    search_key += "\"";

    size_t key_pos = json.find(search_key);
    if (key_pos == std::string::npos) {
        return std::nullopt;
    }

    size_t colon_pos = json.find(':', key_pos + search_key.size());
    if (colon_pos == std::string::npos) {
        return std::nullopt;
    }

    size_t value_start = json.find_first_not_of(" \t\r\n", colon_pos + 1);
    if (value_start == std::string::npos) {
        return std::nullopt;
    }

    const char first = json[value_start];
    if (first == '[' || first == '{') {
        const char close = (first == '[') ? ']' : '}';
        int depth = 0;
        bool in_string = false;
        bool escape = false;

        for (size_t i = value_start; i < json.size(); ++i) {
            const char c = json[i];

            if (in_string) {
                if (escape) { escape = false; continue; }
                if (c == '\\') { escape = true; continue; }
                if (c == '"') in_string = false;
                continue;
            }

            if (c == '"') { in_string = true; continue; }
            if (c == first) { depth++; continue; }
            if (c == close && --depth == 0) {
                return json.substr(value_start, (i - value_start) + 1);
            }
        }
        return std::nullopt;
    }

    if (first == '"') {
        size_t end = value_start + 1;
        while (end < json.size() && !(json[end] == '"' && json[end - 1] != '\\')) {
            end++;
        }
        if (end >= json.size()) {
            return std::nullopt;
        }
        return json.substr(value_start + 1, end - (value_start + 1));
    }

    size_t value_end = json.find_first_of(",}]\n", value_start);
    if (value_end == std::string::npos) {
        value_end = json.size();
    }

    std::string value = json.substr(value_start, value_end - value_start);
    value.erase(value.find_last_not_of(" \t\r\n") + 1);
    return value;
}

} // namespace evdevkit
