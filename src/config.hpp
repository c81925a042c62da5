#pragma once

#include <string>
#include <string_view>
#include <optional>
#include <vector>
#include <map>

#include "input_event.hpp"

namespace evdevkit {

// Version marker for the monitor config format
constexpr int CONFIG_VERSION = 1;

struct MirrorConfig {
    bool enabled = false;
    std::string name = "evdevkit mirror";
};

struct MonitorConfig {
    int version = CONFIG_VERSION;

    std::string device;            // /dev/input/eventX
    bool grab = false;
    bool resync_on_drop = true;
    bool debug = false;

    // Type or code names to filter, e.g. "EV_MSC" or "ABS_MISC"
    std::vector<std::string> disable;

    // Per-axis overrides keyed by code name, applied in process only
    std::map<std::string, AbsInfo> absinfo;

    MirrorConfig mirror;
};

class ConfigManager {
public:
    static std::string get_config_path();
    static std::optional<MonitorConfig> load(const std::string& config_path);
    static bool save(const std::string& config_path, const MonitorConfig& config);

private:
    static std::string escape_json_string(const std::string& str);
    static std::string unescape_json_string(const std::string& str);
    static std::optional<std::string> get_json_value(const std::string& json, std::string_view key);

    static std::vector<std::string> parse_string_list(const std::string& json);
    static std::map<std::string, AbsInfo> parse_absinfo(const std::string& json);
    static std::optional<int32_t> parse_int(const std::string& json, std::string_view key);
};

} // namespace evdevkit
