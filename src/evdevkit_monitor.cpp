// evdevkit-monitor - print, filter and mirror the events of one evdev node
#include <iostream>
#include <csignal>
#include <cstring>
#include <cstdlib>
#include <cerrno>
#include <memory>
#include <string>
#include <vector>
#include <linux/input-event-codes.h>

#include "config.hpp"
#include "device.hpp"
#include "device_node.hpp"
#include "epoll_loop.hpp"
#include "errors.hpp"
#include "event_codes.hpp"
#include "log.hpp"

using namespace evdevkit;

static volatile sig_atomic_t running = 1;

void signal_handler(int sig) {
    (void)sig;
    running = 0;
}

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [options] [/dev/input/eventX]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config PATH   Read settings from PATH instead of the default\n";
    std::cout << "  --grab          Grab the device for exclusive access\n";
    std::cout << "  --mirror        Mirror the device through a uinput clone\n";
    std::cout << "  --help, -h      Show this help message\n\n";
    std::cout << "Settings are read from $EVDEVKIT_CONFIG, then ~/.config/evdevkit/monitor.json.\n";
    std::cout << "Set EVDEVKIT_DEBUG=1 for library diagnostics.\n";
}

static void print_capabilities(const Device& device) {
    std::cout << "Input device name: \"" << device.name() << "\"\n";
    std::cout << "Input device ID: bus 0x" << std::hex << device.id().bustype
              << " vendor 0x" << device.id().vendor
              << " product 0x" << device.id().product
              << " version 0x" << device.id().version << std::dec << "\n";
    if (device.phys()) {
        std::cout << "Physical location: " << *device.phys() << "\n";
    }
    if (device.uniq()) {
        std::cout << "Unique id: " << *device.uniq() << "\n";
    }

    std::cout << "Supported events:\n";
    for (const auto& [type, codes] : device.evbits()) {
        std::cout << "  Event type " << type.value << " (" << type.name() << ")\n";
        for (const auto& code : codes) {
            std::cout << "    Event code " << code.value << " (" << code.name() << ")";
            if (type.value == EV_ABS) {
                auto abs = device.device_state().absinfo(code);
                if (abs) {
                    std::cout << " min " << abs->minimum.value_or(0)
                              << " max " << abs->maximum.value_or(0)
                              << " fuzz " << abs->fuzz.value_or(0)
                              << " flat " << abs->flat.value_or(0)
                              << " res " << abs->resolution.value_or(0)
                              << " value " << abs->value.value_or(0);
                }
            }
            std::cout << "\n";
        }
    }

    auto props = device.properties();
    if (!props.empty()) {
        std::cout << "Properties:\n";
        for (const auto& prop : props) {
            std::cout << "  Property " << prop.value << " (" << prop.name() << ")\n";
        }
    }
}

static void apply_filters(Device& device, const MonitorConfig& config) {
    for (const auto& name : config.disable) {
        auto bit = registry::bit_from_name(name);
        if (!bit) {
            std::cerr << "Unknown event type or code in disable list: " << name << "\n";
            continue;
        }
        device.disable(*bit);
        std::cout << "Filtering " << name_of(*bit) << "\n";
    }

    for (const auto& [name, overrides] : config.absinfo) {
        auto code = registry::code_from_name(name);
        if (!code || code->type != EV_ABS) {
            std::cerr << "Not an absolute axis: " << name << "\n";
            continue;
        }
        if (!device.absinfo(*code, overrides)) {
            std::cerr << "Device has no axis " << name << "\n";
            continue;
        }
        std::cout << "Applied axis override for " << name << "\n";
    }
}

int main(int argc, char* argv[]) {
    std::string config_path = ConfigManager::get_config_path();
    std::string device_arg;
    bool grab_arg = false;
    bool mirror_arg = false;

    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "--config") == 0) {
            if (i + 1 >= argc) {
                std::cerr << "--config requires a path\n";
                return 1;
            }
            config_path = argv[++i];
        } else if (strcmp(argv[i], "--grab") == 0) {
            grab_arg = true;
        } else if (strcmp(argv[i], "--mirror") == 0) {
            mirror_arg = true;
        } else if (argv[i][0] == '-') {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        } else {
            device_arg = argv[i];
        }
    }

    struct sigaction sa;
    memset(&sa, 0, sizeof(sa));
    sa.sa_handler = signal_handler;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    try {
        MonitorConfig config;
        auto config_opt = ConfigManager::load(config_path);
        if (config_opt) {
            config = *config_opt;
            std::cout << "Loaded config: " << config_path << "\n";
            if (config.version != CONFIG_VERSION) {
                std::cerr << "Warning: config version " << config.version
                          << ", expected " << CONFIG_VERSION << "\n";
            }
        }

        if (!device_arg.empty()) config.device = device_arg;
        if (grab_arg) config.grab = true;
        if (mirror_arg) config.mirror.enabled = true;

        const char* debug_env = getenv("EVDEVKIT_DEBUG");
        set_debug_logging(config.debug || (debug_env && strcmp(debug_env, "1") == 0));

        if (config.device.empty()) {
            std::cerr << "No device given. Pass /dev/input/eventX or set it in " << config_path << "\n";
            return 1;
        }

        DeviceNode node;
        node.path = config.device;
        if (!node.open_and_init(config.grab)) {
            std::cerr << "Failed to open " << config.device << ": " << strerror(errno) << "\n";
            return 1;
        }

        print_capabilities(*node.device);
        apply_filters(*node.device, config);

        std::unique_ptr<Device> mirror;
        if (config.mirror.enabled) {
            // The clone takes its identity from the source at creation time
            std::string source_name = node.device->name();
            node.device->set_name(config.mirror.name);
            mirror = node.device->create_uinput_device();
            node.device->set_name(source_name);
            std::cout << "Mirror device: " << mirror->devnode().value_or("(unknown)") << "\n";
        }

        EpollLoop loop;
        if (!loop.initialize()) {
            return 1;
        }
        loop.set_resync_on_drop(config.resync_on_drop);

        loop.set_event_callback([&mirror](DeviceNode*, const InputEvent& ev) {
            std::cout << ev << "\n";
            if (mirror && !ev.matches(EventCode{EV_SYN, SYN_DROPPED})) {
                mirror->send_events({ev});
            }
        });
        loop.set_drop_callback([&config](DeviceNode* dropped) {
            std::cout << "SYN_DROPPED on " << dropped->resolved_path
                      << (config.resync_on_drop ? ", resyncing\n" : "\n");
        });
        loop.set_disconnect_callback([](DeviceNode*) {
            running = 0;
        });

        if (!loop.add_device(&node)) {
            return 1;
        }

        std::cout << "Monitoring " << node.resolved_path
                  << (node.device->is_grabbed() ? " (grabbed)" : "") << ". Press Ctrl+C to stop.\n";

        while (running) {
            if (loop.run_once(250) < 0) {
                break;
            }
        }

        std::cout << "\nShutting down...\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
