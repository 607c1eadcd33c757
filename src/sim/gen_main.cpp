// src/sim/gen_main.cpp
#include "sim/drive_generator.hpp"
#include "can/can_errors.hpp"
#include "can/frame_log.hpp"
#include "can/signal_dictionary.hpp"
#include "can/socketcan_iface.hpp"
#include "utils/logging.hpp"

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <getopt.h>

namespace {

sim::DriveGenerator* g_generator = nullptr;

void on_signal(int) {
    if (g_generator) {
        g_generator->stop();
    }
}

void print_usage(const char* prog_name) {
    printf("Usage: %s [options]\n", prog_name);
    printf("\nGenerates a CAN frame log from a drive scenario.\n");
    printf("\nOptions:\n");
    printf("  --dictionary PATH     Signal dictionary .dbc or .csv (default: built-in)\n");
    printf("  --lua PATH            Lua scenario (default: built-in drive profile)\n");
    printf("  --out PATH            Frame log CSV (default: frames.csv)\n");
    printf("  --source ID           Write a source_id column with this value\n");
    printf("  --duration SEC        Scenario length in seconds (default: 600)\n");
    printf("  --start-ts SEC        Epoch timestamp of the first frame (default: now)\n");
    printf("  --channel NAME        Channel written to the log (default: can0)\n");
    printf("  --seed N              Random seed for the built-in profile (default: 42)\n");
    printf("  --can-iface NAME      Also transmit frames on a SocketCAN interface\n");
    printf("  --real-time           Pace output to wall-clock time\n");
    printf("  --log-level LEVEL     trace|debug|info|warn|error|off\n");
    printf("  --help, -h            Show this help\n");
    printf("\nExamples:\n");
    printf("  # Ten minute drive for vehicle VH001:\n");
    printf("  %s --source VH001 --out logs/VH001.csv\n\n", prog_name);
    printf("  # Scripted scenario on a virtual bus, in real time:\n");
    printf("  %s --lua config/lua/scenario.lua --can-iface vcan0 --real-time\n\n", prog_name);
}

} // namespace

int main(int argc, char** argv) {
    sim::DriveGenConfig cfg;
    std::string dictionary_path;
    std::string out_path = "frames.csv";
    std::string source_id;
    std::string can_iface;

    static struct option long_options[] = {
        {"dictionary", required_argument, 0, 'd'},
        {"lua",        required_argument, 0, 'l'},
        {"out",        required_argument, 0, 'o'},
        {"source",     required_argument, 0, 's'},
        {"duration",   required_argument, 0, 'D'},
        {"start-ts",   required_argument, 0, 'S'},
        {"channel",    required_argument, 0, 'c'},
        {"seed",       required_argument, 0, 'r'},
        {"can-iface",  required_argument, 0, 'i'},
        {"real-time",  no_argument,       0, 'R'},
        {"log-level",  required_argument, 0, 'L'},
        {"help",       no_argument,       0, 'h'},
        {0, 0, 0, 0}
    };

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, "h", long_options, &option_index)) != -1) {
        switch (opt) {
            case 'd':
                dictionary_path = optarg;
                break;
            case 'l':
                cfg.lua_script_path = optarg;
                break;
            case 'o':
                out_path = optarg;
                break;
            case 's':
                source_id = optarg;
                break;
            case 'D':
                cfg.duration_s = std::atof(optarg);
                if (cfg.duration_s <= 0) {
                    fprintf(stderr, "Error: Invalid duration: %s\n", optarg);
                    return 1;
                }
                break;
            case 'S':
                cfg.start_ts = std::atof(optarg);
                break;
            case 'c':
                cfg.channel = optarg;
                break;
            case 'r':
                cfg.seed = static_cast<uint32_t>(std::strtoul(optarg, nullptr, 10));
                break;
            case 'i':
                can_iface = optarg;
                break;
            case 'R':
                cfg.real_time = true;
                break;
            case 'L': {
                utils::LogLevel lvl;
                if (!utils::parse_level(optarg, lvl)) {
                    fprintf(stderr, "Error: Invalid log level: %s\n", optarg);
                    return 1;
                }
                utils::set_level(lvl);
                break;
            }
            case 'h':
                print_usage(argv[0]);
                return 0;
            default:
                print_usage(argv[0]);
                return 1;
        }
    }

    can::SignalDictionary dict;
    try {
        dict = dictionary_path.empty() ? can::SignalDictionary::builtin_vehicle()
                                       : can::SignalDictionary::load(dictionary_path);
    } catch (const can::MissingDictionaryError& e) {
        LOG_ERROR("[Main] %s", e.what());
        return 2;
    }

    can::FrameLogWriter writer;
    if (!writer.open(out_path, !source_id.empty())) {
        LOG_ERROR("[Main] cannot write %s", out_path.c_str());
        return 1;
    }

    can::SocketCanIface can;
    if (!can_iface.empty() && !can.open(can_iface)) {
        LOG_ERROR("[Main] cannot open CAN interface %s", can_iface.c_str());
        return 1;
    }

    sim::DriveGenerator gen(dict, cfg);
    g_generator = &gen;
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    uint64_t tx_errors = 0;
    const auto stats = gen.run([&](const can::RawFrame& f) {
        writer.write(f, source_id);
        if (can.is_open() && !can.write_frame(f)) {
            tx_errors++;
        }
    });
    writer.flush();
    g_generator = nullptr;

    if (tx_errors > 0) {
        LOG_WARN("[Main] %llu frames failed to transmit on %s",
                 static_cast<unsigned long long>(tx_errors), can_iface.c_str());
    }
    if (stats.lua_errors > 0) {
        LOG_WARN("[Main] %llu Lua scenario errors", static_cast<unsigned long long>(stats.lua_errors));
    }
    LOG_INFO("[Main] wrote %llu frames to %s",
             static_cast<unsigned long long>(stats.frames), out_path.c_str());
    return 0;
}
