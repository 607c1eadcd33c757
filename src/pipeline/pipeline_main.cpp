// src/pipeline/pipeline_main.cpp
#include "can/can_errors.hpp"
#include "can/frame_log.hpp"
#include "can/signal_dictionary.hpp"
#include "can/socketcan_iface.hpp"
#include "config/pipeline_config.hpp"
#include "pipeline/csv_sink.hpp"
#include "pipeline/pipeline.hpp"
#include "pipeline/pipeline_errors.hpp"
#include "utils/influx.hpp"
#include "utils/logging.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include <getopt.h>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitDictionary = 2;
constexpr int kExitSourceFailed = 3;

constexpr size_t kFileChunkRows = 20000;

std::atomic<bool> g_stop{false};

void on_signal(int) {
    g_stop = true;
}

struct Outputs {
    pipeline::CsvSink csv;
    std::unique_ptr<utils::InfluxClient> influx;

    void write(const pipeline::PipelineOutputs& out) {
        csv.write(out);
        if (influx) {
            influx->write(out);
        }
    }
};

// Push one chunk, isolating sources that violate ordering
void push_chunk(pipeline::Pipeline& p, Outputs& outputs,
                std::map<std::string, std::vector<can::RawFrame>>& by_source,
                std::set<std::string>& failed) {
    for (auto& kv : by_source) {
        if (kv.second.empty() || failed.count(kv.first)) {
            continue;
        }
        try {
            outputs.write(p.push(kv.first, kv.second));
        } catch (const pipeline::UnorderedInputError& e) {
            LOG_ERROR("[Pipeline] %s", e.what());
            LOG_ERROR("[Pipeline] source '%s' aborted at arbitration id 0x%03X",
                      e.source_id().c_str(), e.arbitration_id());
            failed.insert(kv.first);
            p.discard_source(kv.first);
        }
        kv.second.clear();
    }
}

void run_files(const std::vector<std::string>& files, const std::string& source_override,
               pipeline::Pipeline& p, Outputs& outputs, std::set<std::string>& failed) {
    for (const auto& path : files) {
        can::FrameLogReader reader;
        const std::string default_source =
            source_override.empty() ? can::FrameLogReader::source_from_path(path) : source_override;
        if (!reader.open(path, default_source)) {
            LOG_ERROR("[Main] cannot read frame log %s", path.c_str());
            failed.insert(default_source);
            continue;
        }
        LOG_INFO("[Main] replaying %s (default source '%s')", path.c_str(), default_source.c_str());

        std::map<std::string, std::vector<can::RawFrame>> by_source;
        size_t rows = 0;
        can::SourcedFrame sf;
        while (reader.next(sf)) {
            by_source[sf.source_id].push_back(sf.frame);
            if (++rows % kFileChunkRows == 0) {
                push_chunk(p, outputs, by_source, failed);
            }
        }
        push_chunk(p, outputs, by_source, failed);

        LOG_INFO("[Main] %s: %llu rows, %llu malformed", path.c_str(),
                 static_cast<unsigned long long>(reader.rows_read()),
                 static_cast<unsigned long long>(reader.bad_rows()));
    }
}

bool run_live(const std::string& iface, const std::string& source_id, int batch_ms,
              double duration_s, pipeline::Pipeline& p, Outputs& outputs,
              std::set<std::string>& failed) {
    can::SocketCanIface can;
    if (!can.open(iface)) {
        LOG_ERROR("[Main] cannot open CAN interface %s", iface.c_str());
        return false;
    }
    LOG_INFO("[Main] live capture on %s as source '%s' (batch %d ms)",
             iface.c_str(), source_id.c_str(), batch_ms);

    using clock = std::chrono::steady_clock;
    const auto t_start = clock::now();
    auto t_batch = t_start;

    std::map<std::string, std::vector<can::RawFrame>> by_source;
    can::RawFrame frame;

    while (!g_stop) {
        const auto now = clock::now();
        if (duration_s > 0.0 &&
            std::chrono::duration<double>(now - t_start).count() >= duration_s) {
            break;
        }

        if (can.read_timeout(frame, 20)) {
            by_source[source_id].push_back(frame);
        }

        if (std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - t_batch).count() >= batch_ms) {
            push_chunk(p, outputs, by_source, failed);
            outputs.csv.flush();
            t_batch = clock::now();
            if (failed.count(source_id)) {
                break;
            }
        }
    }
    push_chunk(p, outputs, by_source, failed);
    return true;
}

void print_usage(const char* prog_name) {
    printf("Usage: %s [options] [frames.csv ...]\n", prog_name);
    printf("\nModes:\n");
    printf("  Replay:           decode the given CSV frame logs\n");
    printf("  Live:             --can-iface NAME, batches until Ctrl-C or --duration\n");
    printf("\nOptions:\n");
    printf("  --config PATH         Pipeline YAML (default: config/pipeline.yaml)\n");
    printf("  --dictionary PATH     Signal dictionary .dbc or .csv (default: from YAML or built-in)\n");
    printf("  --out DIR             Output directory for CSV files (default: from YAML)\n");
    printf("  --source ID           Source id for all frames (default: file stem / interface)\n");
    printf("  --can-iface NAME      Read frames live from a SocketCAN interface\n");
    printf("  --batch-ms MS         Live batch length in ms (default: 1000)\n");
    printf("  --duration SEC        Stop live capture after SEC seconds (default: until Ctrl-C)\n");
    printf("  --influx              Also write to InfluxDB (settings from YAML)\n");
    printf("  --log-level LEVEL     trace|debug|info|warn|error|off\n");
    printf("  --log-file PATH       Mirror log output to a file\n");
    printf("  --help, -h            Show this help\n");
    printf("\nExamples:\n");
    printf("  # Replay a recorded drive:\n");
    printf("  %s --dictionary config/vehicle.dbc logs/VH001_run1.csv\n\n", prog_name);
    printf("  # Live from a virtual bus for 60 s:\n");
    printf("  %s --can-iface vcan0 --source VH001 --duration 60\n\n", prog_name);
}

} // namespace

int main(int argc, char** argv) {
    std::string config_path = "config/pipeline.yaml";
    std::string dictionary_override;
    std::string out_override;
    std::string source_override;
    std::string can_iface;
    std::string log_level_override;
    std::string log_file_override;
    int batch_ms = 1000;
    double duration_s = 0.0;
    bool influx_flag = false;

    static struct option long_options[] = {
        {"config",     required_argument, 0, 'c'},
        {"dictionary", required_argument, 0, 'd'},
        {"out",        required_argument, 0, 'o'},
        {"source",     required_argument, 0, 's'},
        {"can-iface",  required_argument, 0, 'i'},
        {"batch-ms",   required_argument, 0, 'b'},
        {"duration",   required_argument, 0, 'D'},
        {"influx",     no_argument,       0, 'I'},
        {"log-level",  required_argument, 0, 'l'},
        {"log-file",   required_argument, 0, 'L'},
        {"help",       no_argument,       0, 'h'},
        {0, 0, 0, 0}
    };

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, "h", long_options, &option_index)) != -1) {
        switch (opt) {
            case 'c':
                config_path = optarg;
                break;
            case 'd':
                dictionary_override = optarg;
                break;
            case 'o':
                out_override = optarg;
                break;
            case 's':
                source_override = optarg;
                break;
            case 'i':
                can_iface = optarg;
                break;
            case 'b':
                batch_ms = std::atoi(optarg);
                if (batch_ms <= 0) {
                    fprintf(stderr, "Error: Invalid batch length: %s\n", optarg);
                    return kExitUsage;
                }
                break;
            case 'D':
                duration_s = std::atof(optarg);
                if (duration_s <= 0) {
                    fprintf(stderr, "Error: Invalid duration: %s\n", optarg);
                    return kExitUsage;
                }
                break;
            case 'I':
                influx_flag = true;
                break;
            case 'l':
                log_level_override = optarg;
                break;
            case 'L':
                log_file_override = optarg;
                break;
            case 'h':
                print_usage(argv[0]);
                return kExitOk;
            default:
                print_usage(argv[0]);
                return kExitUsage;
        }
    }

    std::vector<std::string> files;
    for (int i = optind; i < argc; ++i) {
        files.push_back(argv[i]);
    }
    if (files.empty() && can_iface.empty()) {
        fprintf(stderr, "Error: no frame logs given and no --can-iface\n\n");
        print_usage(argv[0]);
        return kExitUsage;
    }

    // ========================================================================
    // Configuration: YAML, then command-line overrides
    // ========================================================================
    config::PipelineConfig cfg;
    try {
        cfg = config::PipelineConfig::load(config_path);
        if (!dictionary_override.empty()) cfg.dictionary_path = dictionary_override;
        if (!out_override.empty()) cfg.output_dir = out_override;
        if (!log_level_override.empty()) cfg.log_level = log_level_override;
        if (!log_file_override.empty()) cfg.log_file = log_file_override;
        if (influx_flag) cfg.influx.enabled = true;
        cfg.validate();
    } catch (const std::exception& e) {
        LOG_ERROR("%s", e.what());
        return kExitUsage;
    }

    utils::LogLevel level = utils::LogLevel::Info;
    if (utils::parse_level(cfg.log_level, level)) {
        utils::set_level(level);
    }
    if (!cfg.log_file.empty()) {
        if (!utils::open_log_file(cfg.log_file)) {
            LOG_WARN("[Main] continuing with stderr logging only");
        }
    }
    cfg.print_summary();

    // ========================================================================
    // Signal dictionary (fatal if missing)
    // ========================================================================
    can::SignalDictionary dict;
    try {
        dict = cfg.dictionary_path.empty() ? can::SignalDictionary::builtin_vehicle()
                                           : can::SignalDictionary::load(cfg.dictionary_path);
    } catch (const can::MissingDictionaryError& e) {
        LOG_ERROR("[Main] %s", e.what());
        return kExitDictionary;
    }
    dict.print_summary();

    // ========================================================================
    // Sinks
    // ========================================================================
    Outputs outputs;
    if (!outputs.csv.open(cfg.output_dir)) {
        return kExitUsage;
    }
    if (cfg.influx.enabled) {
        try {
            outputs.influx = std::make_unique<utils::InfluxClient>(cfg.influx);
        } catch (const std::runtime_error& e) {
            LOG_ERROR("[Main] InfluxDB disabled: %s", e.what());
        }
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    // ========================================================================
    // Run
    // ========================================================================
    pipeline::Pipeline p(dict, cfg.settings);
    std::set<std::string> failed;

    run_files(files, source_override, p, outputs, failed);

    if (!can_iface.empty()) {
        const std::string source_id = source_override.empty() ? can_iface : source_override;
        if (!run_live(can_iface, source_id, batch_ms, duration_s, p, outputs, failed)) {
            failed.insert(source_id);
        }
    }

    pipeline::PipelineOutputs final_out = p.finish();
    outputs.write(final_out);
    outputs.csv.write_stats(final_out.stats);
    outputs.csv.flush();
    if (outputs.influx) {
        outputs.influx->flush();
    }

    p.log_counters();

    if (!failed.empty()) {
        for (const auto& s : failed) {
            LOG_ERROR("[Main] source '%s' failed", s.c_str());
        }
        return kExitSourceFailed;
    }
    LOG_INFO("[Main] done, outputs in %s/", cfg.output_dir.c_str());
    return kExitOk;
}
