// src/can/signal_dictionary.cpp
#include "can/signal_dictionary.hpp"
#include "can/can_errors.hpp"
#include "utils/csv.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace can {

namespace {

constexpr uint32_t kDbcExtendedFlag = 0x80000000u;
constexpr uint32_t kDbcIdMask = 0x1FFFFFFFu;

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

bool starts_with(const std::string& s, const char* pfx) {
    return s.rfind(pfx, 0) == 0;
}

bool ends_with(const std::string& s, const std::string& sfx) {
    return s.size() >= sfx.size() &&
           s.compare(s.size() - sfx.size(), sfx.size(), sfx) == 0;
}

uint32_t dbc_id(const std::string& s) {
    uint32_t id = static_cast<uint32_t>(std::stoul(s, nullptr, 0));
    if (id & kDbcExtendedFlag) id &= kDbcIdMask;
    return id;
}

// Raw DBC signal before it is mapped onto whole bytes
struct DbcSignal {
    std::string name;
    int start_bit = 0;
    int bit_length = 0;
    bool motorola = false;    // @0
    bool is_signed = false;   // '-'
    double scale = 1.0;
    double offset = 0.0;
    std::string unit;
};

// " 7|16@0+ (0.01,0) [0|655.35] "km/h" Vector__XXX"
bool parse_sg_right(const std::string& right, DbcSignal& sig) {
    const auto pipe = right.find('|');
    const auto at = right.find('@', pipe);
    if (pipe == std::string::npos || at == std::string::npos || at + 2 >= right.size())
        return false;

    sig.start_bit = std::stoi(right.substr(0, pipe));
    sig.bit_length = std::stoi(right.substr(pipe + 1, at - pipe - 1));
    sig.motorola = (right[at + 1] == '0');
    sig.is_signed = (right[at + 2] == '-');

    const auto lp = right.find('(', at);
    const auto comma = right.find(',', lp);
    const auto rp = right.find(')', comma);
    if (lp == std::string::npos || comma == std::string::npos || rp == std::string::npos)
        return false;
    sig.scale = std::stod(right.substr(lp + 1, comma - lp - 1));
    sig.offset = std::stod(right.substr(comma + 1, rp - comma - 1));

    const auto q1 = right.find('"', rp);
    if (q1 != std::string::npos) {
        const auto q2 = right.find('"', q1 + 1);
        if (q2 != std::string::npos) sig.unit = right.substr(q1 + 1, q2 - q1 - 1);
    }
    return true;
}

// Map a DBC bit layout onto the byte-level model. Only whole-byte fields and
// single-bit flags are representable.
SignalSpec to_byte_signal(const DbcSignal& d, const std::string& origin, const std::string& msg) {
    const std::string where = "signal " + msg + "." + d.name;

    if (d.is_signed)
        throw MissingDictionaryError(origin, where + ": signed signals are not supported");
    if (d.bit_length <= 0 || d.start_bit < 0)
        throw MissingDictionaryError(origin, where + ": invalid bit layout");

    SignalSpec s;
    s.field_name = d.name;
    s.scale = d.scale;
    s.offset = d.offset;
    s.unit = d.unit;

    if (d.bit_length == 1) {
        s.kind = SignalKind::Boolean;
        s.byte_offset = static_cast<size_t>(d.start_bit / 8);
        s.byte_width = 1;
        return s;
    }

    if (d.bit_length % 8 != 0)
        throw MissingDictionaryError(origin, where + ": bit length is not a whole number of bytes");

    s.byte_offset = static_cast<size_t>(d.start_bit / 8);
    s.byte_width = static_cast<size_t>(d.bit_length / 8);
    if (d.motorola) {
        // Motorola start bit is the MSB of the field: bit 7 of its first byte
        if (d.start_bit % 8 != 7)
            throw MissingDictionaryError(origin, where + ": Motorola signal not byte aligned");
        s.byte_order = utils::ByteOrder::Big;
    } else {
        if (d.start_bit % 8 != 0)
            throw MissingDictionaryError(origin, where + ": Intel signal not byte aligned");
        s.byte_order = utils::ByteOrder::Little;
    }
    return s;
}

bool is_period_attribute(const std::string& name) {
    return name == "TxPeriod" || name == "GenMsgCycleTime" || name == "CycleTime";
}

} // namespace

// ============================================================================
// MessageSpec
// ============================================================================

const SignalSpec* MessageSpec::find_signal(const std::string& field_name) const {
    for (const auto& s : signals) {
        if (s.field_name == field_name) return &s;
    }
    return nullptr;
}

// ============================================================================
// Loading
// ============================================================================

SignalDictionary SignalDictionary::load(const std::string& path) {
    std::ifstream check(path);
    if (!check.good()) {
        throw MissingDictionaryError(path, "file not found");
    }
    check.close();

    std::string lower = utils::CsvReader::to_lower(path);
    SignalDictionary dict = ends_with(lower, ".dbc") ? load_dbc(path) : load_csv(path);

    LOG_INFO("[SignalDictionary] Loaded %zu message(s) from %s", dict.size(), path.c_str());
    return dict;
}

SignalDictionary SignalDictionary::load_dbc(const std::string& path) {
    std::ifstream is(path);
    if (!is) {
        throw MissingDictionaryError(path, "cannot open file");
    }
    return load_dbc(is, path);
}

SignalDictionary SignalDictionary::load_dbc(std::istream& is, const std::string& origin) {
    std::vector<MessageSpec> order;           // keeps BO_ order for error context
    std::unordered_map<uint32_t, double> periods;
    double default_period = 0.0;
    MessageSpec* current = nullptr;

    std::string line;
    size_t line_no = 0;
    try {
        while (std::getline(is, line)) {
            ++line_no;
            line = trim(line);
            if (line.empty()) continue;

            // BO_ <id> <name>: <dlc> <tx>
            if (starts_with(line, "BO_ ")) {
                std::istringstream ls(line);
                std::string tag, id_str, name_colon, dlc_str;
                ls >> tag >> id_str >> name_colon >> dlc_str;
                if (id_str.empty() || name_colon.empty()) {
                    current = nullptr;
                    continue;
                }
                if (name_colon.back() == ':') name_colon.pop_back();

                MessageSpec msg;
                msg.arbitration_id = dbc_id(id_str);
                msg.name = name_colon;
                msg.dlc = dlc_str.empty() ? 8 : std::stoi(dlc_str);
                order.push_back(msg);
                current = &order.back();
                continue;
            }

            // SG_ <name> [mux] : <layout> (<scale>,<offset>) [min|max] "unit" rx
            if (starts_with(line, "SG_ ")) {
                if (!current) continue;
                const auto colon = line.find(':');
                if (colon == std::string::npos) continue;

                std::istringstream ll(line.substr(0, colon));
                std::string tag;
                DbcSignal d;
                ll >> tag >> d.name;
                if (!parse_sg_right(trim(line.substr(colon + 1)), d)) {
                    throw MissingDictionaryError(origin,
                        "line " + std::to_string(line_no) + ": malformed SG_ definition");
                }
                current->signals.push_back(to_byte_signal(d, origin, current->name));
                continue;
            }

            // BA_DEF_DEF_ "TxPeriod" 100;
            if (starts_with(line, "BA_DEF_DEF_ ")) {
                std::istringstream ls(line);
                std::string tag, attr, value;
                ls >> tag >> attr >> value;
                attr.erase(std::remove(attr.begin(), attr.end(), '"'), attr.end());
                if (is_period_attribute(attr) && !value.empty()) {
                    if (value.back() == ';') value.pop_back();
                    default_period = std::stod(value);
                }
                continue;
            }

            // BA_ "TxPeriod" BO_ 256 20;
            if (starts_with(line, "BA_ ")) {
                std::istringstream ls(line);
                std::string tag, attr, scope, id_str, value;
                ls >> tag >> attr >> scope >> id_str >> value;
                attr.erase(std::remove(attr.begin(), attr.end(), '"'), attr.end());
                if (scope == "BO_" && is_period_attribute(attr) && !value.empty()) {
                    if (value.back() == ';') value.pop_back();
                    periods[dbc_id(id_str)] = std::stod(value);
                }
                continue;
            }

            // Anything else (VERSION, NS_, BU_, CM_, VAL_, ...) ends the current BO_ block
            current = nullptr;
        }
    } catch (const MissingDictionaryError&) {
        throw;
    } catch (const std::exception& e) {
        throw MissingDictionaryError(origin,
            "line " + std::to_string(line_no) + ": " + e.what());
    }

    SignalDictionary dict;
    for (auto& msg : order) {
        auto it = periods.find(msg.arbitration_id);
        if (it != periods.end()) {
            msg.expected_period_ms = it->second;
        } else {
            msg.expected_period_ms = default_period;
        }
        try {
            dict.add(std::move(msg));
        } catch (const std::invalid_argument& e) {
            throw MissingDictionaryError(origin, e.what());
        }
    }

    if (dict.empty()) {
        throw MissingDictionaryError(origin, "no BO_ message definitions");
    }
    return dict;
}

SignalDictionary SignalDictionary::load_csv(const std::string& path) {
    utils::CsvReader csv;
    if (!csv.open(path)) {
        throw MissingDictionaryError(path, "cannot open file or missing header");
    }
    for (const char* required : {"frame_id", "frame_name", "signal_name", "byte_offset", "byte_width"}) {
        if (!csv.has_column(required)) {
            throw MissingDictionaryError(path, std::string("missing column '") + required + "'");
        }
    }

    // Rows are grouped by frame id; first row of a frame carries its attributes
    std::vector<MessageSpec> order;
    std::unordered_map<uint32_t, size_t> index;

    std::vector<std::string> row;
    try {
        while (csv.read_row(row)) {
            const uint32_t frame_id = utils::CsvReader::to_uint32(csv.get(row, "frame_id"));

            auto it = index.find(frame_id);
            if (it == index.end()) {
                MessageSpec msg;
                msg.arbitration_id = frame_id;
                msg.name = csv.get(row, "frame_name");
                msg.expected_period_ms = utils::CsvReader::to_double(csv.get(row, "cycle_ms"), 0.0);
                msg.dlc = utils::CsvReader::to_int(csv.get(row, "dlc"), 8);
                index[frame_id] = order.size();
                order.push_back(msg);
                it = index.find(frame_id);
            }

            SignalSpec sig;
            sig.field_name = csv.get(row, "signal_name");
            sig.byte_offset = static_cast<size_t>(utils::CsvReader::to_int(csv.get(row, "byte_offset")));
            sig.byte_width = static_cast<size_t>(utils::CsvReader::to_int(csv.get(row, "byte_width"), 1));
            // Empty cells default to big-endian numeric; anything else must be spelled out
            const std::string order_str = utils::CsvReader::to_lower(csv.get(row, "byte_order"));
            if (order_str == "little" || order_str == "intel") {
                sig.byte_order = utils::ByteOrder::Little;
            } else if (order_str.empty() || order_str == "big" || order_str == "motorola") {
                sig.byte_order = utils::ByteOrder::Big;
            } else {
                throw MissingDictionaryError(path, "line " + std::to_string(csv.line_no()) +
                                                       ": unknown byte_order '" + csv.get(row, "byte_order") + "'");
            }
            const std::string kind = utils::CsvReader::to_lower(csv.get(row, "kind"));
            if (kind == "bool" || kind == "boolean") {
                sig.kind = SignalKind::Boolean;
            } else if (kind.empty() || kind == "numeric") {
                sig.kind = SignalKind::Numeric;
            } else {
                throw MissingDictionaryError(path, "line " + std::to_string(csv.line_no()) +
                                                       ": unknown kind '" + csv.get(row, "kind") + "'");
            }
            sig.scale = utils::CsvReader::to_double(csv.get(row, "scale"), 1.0);
            sig.offset = utils::CsvReader::to_double(csv.get(row, "offset"), 0.0);
            sig.unit = csv.get(row, "unit");

            if (sig.field_name.empty()) {
                throw MissingDictionaryError(path,
                    "line " + std::to_string(csv.line_no()) + ": empty signal_name");
            }
            order[it->second].signals.push_back(sig);
        }
    } catch (const MissingDictionaryError&) {
        throw;
    } catch (const std::exception& e) {
        throw MissingDictionaryError(path,
            "line " + std::to_string(csv.line_no()) + ": " + e.what());
    }

    SignalDictionary dict;
    for (auto& msg : order) {
        try {
            dict.add(std::move(msg));
        } catch (const std::invalid_argument& e) {
            throw MissingDictionaryError(path, e.what());
        }
    }
    if (dict.empty()) {
        throw MissingDictionaryError(path, "no signal rows");
    }
    return dict;
}

SignalDictionary SignalDictionary::builtin_vehicle() {
    SignalDictionary dict;

    auto numeric = [](const char* name, size_t off, size_t width,
                      double scale, double offset, const char* unit) {
        SignalSpec s;
        s.field_name = name;
        s.byte_offset = off;
        s.byte_width = width;
        s.byte_order = utils::ByteOrder::Big;
        s.scale = scale;
        s.offset = offset;
        s.unit = unit;
        return s;
    };

    MessageSpec speed;
    speed.arbitration_id = 0x100;
    speed.name = "VehicleSpeed";
    speed.expected_period_ms = 20.0;
    speed.signals.push_back(numeric("speed_kmh", 0, 2, 0.01, 0.0, "km/h"));
    dict.add(speed);

    MessageSpec engine;
    engine.arbitration_id = 0x101;
    engine.name = "EngineData";
    engine.expected_period_ms = 10.0;
    engine.signals.push_back(numeric("rpm", 0, 2, 0.25, 0.0, "rpm"));
    engine.signals.push_back(numeric("throttle_pct", 2, 1, 0.4, 0.0, "%"));
    dict.add(engine);

    MessageSpec brake;
    brake.arbitration_id = 0x102;
    brake.name = "BrakeData";
    brake.expected_period_ms = 20.0;
    brake.signals.push_back(numeric("brake_pressure", 0, 1, 0.4, 0.0, "%"));
    SignalSpec active = numeric("brake_active", 1, 1, 1.0, 0.0, "");
    active.kind = SignalKind::Boolean;
    brake.signals.push_back(active);
    dict.add(brake);

    MessageSpec steering;
    steering.arbitration_id = 0x103;
    steering.name = "SteeringData";
    steering.expected_period_ms = 50.0;
    steering.signals.push_back(numeric("steering_angle", 0, 2, 0.1, -1080.0, "deg"));
    dict.add(steering);

    return dict;
}

// ============================================================================
// Table access
// ============================================================================

void SignalDictionary::validate_signal(const MessageSpec& msg, const SignalSpec& sig) {
    if (sig.byte_width == 0 || sig.byte_width > 8) {
        throw std::invalid_argument("message " + msg.name + " signal " + sig.field_name +
                                    ": byte_width must be 1..8");
    }
    if (sig.byte_offset + sig.byte_width > 8) {
        throw std::invalid_argument("message " + msg.name + " signal " + sig.field_name +
                                    ": field extends past byte 8");
    }
    if (sig.kind == SignalKind::Numeric && sig.scale == 0.0) {
        throw std::invalid_argument("message " + msg.name + " signal " + sig.field_name +
                                    ": scale must be non-zero");
    }
}

void SignalDictionary::add(MessageSpec spec) {
    for (const auto& sig : spec.signals) {
        validate_signal(spec, sig);
    }
    if (spec.expected_period_ms < 0.0) {
        throw std::invalid_argument("message " + spec.name + ": negative period");
    }
    const uint32_t id = spec.arbitration_id;
    if (messages_.count(id)) {
        LOG_WARN("[SignalDictionary] Replacing definition of 0x%03X (%s)", id, spec.name.c_str());
    }
    messages_[id] = std::move(spec);
}

const MessageSpec* SignalDictionary::find(uint32_t arbitration_id) const {
    auto it = messages_.find(arbitration_id);
    if (it == messages_.end())
        return nullptr;
    return &it->second;
}

const MessageSpec& SignalDictionary::at(uint32_t arbitration_id) const {
    const MessageSpec* spec = find(arbitration_id);
    if (!spec) {
        throw UnknownMessageError(arbitration_id);
    }
    return *spec;
}

const MessageSpec* SignalDictionary::find_by_field(const std::string& field_name) const {
    for (uint32_t id : ids()) {
        const MessageSpec& msg = messages_.at(id);
        if (msg.find_signal(field_name)) return &msg;
    }
    return nullptr;
}

std::vector<uint32_t> SignalDictionary::ids() const {
    std::vector<uint32_t> out;
    out.reserve(messages_.size());
    for (const auto& kv : messages_) out.push_back(kv.first);
    std::sort(out.begin(), out.end());
    return out;
}

void SignalDictionary::print_summary() const {
    LOG_INFO("----------------------------------------");
    LOG_INFO("Signal dictionary: %zu message(s)", messages_.size());
    for (uint32_t id : ids()) {
        const MessageSpec& msg = messages_.at(id);
        if (msg.has_period()) {
            LOG_INFO("  0x%03X %-16s period=%.0f ms", id, msg.name.c_str(), msg.expected_period_ms);
        } else {
            LOG_INFO("  0x%03X %-16s period=(default)", id, msg.name.c_str());
        }
        for (const auto& s : msg.signals) {
            LOG_INFO("      %-18s bytes[%zu:%zu] %s x%g %+g %s",
                     s.field_name.c_str(), s.byte_offset, s.byte_offset + s.byte_width,
                     s.kind == SignalKind::Boolean ? "bool"
                         : (s.byte_order == utils::ByteOrder::Big ? "BE" : "LE"),
                     s.scale, s.offset, s.unit.c_str());
        }
    }
    LOG_INFO("----------------------------------------");
}

} // namespace can
