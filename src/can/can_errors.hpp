// src/can/can_errors.hpp
#pragma once

#include <cstdint>
#include <cstdio>
#include <stdexcept>
#include <string>

namespace can {

// No MessageSpec for this arbitration id. Expected noise on a real bus:
// callers drop the frame and keep going.
class UnknownMessageError : public std::runtime_error {
public:
    explicit UnknownMessageError(uint32_t arbitration_id)
        : std::runtime_error(format(arbitration_id)), arbitration_id_(arbitration_id) {}

    uint32_t arbitration_id() const { return arbitration_id_; }

private:
    static std::string format(uint32_t id) {
        char buf[64];
        std::snprintf(buf, sizeof(buf), "unknown arbitration id 0x%03X (%u)", id, id);
        return buf;
    }

    uint32_t arbitration_id_;
};

// Payload shorter than one of the message's signals requires.
// The whole frame is invalid, not only the offending field.
class TruncatedFrameError : public std::runtime_error {
public:
    TruncatedFrameError(uint32_t arbitration_id, const std::string& field,
                        size_t byte_offset, size_t byte_width, size_t length)
        : std::runtime_error(format(arbitration_id, field, byte_offset, byte_width, length)),
          arbitration_id_(arbitration_id), field_(field) {}

    uint32_t arbitration_id() const { return arbitration_id_; }
    const std::string& field() const { return field_; }

private:
    static std::string format(uint32_t id, const std::string& field,
                              size_t off, size_t width, size_t len) {
        char buf[200];
        std::snprintf(buf, sizeof(buf),
                      "truncated frame 0x%03X: field '%s' needs bytes [%zu,%zu) but length is %zu",
                      id, field.c_str(), off, off + width, len);
        return buf;
    }

    uint32_t arbitration_id_;
    std::string field_;
};

// Signal dictionary absent or unparseable. Fatal: the pipeline cannot start.
class MissingDictionaryError : public std::runtime_error {
public:
    MissingDictionaryError(const std::string& path, const std::string& reason)
        : std::runtime_error("signal dictionary '" + path + "': " + reason), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace can
