#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace utils
{

    // Byte order of a multi-byte field inside a CAN payload
    enum class ByteOrder
    {
        Little, // Intel: payload[offset] is the least significant byte
        Big     // Motorola: payload[offset] is the most significant byte
    };

    // Read 'width' bytes (1..8) starting at 'offset' as an unsigned integer.
    // Returns false if the field does not fit inside data_len bytes.
    bool get_bytes(const uint8_t *data, size_t data_len,
                   size_t offset, size_t width, ByteOrder order,
                   uint64_t &out);

    // Write the low 'width' bytes of 'value' at 'offset'.
    bool set_bytes(uint8_t *data, size_t data_len,
                   size_t offset, size_t width, ByteOrder order,
                   uint64_t value);

    // Largest unsigned value representable in 'width' bytes
    uint64_t max_unsigned(size_t width);

    // "1F40A0" -> {0x1F, 0x40, 0xA0}. Whitespace, ':' and '.' separators are skipped.
    bool parse_hex_bytes(const std::string &hex, std::vector<uint8_t> &out);

    // {0x1F, 0x40} -> "1F40"
    std::string to_hex(const uint8_t *data, size_t len);

} // namespace utils
