#include "bytepack.hpp"

#include <cctype>

namespace utils
{

    static inline bool in_range_bytes(size_t data_len, size_t offset, size_t width)
    {
        if (width == 0 || width > 8)
            return false;
        return offset + width <= data_len;
    }

    bool get_bytes(const uint8_t *data, size_t data_len,
                   size_t offset, size_t width, ByteOrder order,
                   uint64_t &out)
    {
        if (!in_range_bytes(data_len, offset, width))
            return false;

        uint64_t v = 0;
        if (order == ByteOrder::Big)
        {
            for (size_t i = 0; i < width; ++i)
                v = (v << 8) | data[offset + i];
        }
        else
        {
            for (size_t i = width; i > 0; --i)
                v = (v << 8) | data[offset + i - 1];
        }
        out = v;
        return true;
    }

    bool set_bytes(uint8_t *data, size_t data_len,
                   size_t offset, size_t width, ByteOrder order,
                   uint64_t value)
    {
        if (!in_range_bytes(data_len, offset, width))
            return false;

        for (size_t i = 0; i < width; ++i)
        {
            const uint8_t b = static_cast<uint8_t>((value >> (8 * i)) & 0xFFu);
            if (order == ByteOrder::Big)
                data[offset + width - 1 - i] = b;
            else
                data[offset + i] = b;
        }
        return true;
    }

    uint64_t max_unsigned(size_t width)
    {
        if (width >= 8)
            return ~0ULL;
        return (1ULL << (8 * width)) - 1ULL;
    }

    static inline int hex_nibble(char c)
    {
        if (c >= '0' && c <= '9')
            return c - '0';
        if (c >= 'a' && c <= 'f')
            return c - 'a' + 10;
        if (c >= 'A' && c <= 'F')
            return c - 'A' + 10;
        return -1;
    }

    bool parse_hex_bytes(const std::string &hex, std::vector<uint8_t> &out)
    {
        out.clear();
        size_t i = 0;
        if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X'))
            i = 2;

        int hi = -1;
        for (; i < hex.size(); ++i)
        {
            const char c = hex[i];
            if (std::isspace(static_cast<unsigned char>(c)) || c == ':' || c == '.')
                continue;
            const int n = hex_nibble(c);
            if (n < 0)
                return false;
            if (hi < 0)
            {
                hi = n;
            }
            else
            {
                out.push_back(static_cast<uint8_t>((hi << 4) | n));
                hi = -1;
            }
        }
        return hi < 0; // odd nibble count is malformed
    }

    std::string to_hex(const uint8_t *data, size_t len)
    {
        static const char digits[] = "0123456789ABCDEF";
        std::string out;
        out.reserve(len * 2);
        for (size_t i = 0; i < len; ++i)
        {
            out.push_back(digits[data[i] >> 4]);
            out.push_back(digits[data[i] & 0x0F]);
        }
        return out;
    }

} // namespace utils
