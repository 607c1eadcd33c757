// utils/csv.hpp
#pragma once
#include <cctype>
#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace utils
{

    // CSV reader used for frame logs and the CSV signal dictionary:
    // - header → column index
    // - quoted fields
    // - comment / blank skipping
    // - strict typed helpers (int / uint32 / double)
    class CsvReader
    {
    public:
        CsvReader() = default;

        bool open(const std::string &path)
        {
            if (file_.is_open())
                file_.close();
            file_.open(path);
            if (!file_.is_open())
                return false;

            header_.clear();
            col_index_.clear();
            line_no_ = 0;

            std::string line;
            while (std::getline(file_, line))
            {
                ++line_no_;
                if (is_blank(line) || line[0] == '#')
                    continue;

                header_ = parse_line(line);
                for (size_t i = 0; i < header_.size(); ++i)
                {
                    trim_inplace(header_[i]);
                    col_index_[header_[i]] = static_cast<int>(i);
                }
                return true;
            }
            return false;
        }

        bool read_row(std::vector<std::string> &out)
        {
            out.clear();
            if (!file_.is_open())
                return false;

            std::string line;
            while (std::getline(file_, line))
            {
                ++line_no_;
                if (is_blank(line))
                    continue;
                if (line[0] == '#')
                    continue;

                out = parse_line(line);
                if (out.size() < header_.size())
                    out.resize(header_.size());

                for (auto &cell : out)
                    trim_inplace(cell);

                return true;
            }
            return false;
        }

        int col(const std::string &name) const
        {
            auto it = col_index_.find(name);
            if (it == col_index_.end())
                return -1;
            return it->second;
        }

        bool has_column(const std::string &name) const { return col(name) >= 0; }

        const std::vector<std::string> &header() const { return header_; }

        // Physical line number of the last row returned (1-based)
        size_t line_no() const { return line_no_; }

        std::string get(const std::vector<std::string> &row,
                        const std::string &col_name) const
        {
            int idx = col(col_name);
            if (idx < 0 || static_cast<size_t>(idx) >= row.size())
                return "";
            return row[static_cast<size_t>(idx)];
        }

        // ---- Typed helpers ----
        // Empty cells yield the default. Anything that is not entirely a number
        // ("12abc", "-3" for unsigned) throws std::invalid_argument.

        static int to_int(const std::string &s, int default_val = 0)
        {
            if (s.empty())
                return default_val;
            size_t used = 0;
            const int v = std::stoi(s, &used);
            require_consumed(s, used, "integer");
            return v;
        }

        // Decimal or 0x-prefixed hex
        static uint32_t to_uint32(const std::string &s, uint32_t default_val = 0)
        {
            if (s.empty())
                return default_val;
            if (s[0] == '-')
                throw std::invalid_argument("negative value: '" + s + "'");
            size_t used = 0;
            const unsigned long v = std::stoul(s, &used, 0);
            require_consumed(s, used, "unsigned integer");
            if (v > 0xFFFFFFFFUL)
                throw std::out_of_range("value exceeds 32 bits: '" + s + "'");
            return static_cast<uint32_t>(v);
        }

        static double to_double(const std::string &s, double default_val = 0.0)
        {
            if (s.empty())
                return default_val;
            size_t used = 0;
            const double v = std::stod(s, &used);
            require_consumed(s, used, "number");
            return v;
        }

        static std::string to_lower(const std::string &s)
        {
            std::string out;
            out.reserve(s.size());
            for (char c : s)
                out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
            return out;
        }

    private:
        static void require_consumed(const std::string &s, size_t used, const char *what)
        {
            if (used != s.size())
                throw std::invalid_argument(std::string("not a ") + what + ": '" + s + "'");
        }

        static bool is_blank(const std::string &s)
        {
            for (char c : s)
                if (!std::isspace(static_cast<unsigned char>(c)))
                    return false;
            return true;
        }

        static void trim_inplace(std::string &s)
        {
            size_t b = 0;
            while (b < s.size() && std::isspace(static_cast<unsigned char>(s[b])))
                b++;
            size_t e = s.size();
            while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
                e--;
            s = s.substr(b, e - b);
        }

        static std::vector<std::string> parse_line(const std::string &line)
        {
            std::vector<std::string> fields;
            std::string cur;
            cur.reserve(line.size());

            bool in_quotes = false;
            for (size_t i = 0; i < line.size(); ++i)
            {
                char c = line[i];

                if (in_quotes)
                {
                    if (c == '"')
                    {
                        if (i + 1 < line.size() && line[i + 1] == '"')
                        {
                            cur.push_back('"');
                            ++i;
                        }
                        else
                        {
                            in_quotes = false;
                        }
                    }
                    else
                    {
                        cur.push_back(c);
                    }
                }
                else
                {
                    if (c == '"')
                        in_quotes = true;
                    else if (c == ',')
                    {
                        fields.push_back(cur);
                        cur.clear();
                    }
                    else if (c != '\r')
                        cur.push_back(c);
                }
            }
            fields.push_back(cur);
            return fields;
        }

    private:
        std::ifstream file_;
        std::vector<std::string> header_;
        std::unordered_map<std::string, int> col_index_;
        size_t line_no_ = 0;
    };

    // Append-only CSV writer. Cells containing ',' '"' or newlines are quoted.
    class CsvWriter
    {
    public:
        CsvWriter() = default;

        bool open(const std::string &path, const std::vector<std::string> &header)
        {
            file_.open(path, std::ios::out | std::ios::trunc);
            if (!file_.is_open())
                return false;
            write_row(header);
            return true;
        }

        bool is_open() const { return file_.is_open(); }

        void write_row(const std::vector<std::string> &cells)
        {
            for (size_t i = 0; i < cells.size(); ++i)
            {
                if (i > 0)
                    file_ << ',';
                file_ << escape(cells[i]);
            }
            file_ << '\n';
            ++rows_;
        }

        void flush() { file_.flush(); }

        // Data rows written (header included)
        size_t rows() const { return rows_; }

        static std::string escape(const std::string &cell)
        {
            if (cell.find_first_of(",\"\n\r") == std::string::npos)
                return cell;
            std::string out = "\"";
            for (char c : cell)
            {
                if (c == '"')
                    out.push_back('"');
                out.push_back(c);
            }
            out.push_back('"');
            return out;
        }

    private:
        std::ofstream file_;
        size_t rows_ = 0;
    };

} // namespace utils
