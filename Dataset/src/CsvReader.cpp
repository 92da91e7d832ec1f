#include <Dataset/CsvReader.hpp>

#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdlib>

namespace footfall::dataset
{
    namespace
    {
        std::string_view trim(std::string_view s)
        {
            const auto first = s.find_first_not_of(" \t\r\n");
            if (first == std::string_view::npos)
                return {};
            const auto last = s.find_last_not_of(" \t\r\n");
            return s.substr(first, last - first + 1);
        }
    } // namespace

    void LoadReport::skip(std::size_t line, const std::string &reason)
    {
        if (rows_skipped == 0)
            first_skip_reason = "line " + std::to_string(line) + ": " + reason;
        ++rows_skipped;
    }

    std::vector<std::string> splitCsvLine(std::string_view line)
    {
        std::vector<std::string> fields;
        std::string current;
        bool quoted = false;

        for (std::size_t i = 0; i < line.size(); ++i)
        {
            const char c = line[i];
            if (quoted)
            {
                if (c == '"' && i + 1 < line.size() && line[i + 1] == '"')
                {
                    current.push_back('"');
                    ++i;
                }
                else if (c == '"')
                    quoted = false;
                else
                    current.push_back(c);
            }
            else if (c == '"')
                quoted = true;
            else if (c == ',')
            {
                fields.emplace_back(trim(current));
                current.clear();
            }
            else
                current.push_back(c);
        }
        fields.emplace_back(trim(current));
        return fields;
    }

    CsvReader::CsvReader(std::istream &in) : m_in(in) {}

    bool CsvReader::readHeader()
    {
        std::string raw;
        while (std::getline(m_in, raw))
        {
            ++m_line;
            // UTF-8 BOM written by spreadsheet exports
            if (m_line == 1 && raw.rfind("\xEF\xBB\xBF", 0) == 0)
                raw.erase(0, 3);
            if (trim(raw).empty())
                continue;
            m_header = splitCsvLine(raw);
            return true;
        }
        return false;
    }

    std::optional<std::size_t> CsvReader::column(std::initializer_list<std::string_view> aliases) const
    {
        for (auto alias : aliases)
            for (std::size_t i = 0; i < m_header.size(); ++i)
                if (m_header[i] == alias)
                    return i;
        return std::nullopt;
    }

    bool CsvReader::next(std::vector<std::string> &fields)
    {
        std::string raw;
        while (std::getline(m_in, raw))
        {
            ++m_line;
            if (trim(raw).empty())
                continue;
            fields = splitCsvLine(raw);
            return true;
        }
        return false;
    }

    std::optional<int> parseInt(std::string_view text)
    {
        text = trim(text);
        int value = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size())
        {
            // "12.0" style integers from float-typed exports
            auto d = parseDouble(text);
            if (d && std::floor(*d) == *d && std::abs(*d) < 2e9)
                return static_cast<int>(*d);
            return std::nullopt;
        }
        return value;
    }

    std::optional<double> parseDouble(std::string_view text)
    {
        text = trim(text);
        if (text.empty())
            return std::nullopt;

        const std::string owned(text);
        char *end = nullptr;
        errno = 0;
        const double value = std::strtod(owned.c_str(), &end);
        if (end != owned.c_str() + owned.size() || errno == ERANGE || !std::isfinite(value))
            return std::nullopt;
        return value;
    }

} // namespace footfall::dataset
