#pragma once

#include <cstddef>
#include <initializer_list>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace footfall::dataset
{
    // Row accounting of one file. Malformed rows are skipped, never thrown.
    struct LoadReport
    {
        std::size_t rows_read{0};
        std::size_t rows_skipped{0};
        std::string first_skip_reason;

        void skip(std::size_t line, const std::string &reason);
    };

    /// Splits one CSV line. Double-quoted fields may contain commas and "" escapes.
    std::vector<std::string> splitCsvLine(std::string_view line);

    // Header-aware reader over a comma separated stream.
    class CsvReader
    {
    public:
        explicit CsvReader(std::istream &in);

        /// Reads the header line. False when the stream holds no header.
        bool readHeader();

        /// Index of the first header column matching any alias (case-sensitive, trimmed).
        [[nodiscard]] std::optional<std::size_t> column(std::initializer_list<std::string_view> aliases) const;

        /// Next non-blank data row. False at end of stream.
        bool next(std::vector<std::string> &fields);

        [[nodiscard]] std::size_t line() const noexcept { return m_line; }
        [[nodiscard]] const std::vector<std::string> &header() const noexcept { return m_header; }

    private:
        std::istream &m_in;
        std::vector<std::string> m_header;
        std::size_t m_line{0};
    };

    /// Whole-field numeric parsing; std::nullopt on trailing garbage or empty input.
    std::optional<int> parseInt(std::string_view text);
    std::optional<double> parseDouble(std::string_view text);

} // namespace footfall::dataset
