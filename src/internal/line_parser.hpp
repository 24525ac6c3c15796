#ifndef STRATA_INTERNAL_LINE_PARSER_HPP
#define STRATA_INTERNAL_LINE_PARSER_HPP

#include "log.hpp"

#include <cstddef>
#include <optional>
#include <strata/types.hpp>
#include <string>
#include <vector>

namespace strata
{
namespace internal
{

// Newline framing for the bridge's stdout. Bytes are accumulated across
// reads; each complete line is trimmed and parsed as one JSON object. The
// trailing partial line stays buffered for the next read.
class LineParser
{
  public:
    explicit LineParser(std::size_t max_buffer_size = 8 * 1024 * 1024, Logger logger = Logger());

    // Parse one complete line; throws JSONDecodeError unless it is a JSON object
    static json parse_line(const std::string& line);

    // Add data to buffer and return every JSON object completed by it, in order.
    // Malformed lines are dropped (debug log) and never stop the stream.
    std::vector<json> add_data(const std::string& data);

    // Split data into complete trimmed, non-empty lines without parsing
    std::vector<std::string> add_data_lines(const std::string& data);

    // Check if buffer has buffered data
    bool has_buffered_data() const
    {
        return !buffer_.empty();
    }

    // Clear buffer
    void clear_buffer()
    {
        buffer_.clear();
        discarding_ = false;
    }

    // Lines dropped as malformed since construction
    std::size_t malformed_line_count() const
    {
        return malformed_lines_;
    }

  private:
    std::string buffer_;
    std::size_t max_buffer_size_;
    Logger logger_;
    std::size_t malformed_lines_ = 0;
    // An oversized partial line was discarded; skip until the next newline
    bool discarding_ = false;

    // Try to extract one complete line from buffer
    std::optional<std::string> extract_line();
};

// Strip leading/trailing whitespace (space, tab, CR, LF)
std::string trim(const std::string& text);

} // namespace internal
} // namespace strata

#endif // STRATA_INTERNAL_LINE_PARSER_HPP
