#include "line_parser.hpp"

#include <strata/errors.hpp>

namespace strata
{
namespace internal
{

std::string trim(const std::string& text)
{
    const char* whitespace = " \t\r\n";
    std::size_t start = text.find_first_not_of(whitespace);
    if (start == std::string::npos)
        return "";
    std::size_t end = text.find_last_not_of(whitespace);
    return text.substr(start, end - start + 1);
}

LineParser::LineParser(std::size_t max_buffer_size, Logger logger)
    : max_buffer_size_(max_buffer_size), logger_(std::move(logger))
{
}

json LineParser::parse_line(const std::string& line)
{
    json j;
    try
    {
        j = json::parse(line);
    }
    catch (const json::exception& e)
    {
        throw JSONDecodeError(std::string("JSON parse error: ") + e.what());
    }

    if (!j.is_object())
        throw JSONDecodeError("Expected a JSON object, got " + std::string(j.type_name()));
    return j;
}

std::vector<json> LineParser::add_data(const std::string& data)
{
    std::vector<json> messages;

    for (const auto& line : add_data_lines(data))
    {
        try
        {
            messages.push_back(parse_line(line));
        }
        catch (const JSONDecodeError& e)
        {
            ++malformed_lines_;
            logger_.debug("Dropping malformed bridge line (" + std::string(e.what()) +
                          "): " + line.substr(0, 200));
        }
    }

    return messages;
}

std::vector<std::string> LineParser::add_data_lines(const std::string& data)
{
    std::vector<std::string> lines;
    buffer_ += data;

    while (auto line = extract_line())
    {
        if (discarding_)
        {
            // Tail of an oversized line
            discarding_ = false;
            continue;
        }

        std::string trimmed = trim(*line);
        if (!trimmed.empty())
            lines.push_back(std::move(trimmed));
    }

    if (buffer_.size() > max_buffer_size_)
    {
        logger_.warning("Discarding partial bridge line of " + std::to_string(buffer_.size()) +
                        " bytes (limit " + std::to_string(max_buffer_size_) + ")");
        buffer_.clear();
        discarding_ = true;
    }

    return lines;
}

std::optional<std::string> LineParser::extract_line()
{
    std::size_t pos = buffer_.find('\n');
    if (pos == std::string::npos)
        return std::nullopt;

    std::string line = buffer_.substr(0, pos);
    buffer_.erase(0, pos + 1);

    return line;
}

} // namespace internal
} // namespace strata
