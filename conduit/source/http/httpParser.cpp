#include "conduit/http/httpParser.hpp"

#include <charconv>
#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace
{
auto trim(std::string_view t_text) -> std::string_view
{
    const auto first = t_text.find_first_not_of(" \t");
    if (first == std::string_view::npos) {
        return {};
    }

    const auto last = t_text.find_last_not_of(" \t");
    return t_text.substr(first, last - first + 1);
}

template <typename T>
auto parseNumber(std::string_view t_text, int t_base = 10) -> std::optional<T>
{
    T value{};
    const auto [ptr, ec] = std::from_chars(t_text.data(), t_text.data() + t_text.size(), value, t_base);
    if (ec != std::errc{} || ptr != t_text.data() + t_text.size()) {
        return std::nullopt;
    }

    return value;
}

// Size line of a chunk, extensions dropped.
auto parseChunkSize(std::string_view t_line) -> std::optional<std::size_t>
{
    if (const auto extension = t_line.find(';'); extension != std::string_view::npos) {
        t_line = t_line.substr(0, extension);
    }

    return parseNumber<std::size_t>(trim(t_line), 16);
}

// Longest chunk size or trailer line waited for before giving up.
constexpr std::size_t maxLineLength = 4096;
}  // namespace

namespace conduit::http
{
auto HttpParser::parse(std::string_view t_raw, bool t_expectBody) -> std::optional<Response>
{
    auto head = parseHead(t_raw);
    if (!head) {
        return std::nullopt;
    }

    auto& response = head->response;
    if (!hasBody(response, t_expectBody)) {
        return std::move(response);
    }

    const auto payload = t_raw.substr(head->body_offset);

    if (isChunked(response)) {
        auto decoded = decodeChunked(payload);
        if (!decoded) {
            return std::nullopt;
        }

        response.body = std::move(*decoded);
        return std::move(response);
    }

    if (response.headers.contains("Content-Length")) {
        const auto length = contentLength(response);
        if (!length || payload.size() < *length) {
            return std::nullopt;
        }

        response.body = std::string{payload.substr(0, *length)};
        return std::move(response);
    }

    response.body = std::string{payload};
    return std::move(response);
}

auto HttpParser::is_complete(std::string_view t_data, bool t_expectBody) -> bool
{
    ResponseFramer framer{t_expectBody};
    return framer.update(t_data);
}

auto HttpParser::decodeChunked(std::string_view t_data) -> std::optional<std::string>
{
    std::string body;
    std::size_t pos = 0;

    while (true) {
        const auto lineEnd = t_data.find("\r\n", pos);
        if (lineEnd == std::string_view::npos) {
            return std::nullopt;
        }

        const auto size = parseChunkSize(t_data.substr(pos, lineEnd - pos));
        if (!size) {
            return std::nullopt;
        }

        pos = lineEnd + 2;

        if (*size == 0) {
            // Trailers are not surfaced.
            const auto trailerEnd = t_data.find("\r\n", pos);
            if (trailerEnd == std::string_view::npos) {
                return std::nullopt;
            }
            if (trailerEnd != pos && t_data.find("\r\n\r\n", pos) == std::string_view::npos) {
                return std::nullopt;
            }

            return body;
        }

        const auto remaining = t_data.size() - pos;
        if (*size > remaining || remaining - *size < 2 || t_data.substr(pos + *size, 2) != "\r\n") {
            return std::nullopt;
        }

        body.append(t_data.substr(pos, *size));
        pos += *size + 2;
    }
}

auto HttpParser::parseHead(std::string_view t_raw) -> std::optional<Head>
{
    const auto headEnd = t_raw.find("\r\n\r\n");
    if (headEnd == std::string_view::npos) {
        return std::nullopt;
    }

    Head head;
    head.body_offset = headEnd + 4;

    const auto statusLineEnd = t_raw.find("\r\n");
    const auto statusLine = t_raw.substr(0, statusLineEnd);

    const auto versionEnd = statusLine.find(' ');
    if (versionEnd == std::string_view::npos || !statusLine.starts_with("HTTP/")) {
        return std::nullopt;
    }

    head.response.version = std::string{statusLine.substr(0, versionEnd)};

    const auto codeStart = versionEnd + 1;
    const auto codeEnd = statusLine.find(' ', codeStart);
    const auto codeText = statusLine.substr(codeStart, codeEnd == std::string_view::npos ? std::string_view::npos
                                                                                         : codeEnd - codeStart);

    const auto code = parseNumber<int>(codeText);
    if (!code || codeText.size() != 3) {
        return std::nullopt;
    }

    head.response.status_code = *code;
    head.response.status_text = codeEnd == std::string_view::npos ? std::string{}
                                                                   : std::string{statusLine.substr(codeEnd + 1)};

    auto pos = statusLineEnd + 2;
    while (pos < headEnd) {
        auto lineEnd = t_raw.find("\r\n", pos);
        const auto line = t_raw.substr(pos, lineEnd - pos);

        const auto colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0) {
            return std::nullopt;
        }

        head.response.headers.append(std::string{line.substr(0, colon)}, trim(line.substr(colon + 1)));
        pos = lineEnd + 2;
    }

    return head;
}

auto HttpParser::hasBody(const Response& t_response, bool t_expectBody) -> bool
{
    const auto code = t_response.status_code;
    return t_expectBody && code >= 200 && code != 204 && code != 304;
}

auto HttpParser::contentLength(const Response& t_response) -> std::optional<std::size_t>
{
    const auto value = t_response.headers.get("Content-Length");
    if (!value) {
        return std::nullopt;
    }

    return parseNumber<std::size_t>(trim(*value));
}

auto HttpParser::isChunked(const Response& t_response) -> bool
{
    const auto value = t_response.headers.get("Transfer-Encoding");
    return value && value->find("chunked") != std::string_view::npos;
}

ResponseFramer::ResponseFramer(bool t_expectBody) : m_expectBody(t_expectBody) {}

auto ResponseFramer::update(std::string_view t_data) -> bool
{
    if (m_mode == Mode::head) {
        // The blank line may straddle two reads.
        const auto from = m_cursor >= 3 ? m_cursor - 3 : 0;
        const auto headEnd = t_data.find("\r\n\r\n", from);
        if (headEnd == std::string_view::npos) {
            m_cursor = t_data.size();
            return false;
        }

        const auto head = HttpParser::parseHead(t_data.substr(0, headEnd + 4));
        if (!head) {
            m_mode = Mode::done;
            return true;
        }

        m_cursor = head->body_offset;

        if (!HttpParser::hasBody(head->response, m_expectBody)) {
            m_mode = Mode::done;
        } else if (HttpParser::isChunked(head->response)) {
            m_mode = Mode::chunkSize;
        } else if (head->response.headers.contains("Content-Length")) {
            const auto length = HttpParser::contentLength(head->response);
            if (!length || *length > std::numeric_limits<std::size_t>::max() - m_cursor) {
                m_mode = Mode::done;
                return true;
            }

            m_end = m_cursor + *length;
            m_mode = Mode::length;
        } else {
            m_mode = Mode::untilClose;
        }
    }

    switch (m_mode) {
        case Mode::length:
            return t_data.size() >= m_end;
        case Mode::untilClose:
            return false;
        case Mode::done:
            return true;
        default:
            return frameChunks(t_data);
    }
}

auto ResponseFramer::frameChunks(std::string_view t_data) -> bool
{
    while (true) {
        switch (m_mode) {
            case Mode::chunkSize:
            case Mode::trailer: {
                const auto lineEnd = t_data.find("\r\n", m_cursor);
                if (lineEnd == std::string_view::npos) {
                    if (t_data.size() - m_cursor > maxLineLength) {
                        m_mode = Mode::done;
                        return true;
                    }
                    return false;
                }

                const auto line = t_data.substr(m_cursor, lineEnd - m_cursor);
                m_cursor = lineEnd + 2;

                if (m_mode == Mode::trailer) {
                    if (line.empty()) {
                        m_mode = Mode::done;
                        return true;
                    }
                    break;
                }

                const auto size = parseChunkSize(line);
                if (!size || *size > std::numeric_limits<std::size_t>::max() - m_cursor - 2) {
                    m_mode = Mode::done;
                    return true;
                }

                if (*size == 0) {
                    m_mode = Mode::trailer;
                } else {
                    m_end = m_cursor + *size;
                    m_mode = Mode::chunkData;
                }
                break;
            }
            case Mode::chunkData:
                if (t_data.size() < m_end + 2) {
                    return false;
                }
                if (t_data.substr(m_end, 2) != "\r\n") {
                    m_mode = Mode::done;
                    return true;
                }

                m_cursor = m_end + 2;
                m_mode = Mode::chunkSize;
                break;
            default:
                return true;
        }
    }
}
}  // namespace conduit::http
