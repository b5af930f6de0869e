#include "conduit/http/multipartForm.hpp"

#include <cstdint>
#include <format>
#include <random>
#include <string>
#include <utility>

namespace
{
auto generateBoundary() -> std::string
{
    std::random_device device;
    std::mt19937_64 engine{device()};
    std::uniform_int_distribution<uint64_t> distribution;

    return std::format("conduit-{:016x}{:016x}", distribution(engine), distribution(engine));
}
}  // namespace

namespace conduit::http
{
MultipartForm::MultipartForm() : m_boundary{generateBoundary()} {}

MultipartForm::MultipartForm(std::string t_boundary) : m_boundary{std::move(t_boundary)} {}

auto MultipartForm::text(std::string t_name, std::string t_value) && -> MultipartForm
{
    m_parts.push_back(Part{std::move(t_name), std::nullopt, std::nullopt, std::move(t_value)});
    return std::move(*this);
}

auto MultipartForm::file(std::string t_name, std::string t_fileName, std::string t_bytes, std::string t_contentType) && -> MultipartForm
{
    m_parts.push_back(Part{std::move(t_name), std::move(t_fileName), std::move(t_contentType), std::move(t_bytes)});
    return std::move(*this);
}

auto MultipartForm::boundary() const noexcept -> const std::string&
{
    return m_boundary;
}

auto MultipartForm::contentType() const -> std::string
{
    return "multipart/form-data; boundary=" + m_boundary;
}

auto MultipartForm::render() const -> std::string
{
    std::string result;

    for (const auto& part : m_parts) {
        result += std::format("--{}\r\n", m_boundary);
        result += std::format("Content-Disposition: form-data; name=\"{}\"", part.name);
        if (part.fileName) {
            result += std::format("; filename=\"{}\"", *part.fileName);
        }
        result += "\r\n";

        if (part.contentType) {
            result += std::format("Content-Type: {}\r\n", *part.contentType);
        }

        result += "\r\n";
        result += part.bytes;
        result += "\r\n";
    }

    result += std::format("--{}--\r\n", m_boundary);

    return result;
}
}  // namespace conduit::http
