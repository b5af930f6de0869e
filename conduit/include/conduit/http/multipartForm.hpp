#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace conduit::http
{
class MultipartForm
{
public:
    MultipartForm();
    explicit MultipartForm(std::string t_boundary);

    auto text(std::string t_name, std::string t_value) && -> MultipartForm;

    auto file(std::string t_name,
              std::string t_fileName,
              std::string t_bytes,
              std::string t_contentType = "application/octet-stream") && -> MultipartForm;

    [[nodiscard]] auto boundary() const noexcept -> const std::string&;
    [[nodiscard]] auto contentType() const -> std::string;
    [[nodiscard]] auto render() const -> std::string;

private:
    struct Part
    {
        std::string name;
        std::optional<std::string> fileName;
        std::optional<std::string> contentType;
        std::string bytes;
    };

    std::string m_boundary;
    std::vector<Part> m_parts;
};
}  // namespace conduit::http
