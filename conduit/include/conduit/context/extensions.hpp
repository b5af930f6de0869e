#pragma once

#include <any>
#include <concepts>
#include <cstddef>
#include <optional>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>

namespace conduit::context
{
template <typename T>
concept ExtensionConcept = std::is_object_v<T> && !std::is_const_v<T> && std::copy_constructible<T>;

// Per-request bag of typed values, at most one value per type. Owned by a
// single request's call chain and never shared, so no locking.
class Extensions
{
public:
    Extensions() = default;

    Extensions(Extensions&&) noexcept = default;
    Extensions& operator=(Extensions&&) noexcept = default;

    Extensions(const Extensions&) = delete;
    Extensions& operator=(const Extensions&) = delete;

    ~Extensions() = default;

    // Replaces any value of the same type and hands the old one back.
    template <ExtensionConcept T>
    auto insert(T t_value) -> std::optional<T>
    {
        auto [it, inserted] = m_values.try_emplace(std::type_index{typeid(T)});
        std::optional<T> previous{};

        if (!inserted) {
            previous.emplace(std::move(*std::any_cast<T>(&it->second)));
        }

        it->second = std::move(t_value);

        return previous;
    }

    template <ExtensionConcept T>
    [[nodiscard]] auto get() const -> const T*
    {
        auto it = m_values.find(std::type_index{typeid(T)});
        if (it == m_values.end()) {
            return nullptr;
        }

        return std::any_cast<T>(&it->second);
    }

    template <ExtensionConcept T>
    [[nodiscard]] auto getMut() -> T*
    {
        auto it = m_values.find(std::type_index{typeid(T)});
        if (it == m_values.end()) {
            return nullptr;
        }

        return std::any_cast<T>(&it->second);
    }

    template <ExtensionConcept T>
    [[nodiscard]] auto contains() const -> bool
    {
        return m_values.contains(std::type_index{typeid(T)});
    }

    template <ExtensionConcept T>
    auto remove() -> std::optional<T>
    {
        auto node = m_values.extract(std::type_index{typeid(T)});
        if (node.empty()) {
            return std::nullopt;
        }

        return std::move(*std::any_cast<T>(&node.mapped()));
    }

    // Values from t_other win over values of the same type already present.
    auto extend(Extensions&& t_other) -> void
    {
        for (auto& [type, value] : t_other.m_values) {
            m_values.insert_or_assign(type, std::move(value));
        }

        t_other.m_values.clear();
    }

    auto clear() noexcept -> void
    {
        m_values.clear();
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t
    {
        return m_values.size();
    }

    [[nodiscard]] auto empty() const noexcept -> bool
    {
        return m_values.empty();
    }

private:
    std::unordered_map<std::type_index, std::any> m_values;
};
}  // namespace conduit::context
