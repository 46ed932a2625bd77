// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <format>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace llmtui::json
{

/// @brief Parses JSON text, reporting syntax errors as ConfigError.
[[nodiscard]] inline auto parse(std::string_view input) -> Result<nlohmann::json>
{
    try
    {
        return nlohmann::json::parse(input);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        return makeError(ErrorCode::ConfigError, std::format("JSON parse error: {}", e.what()));
    }
}

/// @brief Reads @p key from @p obj if it holds a value of type @p T, else returns @p fallback.
///
/// Supported types are std::string, bool and integral numbers. A key of the
/// wrong JSON type counts as missing; integers outside the range of @p T too.
template <typename T>
[[nodiscard]] auto valueOr(const nlohmann::json& obj, std::string_view key, T fallback) -> T
{
    if (!obj.is_object())
        return fallback;
    auto const it = obj.find(std::string(key));
    if (it == obj.end())
        return fallback;

    if constexpr (std::is_same_v<T, std::string>)
        return it->is_string() ? it->template get<std::string>() : fallback;
    else if constexpr (std::is_same_v<T, bool>)
        return it->is_boolean() ? it->template get<bool>() : fallback;
    else
    {
        static_assert(std::is_integral_v<T>, "valueOr supports strings, booleans and integers");
        if (!it->is_number_integer())
            return fallback;
        auto const value = it->template get<long long>();
        if (!std::in_range<T>(value))
            return fallback;
        return static_cast<T>(value);
    }
}

/// @brief String literal fallback for valueOr<std::string>.
[[nodiscard]] inline auto valueOr(const nlohmann::json& obj, std::string_view key, const char* fallback)
    -> std::string
{
    return valueOr<std::string>(obj, key, std::string(fallback));
}

/// @brief Reads an array of strings, skipping non-string elements.
/// Returns @p fallback if the key is missing or not an array.
[[nodiscard]] inline auto stringArrayOr(const nlohmann::json& obj,
                                        std::string_view key,
                                        std::vector<std::string> fallback) -> std::vector<std::string>
{
    if (!obj.is_object())
        return fallback;
    auto const it = obj.find(std::string(key));
    if (it == obj.end() || !it->is_array())
        return fallback;

    auto values = std::vector<std::string> {};
    for (auto const& item: *it)
        if (item.is_string())
            values.push_back(item.get<std::string>());
    return values;
}

} // namespace llmtui::json
