// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace llmtui
{

/// @brief Where the list of available models comes from.
struct ModelSource
{
    std::string command = "llm";
    std::vector<std::string> aliasesArgs = { "aliases" };
    std::vector<Model> configured;  ///< Appended after the tool's aliases.
    std::chrono::milliseconds timeout { 10'000 };
};

/// @brief Immutable snapshot of the models the external tool knows about.
///
/// A registry is replaced as a whole on reload and never modified in place.
class ModelRegistry
{
  public:
    ModelRegistry() = default;
    explicit ModelRegistry(std::vector<Model> models);

    [[nodiscard]] auto models() const noexcept -> const std::vector<Model>& { return _models; }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return _models.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return _models.empty(); }

    [[nodiscard]] auto find(std::string_view id) const -> const Model*;
    [[nodiscard]] auto contains(std::string_view id) const -> bool { return find(id) != nullptr; }

    /// @brief Position of a model in the snapshot.
    [[nodiscard]] auto indexOf(std::string_view id) const -> std::optional<std::size_t>;

  private:
    std::vector<Model> _models;
};

/// @brief Parses the output of `llm aliases`.
///
/// Each line has the form `alias : full name`. Lines without exactly one
/// colon or with an empty alias are skipped; duplicates keep their first
/// occurrence.
[[nodiscard]] auto parseAliases(std::string_view text) -> std::vector<Model>;

/// @brief Appends @p extra models whose identifiers are not already present.
[[nodiscard]] auto mergeModels(std::vector<Model> models, const std::vector<Model>& extra) -> std::vector<Model>;

/// @brief Queries the external tool for its aliases and merges the configured models.
///
/// Blocks until the tool exits or the source timeout expires.
[[nodiscard]] auto loadModels(const ModelSource& source) -> Result<std::vector<Model>>;

} // namespace llmtui
