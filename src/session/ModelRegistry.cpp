// SPDX-License-Identifier: Apache-2.0
#include "ModelRegistry.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <iterator>
#include <ranges>

#include <bridge/Subprocess.hpp>

namespace llmtui
{

namespace
{
    auto trimmed(std::string_view text) -> std::string_view
    {
        auto const first = text.find_first_not_of(" \t\r");
        if (first == std::string_view::npos)
            return {};
        auto const last = text.find_last_not_of(" \t\r");
        return text.substr(first, last - first + 1);
    }

    auto containsId(const std::vector<Model>& models, std::string_view id) -> bool
    {
        return std::ranges::find(models, id, &Model::id) != models.end();
    }
} // namespace

ModelRegistry::ModelRegistry(std::vector<Model> models): _models(std::move(models))
{
}

auto ModelRegistry::find(std::string_view id) const -> const Model*
{
    auto const it = std::ranges::find(_models, id, &Model::id);
    return it != _models.end() ? &*it : nullptr;
}

auto ModelRegistry::indexOf(std::string_view id) const -> std::optional<std::size_t>
{
    auto const it = std::ranges::find(_models, id, &Model::id);
    if (it == _models.end())
        return std::nullopt;
    return static_cast<std::size_t>(std::distance(_models.begin(), it));
}

auto parseAliases(std::string_view text) -> std::vector<Model>
{
    auto models = std::vector<Model> {};

    for (auto const lineRange: std::views::split(text, '\n'))
    {
        auto const line = std::string_view(lineRange.begin(), lineRange.end());
        if (std::ranges::count(line, ':') != 1)
            continue;

        auto const colon = line.find(':');
        auto const alias = trimmed(line.substr(0, colon));
        auto const name = trimmed(line.substr(colon + 1));
        if (alias.empty() || containsId(models, alias))
            continue;

        models.push_back(Model { .id = std::string(alias), .name = std::string(name.empty() ? alias : name) });
    }

    return models;
}

auto mergeModels(std::vector<Model> models, const std::vector<Model>& extra) -> std::vector<Model>
{
    for (auto const& model: extra)
        if (!model.id.empty() && !containsId(models, model.id))
            models.push_back(model);
    return models;
}

auto loadModels(const ModelSource& source) -> Result<std::vector<Model>>
{
    auto output = captureOutput(SubprocessConfig { .command = source.command, .args = source.aliasesArgs },
                                source.timeout);
    if (!output)
        return std::unexpected(output.error());

    auto models = mergeModels(parseAliases(*output), source.configured);
    log::info("Loaded {} model(s) from '{}'", models.size(), source.command);
    return models;
}

} // namespace llmtui
