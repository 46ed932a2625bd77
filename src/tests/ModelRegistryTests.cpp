// SPDX-License-Identifier: Apache-2.0
#include <session/ModelRegistry.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace llmtui;
using namespace std::chrono_literals;

TEST_CASE("parseAliases reads alias lines", "[models]")
{
    auto const models = parseAliases("4o                  : gpt-4o\n"
                                     "mini : gpt-4o-mini\r\n"
                                     "no colon here\n"
                                     "a : b : c\n"
                                     " : nameless\n"
                                     "4o : duplicate\n"
                                     "bare :\n");
    REQUIRE(models.size() == 3);
    CHECK(models[0].id == "4o");
    CHECK(models[0].name == "gpt-4o");
    CHECK(models[1].id == "mini");
    CHECK(models[1].name == "gpt-4o-mini");
    CHECK(models[2].id == "bare");
    CHECK(models[2].name == "bare");
}

TEST_CASE("parseAliases of empty output yields no models", "[models]")
{
    CHECK(parseAliases("").empty());
    CHECK(parseAliases("\n\n").empty());
}

TEST_CASE("mergeModels appends only unknown identifiers", "[models]")
{
    auto const merged = mergeModels({ Model { "4o", "gpt-4o" } },
                                    { Model { "4o", "other" }, Model { "local", "llama" }, Model { "", "x" } });
    REQUIRE(merged.size() == 2);
    CHECK(merged[0].name == "gpt-4o");
    CHECK(merged[1].id == "local");
}

TEST_CASE("ModelRegistry lookup", "[models]")
{
    auto const registry = ModelRegistry({ Model { "a", "alpha" }, Model { "b", "beta" } });
    CHECK(registry.size() == 2);
    CHECK(registry.contains("b"));
    CHECK_FALSE(registry.contains("c"));
    REQUIRE(registry.find("a") != nullptr);
    CHECK(registry.find("a")->name == "alpha");
    CHECK(registry.indexOf("b") == 1);
    CHECK_FALSE(registry.indexOf("zzz").has_value());
    CHECK(ModelRegistry {}.empty());
}

TEST_CASE("loadModels runs the configured command", "[models]")
{
    auto const source = ModelSource {
        .command = "sh",
        .aliasesArgs = { "-c", "printf '4o : gpt-4o\\nmini : gpt-4o-mini\\n'" },
        .configured = { Model { "local", "llama" }, Model { "4o", "ignored" } },
        .timeout = 5s,
    };

    auto const models = loadModels(source);
    REQUIRE(models.has_value());
    REQUIRE(models->size() == 3);
    CHECK((*models)[0].name == "gpt-4o");
    CHECK((*models)[2].id == "local");
}

TEST_CASE("loadModels reports tool failures", "[models]")
{
    SECTION("missing tool")
    {
        auto const models = loadModels(ModelSource { .command = "/nonexistent/llm-tool" });
        REQUIRE_FALSE(models.has_value());
        CHECK(models.error().code == ErrorCode::SpawnFailure);
    }

    SECTION("non-zero exit")
    {
        auto const models = loadModels(ModelSource { .command = "sh", .aliasesArgs = { "-c", "exit 2" } });
        REQUIRE_FALSE(models.has_value());
        CHECK(models.error().code == ErrorCode::StreamFailure);
    }
}
