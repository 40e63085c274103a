#include <gtest/gtest.h>

#include <cctype>
#include <stdexcept>
#include <string>
#include <vector>

#include "judge0/errors.hpp"
#include "judge0/language_registry.hpp"

using judgelink::judge0::DefaultLanguageDefinitions;
using judgelink::judge0::LanguageDefinition;
using judgelink::judge0::LanguageRegistry;
using judgelink::judge0::UnsupportedLanguageError;

namespace {

std::string Upper(std::string value) {
    for (auto& c : value) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return value;
}

}  // namespace

// NOLINTNEXTLINE
TEST(language_registry, python_aliases_resolve_to_same_definition) {
    LanguageRegistry registry(DefaultLanguageDefinitions());
    const auto& by_alias = registry.Resolve("PY");
    EXPECT_EQ(&by_alias, &registry.Resolve("python3"));
    EXPECT_EQ(&by_alias, &registry.Resolve("python"));
    EXPECT_EQ(by_alias.key, "python");
    EXPECT_EQ(by_alias.remote_id, 71);
    EXPECT_EQ(by_alias.display_name, "Python (3.8.1)");
}

// NOLINTNEXTLINE
TEST(language_registry, every_key_and_alias_resolves_case_insensitively) {
    LanguageRegistry registry(DefaultLanguageDefinitions());
    for (const auto& definition : registry.ListSupported()) {
        EXPECT_EQ(registry.Resolve(definition.key).key, definition.key);
        EXPECT_EQ(registry.Resolve(Upper(definition.key)).key, definition.key);
        for (const auto& alias : definition.aliases) {
            EXPECT_EQ(registry.Resolve(alias).key, definition.key) << alias;
            EXPECT_EQ(registry.Resolve(Upper(alias)).key, definition.key) << alias;
        }
    }
}

// NOLINTNEXTLINE
TEST(language_registry, input_is_trimmed) {
    LanguageRegistry registry(DefaultLanguageDefinitions());
    EXPECT_EQ(registry.Resolve("  C++ \n").key, "cpp");
    EXPECT_EQ(registry.Resolve("\tGolang").remote_id, 60);
}

// NOLINTNEXTLINE
TEST(language_registry, unknown_language_throws_unsupported) {
    LanguageRegistry registry(DefaultLanguageDefinitions());
    for (const std::string input : {"cobol", "", "   ", "pythonn", "c--"}) {
        try {
            registry.Resolve(input);
            FAIL() << "expected UnsupportedLanguageError for '" << input << "'";
        } catch (const UnsupportedLanguageError& ex) {
            EXPECT_EQ(ex.language(), input);
            EXPECT_TRUE(ex.IsClientError());
        }
    }
    EXPECT_EQ(registry.Find("cobol"), nullptr);
}

// NOLINTNEXTLINE
TEST(language_registry, default_table_matches_judge0_ids) {
    LanguageRegistry registry(DefaultLanguageDefinitions());
    EXPECT_EQ(registry.Size(), 15u);
    EXPECT_EQ(registry.Resolve("js").remote_id, 63);
    EXPECT_EQ(registry.Resolve("ts").remote_id, 74);
    EXPECT_EQ(registry.Resolve("c").remote_id, 50);
    EXPECT_EQ(registry.Resolve("c#").remote_id, 51);
    EXPECT_EQ(registry.Resolve("sqlite").remote_id, 82);
    EXPECT_EQ(registry.Resolve("sh").editor_hint, "shell");
    EXPECT_EQ(registry.Resolve("kotlin").remote_id, 78);
}

// NOLINTNEXTLINE
TEST(language_registry, list_supported_is_stable_and_in_registration_order) {
    LanguageRegistry registry(DefaultLanguageDefinitions());
    const auto& first = registry.ListSupported();
    std::vector<std::string> keys;
    for (const auto& definition : first) {
        keys.push_back(definition.key);
    }
    ASSERT_EQ(keys.front(), "python");
    ASSERT_EQ(keys.back(), "bash");
    for (int i = 0; i < 3; ++i) {
        const auto& again = registry.ListSupported();
        ASSERT_EQ(again.size(), keys.size());
        for (std::size_t j = 0; j < keys.size(); ++j) {
            EXPECT_EQ(again[j].key, keys[j]);
        }
    }
}

// NOLINTNEXTLINE
TEST(language_registry, duplicate_alias_fails_construction) {
    std::vector<LanguageDefinition> definitions = {
        {"python", 71, "Python", "python", {"py"}},
        {"pypy", 999, "PyPy", "python", {"PY"}},
    };
    EXPECT_THROW(LanguageRegistry{definitions}, std::invalid_argument);
}

// NOLINTNEXTLINE
TEST(language_registry, alias_colliding_with_other_key_fails_construction) {
    std::vector<LanguageDefinition> definitions = {
        {"c", 50, "C", "c", {}},
        {"cpp", 54, "C++", "cpp", {"c"}},
    };
    EXPECT_THROW(LanguageRegistry{definitions}, std::invalid_argument);
}

// NOLINTNEXTLINE
TEST(language_registry, definitions_are_normalized_to_lowercase) {
    std::vector<LanguageDefinition> definitions = {{"Lua", 64, "Lua (5.3.5)", "lua", {"LUA53"}}};
    LanguageRegistry registry(definitions);
    const auto& lua = registry.Resolve("lua53");
    EXPECT_EQ(lua.key, "lua");
    EXPECT_EQ(lua.aliases, std::vector<std::string>{"lua53"});
}

// NOLINTNEXTLINE
TEST(language_registry, editor_hint_defaults_to_plaintext) {
    LanguageDefinition definition{};
    definition.key = "brainfuck";
    definition.remote_id = 44;
    LanguageRegistry registry(std::vector<LanguageDefinition>{definition});
    EXPECT_EQ(registry.Resolve("brainfuck").editor_hint, "plaintext");
}

// NOLINTNEXTLINE
TEST(language_registry, to_json_projection) {
    LanguageRegistry registry(DefaultLanguageDefinitions());
    const auto json = judgelink::judge0::ToJson(registry.Resolve("csharp"));
    EXPECT_EQ(json["key"], "csharp");
    EXPECT_EQ(json["id"], 51);
    EXPECT_EQ(json["name"], "C# (Mono 6.6)");
    EXPECT_EQ(json["editor"], "csharp");
    EXPECT_EQ(json["aliases"], nlohmann::json::array({"c#", "cs"}));
}
