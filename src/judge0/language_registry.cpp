#include "judge0/language_registry.hpp"

#include <stdexcept>
#include <utility>

#include "judge0/errors.hpp"
#include "utils/common.hpp"

namespace judgelink::judge0 {
namespace {

std::string NormalizeName(const std::string& name) {
    return utils::ToLower(utils::Trim(name));
}

}  // namespace

nlohmann::json ToJson(const LanguageDefinition& language) {
    return {
        {"key", language.key},
        {"id", language.remote_id},
        {"name", language.display_name},
        {"editor", language.editor_hint},
        {"aliases", language.aliases}
    };
}

std::vector<LanguageDefinition> DefaultLanguageDefinitions() {
    return {
        {"python", 71, "Python (3.8.1)", "python", {"py", "python3"}},
        {"javascript", 63, "JavaScript (Node.js 12.14)", "javascript", {"js", "node"}},
        {"typescript", 74, "TypeScript (3.7.4)", "typescript", {"ts"}},
        {"c", 50, "C (GCC 9.2.0)", "c", {}},
        {"cpp", 54, "C++ (GCC 9.2.0)", "cpp", {"c++"}},
        {"java", 62, "Java (OpenJDK 13)", "java", {}},
        {"csharp", 51, "C# (Mono 6.6)", "csharp", {"c#", "cs"}},
        {"go", 60, "Go (1.13.5)", "go", {"golang"}},
        {"rust", 73, "Rust (1.40.0)", "rust", {}},
        {"ruby", 72, "Ruby (2.7.0)", "ruby", {}},
        {"php", 68, "PHP (7.4.1)", "php", {}},
        {"swift", 83, "Swift (5.2.3)", "swift", {}},
        {"kotlin", 78, "Kotlin (1.3.70)", "kotlin", {}},
        {"sql", 82, "SQL (SQLite 3.27)", "sql", {"sqlite"}},
        {"bash", 46, "Bash (5.0.0)", "shell", {"sh", "shell"}},
    };
}

LanguageRegistry::LanguageRegistry(std::vector<LanguageDefinition> definitions)
    : definitions_(std::move(definitions)) {
    for (std::size_t i = 0; i < definitions_.size(); ++i) {
        auto& definition = definitions_[i];
        definition.key = NormalizeName(definition.key);
        if (definition.key.empty()) {
            throw std::invalid_argument("language definition with empty key");
        }
        for (auto& alias : definition.aliases) {
            alias = NormalizeName(alias);
        }

        std::vector<std::string> names{definition.key};
        names.insert(names.end(), definition.aliases.begin(), definition.aliases.end());
        for (const auto& name : names) {
            if (name.empty()) {
                throw std::invalid_argument("language '" + definition.key + "' declares an empty alias");
            }
            const auto [it, inserted] = alias_index_.emplace(name, i);
            if (!inserted && it->second != i) {
                throw std::invalid_argument(
                    "language alias '" + name + "' is claimed by both '" +
                    definitions_[it->second].key + "' and '" + definition.key + "'");
            }
        }
    }
}

const LanguageDefinition* LanguageRegistry::Find(const std::string& input) const {
    const auto it = alias_index_.find(NormalizeName(input));
    if (it == alias_index_.end()) {
        return nullptr;
    }
    return &definitions_[it->second];
}

const LanguageDefinition& LanguageRegistry::Resolve(const std::string& input) const {
    const auto* definition = Find(input);
    if (!definition) {
        throw UnsupportedLanguageError(input);
    }
    return *definition;
}

}  // namespace judgelink::judge0
