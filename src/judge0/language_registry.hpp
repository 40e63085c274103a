#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "nlohmann/json.hpp"

namespace judgelink::judge0 {

struct LanguageDefinition {
    std::string key;
    int remote_id = 0;
    std::string display_name;
    std::string editor_hint = "plaintext";
    std::vector<std::string> aliases;
};

nlohmann::json ToJson(const LanguageDefinition& language);

// Languages configured on the public Judge0 CE deployment.
std::vector<LanguageDefinition> DefaultLanguageDefinitions();

/// Read-only lookup from language names to Judge0 language ids.
///
/// Keys and aliases are matched case-insensitively after trimming. The table
/// is fixed at construction; every const member is safe to call concurrently.
class LanguageRegistry {
public:
    /// Throws std::invalid_argument when two definitions claim the same key or
    /// alias, or a definition has an empty key.
    explicit LanguageRegistry(std::vector<LanguageDefinition> definitions);

    /// Throws UnsupportedLanguageError when nothing matches.
    const LanguageDefinition& Resolve(const std::string& input) const;
    const LanguageDefinition* Find(const std::string& input) const;

    const std::vector<LanguageDefinition>& ListSupported() const { return definitions_; }
    std::size_t Size() const { return definitions_.size(); }

private:
    std::vector<LanguageDefinition> definitions_;
    std::unordered_map<std::string, std::size_t> alias_index_;
};

}  // namespace judgelink::judge0
