#pragma once

#include <string>
#include <vector>

#include "config/config_schema.hpp"

namespace runbox::runner {

inline constexpr const char* kDefaultLanguage = "python";

struct Language {
    std::string name;
    std::string interpreter;
};

class LanguageTable {
public:
    explicit LanguageTable(std::vector<Language> languages);

    // Exact, case-sensitive match. Null when unsupported.
    const Language* Find(const std::string& name) const;
    std::vector<std::string> Names() const;

private:
    std::vector<Language> languages_;
};

LanguageTable BuildLanguageTable(const runbox::config::RunnerConfig& config);

}  // namespace runbox::runner
