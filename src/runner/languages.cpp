#include "runner/languages.hpp"

#include <utility>

namespace runbox::runner {

LanguageTable::LanguageTable(std::vector<Language> languages)
    : languages_(std::move(languages)) {}

const Language* LanguageTable::Find(const std::string& name) const {
    for (const auto& language : languages_) {
        if (language.name == name) {
            return &language;
        }
    }
    return nullptr;
}

std::vector<std::string> LanguageTable::Names() const {
    std::vector<std::string> names;
    names.reserve(languages_.size());
    for (const auto& language : languages_) {
        names.push_back(language.name);
    }
    return names;
}

LanguageTable BuildLanguageTable(const runbox::config::RunnerConfig& config) {
    return LanguageTable({Language{kDefaultLanguage, config.python_interpreter}});
}

}  // namespace runbox::runner
