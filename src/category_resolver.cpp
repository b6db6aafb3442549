#include "category_resolver.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <set>
#include <stdexcept>

#include "errors.hpp"

namespace {

// ─────────────────────────────────────
std::string Trim(const std::string &s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) {
        ++b;
    }
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) {
        --e;
    }
    return s.substr(b, e - b);
}

} // namespace

// ─────────────────────────────────────
CategoryResolver::CategoryResolver(CategoryStore &store, CategoryPrompt prompt, bool strict,
                                   int maxPromptAttempts)
    : m_Store(store), m_Prompt(std::move(prompt)), m_Map(store.Load()), m_Strict(strict),
      m_MaxPromptAttempts(std::max(1, maxPromptAttempts)) {}

// ─────────────────────────────────────
std::string CategoryResolver::Resolve(const std::string &app) {
    auto it = m_Map.find(app);
    if (it != m_Map.end()) {
        return it->second;
    }

    const std::string category = Prompt(app);
    m_Map[app] = category;
    spdlog::info("Mapped '{}' to category '{}'", app, category);
    Persist();
    return category;
}

// ─────────────────────────────────────
void CategoryResolver::EditMapping(const std::string &app, const std::string &category) {
    const std::string label = Trim(category);
    if (label.empty()) {
        throw std::invalid_argument("category for '" + app + "' must not be empty");
    }
    m_Map[app] = label;
    spdlog::info("Category for '{}' set to '{}'", app, label);
    Persist();
}

// ─────────────────────────────────────
std::string CategoryResolver::Prompt(const std::string &app) {
    if (!m_Prompt) {
        throw UnresolvedCategoryError(app, "no category for '" + app + "' and no way to ask");
    }

    const std::vector<std::string> known = KnownCategories();
    for (int attempt = 1; attempt <= m_MaxPromptAttempts; ++attempt) {
        try {
            const std::string answer = Trim(m_Prompt(app, known));
            if (!answer.empty()) {
                return answer;
            }
            spdlog::warn("Empty category for '{}' (attempt {}/{})", app, attempt,
                         m_MaxPromptAttempts);
        } catch (const std::exception &e) {
            spdlog::warn("Category prompt for '{}' failed (attempt {}/{}): {}", app, attempt,
                         m_MaxPromptAttempts, e.what());
        }
    }

    spdlog::error("No category obtained for '{}' after {} attempt(s)", app, m_MaxPromptAttempts);
    throw UnresolvedCategoryError(app, "no category obtained for '" + app + "'");
}

// ─────────────────────────────────────
void CategoryResolver::Persist() {
    try {
        m_Store.Save(m_Map);
        m_UnsavedChanges = 0;
    } catch (const PersistenceError &e) {
        if (m_Strict) {
            throw;
        }
        ++m_UnsavedChanges;
        spdlog::warn("Category mapping kept in memory only: {}", e.what());
    }
}

// ─────────────────────────────────────
std::vector<std::string> CategoryResolver::KnownCategories() const {
    std::set<std::string> unique;
    for (const auto &[app, category] : m_Map) {
        unique.insert(category);
    }
    return {unique.begin(), unique.end()};
}

// ─────────────────────────────────────
const CategoryMap &CategoryResolver::GetMap() const {
    return m_Map;
}

// ─────────────────────────────────────
bool CategoryResolver::IsDurable() const {
    return m_UnsavedChanges == 0;
}

// ─────────────────────────────────────
std::size_t CategoryResolver::GetUnsavedChanges() const {
    return m_UnsavedChanges;
}
