#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "category_store.hpp"

#define MAX_PROMPT_ATTEMPTS 3

// Asked for apps without a mapping. Receives the app and the categories already in use;
// returns the chosen label. Throwing or returning a blank answer counts as a failed attempt.
using CategoryPrompt =
    std::function<std::string(const std::string &app, const std::vector<std::string> &known)>;

class CategoryResolver {
  public:
    CategoryResolver(CategoryStore &store, CategoryPrompt prompt, bool strict = false,
                     int maxPromptAttempts = MAX_PROMPT_ATTEMPTS);

    // Mapped category for app, prompting (and persisting the answer) the first time an app
    // is seen. Throws UnresolvedCategoryError, or PersistenceError in strict mode.
    std::string Resolve(const std::string &app);

    // Explicit override, persisted immediately. Throws std::invalid_argument on a blank
    // category.
    void EditMapping(const std::string &app, const std::string &category);

    std::vector<std::string> KnownCategories() const;
    const CategoryMap &GetMap() const;

    // False while some change exists only in memory.
    bool IsDurable() const;
    std::size_t GetUnsavedChanges() const;

  private:
    std::string Prompt(const std::string &app);
    void Persist();

  private:
    CategoryStore &m_Store;
    CategoryPrompt m_Prompt;
    CategoryMap m_Map;
    bool m_Strict;
    int m_MaxPromptAttempts;
    std::size_t m_UnsavedChanges = 0;
};
