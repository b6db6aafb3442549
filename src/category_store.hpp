#pragma once

#include <filesystem>
#include <map>
#include <string>

using CategoryMap = std::map<std::string, std::string>;

// Where the app -> category mapping lives between runs.
class CategoryStore {
  public:
    virtual ~CategoryStore() = default;

    // Never throws for a missing or corrupt document; returns what could be recovered.
    virtual CategoryMap Load() = 0;

    // Throws PersistenceError.
    virtual void Save(const CategoryMap &map) = 0;

    virtual std::string Describe() const = 0;
};

// { "<app>": "<category>", ... }, written pretty-printed and replaced atomically.
class JsonCategoryStore : public CategoryStore {
  public:
    explicit JsonCategoryStore(std::filesystem::path path);

    CategoryMap Load() override;
    void Save(const CategoryMap &map) override;
    std::string Describe() const override;

  private:
    std::filesystem::path m_Path;
};
