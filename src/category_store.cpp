#include "category_store.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <fstream>

#include <unistd.h>

#include "errors.hpp"

// ─────────────────────────────────────
JsonCategoryStore::JsonCategoryStore(std::filesystem::path path) : m_Path(std::move(path)) {}

// ─────────────────────────────────────
std::string JsonCategoryStore::Describe() const {
    return m_Path.string();
}

// ─────────────────────────────────────
CategoryMap JsonCategoryStore::Load() {
    CategoryMap map;

    std::error_code ec;
    if (!std::filesystem::exists(m_Path, ec)) {
        spdlog::debug("Category file {} does not exist, starting empty", m_Path.string());
        return map;
    }

    std::ifstream file(m_Path);
    if (!file.is_open()) {
        spdlog::warn("Cannot read category file {}: {}", m_Path.string(), std::strerror(errno));
        return map;
    }

    nlohmann::json doc;
    try {
        file >> doc;
    } catch (const nlohmann::json::exception &e) {
        spdlog::warn("Category file {} is not valid JSON ({}), starting empty", m_Path.string(),
                     e.what());
        return map;
    }

    if (!doc.is_object()) {
        spdlog::warn("Category file {} is not a JSON object, starting empty", m_Path.string());
        return map;
    }

    for (const auto &[app, category] : doc.items()) {
        if (!category.is_string() || category.get<std::string>().empty()) {
            spdlog::warn("Ignoring category entry for '{}' in {}: not a non-empty string", app,
                         m_Path.string());
            continue;
        }
        map[app] = category.get<std::string>();
    }

    spdlog::debug("Loaded {} category mapping(s) from {}", map.size(), m_Path.string());
    return map;
}

// ─────────────────────────────────────
void JsonCategoryStore::Save(const CategoryMap &map) {
    nlohmann::json doc = nlohmann::json::object();
    for (const auto &[app, category] : map) {
        doc[app] = category;
    }

    // App names come from the log as raw bytes; the dump fails on invalid UTF-8.
    std::string text;
    try {
        text = doc.dump(4);
    } catch (const nlohmann::json::exception &e) {
        throw PersistenceError("cannot encode category file " + m_Path.string() + ": " +
                               e.what());
    }

    std::filesystem::path tmp = m_Path;
    tmp += ".tmp." + std::to_string(::getpid());

    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            throw PersistenceError("cannot write category file " + tmp.string() + ": " +
                                   std::strerror(errno));
        }
        out << text << '\n';
        out.flush();
        if (!out) {
            std::error_code ignored;
            std::filesystem::remove(tmp, ignored);
            throw PersistenceError("error while writing category file " + tmp.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, m_Path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        throw PersistenceError("cannot replace category file " + m_Path.string() + ": " +
                               ec.message());
    }
    spdlog::debug("Saved {} category mapping(s) to {}", map.size(), m_Path.string());
}
