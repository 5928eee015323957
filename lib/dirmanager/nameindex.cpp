/**
 * @file nameindex.cpp
 * @brief Grouping of walk results by entry name
 */

#include "nameindex.hpp"

#include <algorithm>
#include <cctype>

void NameIndex::add(const std::string& name, const std::filesystem::path& path) {
    auto it = m_positions.find(name);
    if (it == m_positions.end()) {
        m_positions.emplace(name, m_groups.size());
        m_groups.push_back(Group{name, {path}});
        return;
    }
    m_groups[it->second].paths.push_back(path);
}

const NameIndex::Group* NameIndex::find(const std::string& name) const {
    auto it = m_positions.find(name);
    if (it == m_positions.end()) {
        return nullptr;
    }
    return &m_groups[it->second];
}

std::size_t NameIndex::entryCount() const {
    std::size_t total = 0;
    for (const auto& group : m_groups) {
        total += group.paths.size();
    }
    return total;
}

bool IndexFilter::matches(const Entry& entry) const {
    if (entry.getKind() != kind) {
        return false;
    }

    if (!name.empty() && entry.getName() != name) {
        return false;
    }

    if (!extension.empty() && (!entry.isFile() || entry.getExtension() != extension)) {
        return false;
    }

    return true;
}

std::string IndexFilter::normalizeExtension(std::string extension) {
    extension.erase(std::remove_if(extension.begin(), extension.end(), [](unsigned char ch) {
        return std::isspace(ch);
    }), extension.end());

    if (extension.empty()) {
        return {};
    }

    if (extension.front() != '.') {
        extension.insert(extension.begin(), '.');
    }

    std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return extension;
}

NameIndex NameIndexer::build(const TreeWalker& walker,
                             const std::filesystem::path& root,
                             const IndexFilter& filter) {
    NameIndex index;
    walker.walk(root, [&](const Entry& entry) {
        if (filter.matches(entry)) {
            index.add(entry.getName(), entry.getPath());
        }
    });
    return index;
}
