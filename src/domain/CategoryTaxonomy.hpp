/**
 * @file CategoryTaxonomy.hpp
 * @brief Read-only category → subcategory mapping used to validate labels.
 */

#pragma once
#include <string>
#include <utility>
#include <vector>

namespace ledgerwise::domain {

/**
 * @class CategoryTaxonomy
 * @brief Ordered categories, each with an ordered list of subcategories.
 *
 * An empty taxonomy accepts every label.
 */
class CategoryTaxonomy {
public:
    using Entry = std::pair<std::string, std::vector<std::string>>;

    CategoryTaxonomy() = default;
    explicit CategoryTaxonomy(std::vector<Entry> entries);

    /** @brief The built-in household taxonomy. */
    static CategoryTaxonomy Defaults();

    bool empty() const { return m_entries.empty(); }
    bool hasCategory(const std::string& category) const;
    bool hasSubcategory(const std::string& category, const std::string& subcategory) const;

    /** @brief True when the label may be produced: taxonomy empty, or category known. */
    bool accepts(const std::string& category) const;

    std::vector<std::string> categories() const;
    std::vector<std::string> subcategories(const std::string& category) const;

private:
    std::vector<Entry> m_entries;
};

} // namespace ledgerwise::domain
