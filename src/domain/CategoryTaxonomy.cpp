#include "domain/CategoryTaxonomy.hpp"
#include <algorithm>

namespace ledgerwise::domain {

CategoryTaxonomy::CategoryTaxonomy(std::vector<Entry> entries) : m_entries(std::move(entries)) {}

CategoryTaxonomy CategoryTaxonomy::Defaults() {
    return CategoryTaxonomy({
        {"Food & Drink", {"Groceries", "Restaurant", "Cafe"}},
        {"Transport", {"Fuel & Parking", "Public Transit", "Taxi"}},
        {"Housing", {"Rent & Bills", "Home Insurance", "Electricity"}},
        {"Shopping", {"Clothing", "Electronics", "Home & Garden"}},
        {"Entertainment", {"Cinema & Theatre", "Sports", "Hobby"}},
        {"Loans", {"Amortization", "Interest", "Loan Payment"}},
        {"Other", {"Uncategorized", "Transfers", "Fees"}}
    });
}

bool CategoryTaxonomy::hasCategory(const std::string& category) const {
    return std::any_of(m_entries.begin(), m_entries.end(),
                       [&](const Entry& e) { return e.first == category; });
}

bool CategoryTaxonomy::hasSubcategory(const std::string& category, const std::string& subcategory) const {
    for (const auto& [name, subs] : m_entries) {
        if (name == category) {
            return std::find(subs.begin(), subs.end(), subcategory) != subs.end();
        }
    }
    return false;
}

bool CategoryTaxonomy::accepts(const std::string& category) const {
    return m_entries.empty() || hasCategory(category);
}

std::vector<std::string> CategoryTaxonomy::categories() const {
    std::vector<std::string> out;
    out.reserve(m_entries.size());
    for (const auto& entry : m_entries) {
        out.push_back(entry.first);
    }
    return out;
}

std::vector<std::string> CategoryTaxonomy::subcategories(const std::string& category) const {
    for (const auto& [name, subs] : m_entries) {
        if (name == category) return subs;
    }
    return {};
}

} // namespace ledgerwise::domain
