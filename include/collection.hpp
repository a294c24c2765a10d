#ifndef COLLECTION_HPP
#define COLLECTION_HPP

#include "material.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace ocdb {

/**
 * @brief What Collection::add_item does with a symbol that is already taken.
 */
enum class DuplicatePolicy {
    Reject, ///< Throw DuplicateSymbol.
    Replace ///< Replace the earlier Material in place (a warning is written to std::cerr).
};

/**
 * @brief Collection of materials, keyed by their unique symbol.
 *
 * Iteration yields the materials in insertion order. A collection is built
 * once by a loader and treated as read-only afterwards.
 *
 * Example:
 * @code
 *   for (const auto &material : collection) {
 *       std::cout << material.symbol << " " << material.name << '\n';
 *   }
 *   const Material &cobalt = collection.at("Co");
 * @endcode
 */
class Collection {
  public:
    using const_iterator = std::vector<Material>::const_iterator;

    explicit Collection(DuplicatePolicy policy = DuplicatePolicy::Reject);

    std::string name; ///< e.g. "elements" or "compositions"

    /**
     * @brief Add a material, using its symbol as key.
     *
     * @throws MissingInput if the symbol is empty.
     * @throws std::invalid_argument if the symbol is not identifier-like
     *         (letter or underscore, followed by letters, digits or underscores).
     * @throws DuplicateSymbol if the symbol is taken and the policy is Reject.
     */
    void add_item(Material item);

    bool contains(const std::string &symbol) const { return index_.count(symbol) > 0; }

    /**
     * @brief Material with the given symbol.
     * @throws std::out_of_range if no such material exists.
     */
    const Material &at(const std::string &symbol) const;

    /**
     * @brief Material with the given symbol, or nullptr.
     */
    const Material *find(const std::string &symbol) const;

    /// Symbols in insertion order.
    std::vector<std::string> symbols() const;

    std::size_t size() const { return items_.size(); }
    bool empty() const { return items_.empty(); }
    DuplicatePolicy duplicate_policy() const { return policy_; }

    const_iterator begin() const { return items_.begin(); }
    const_iterator end() const { return items_.end(); }

  private:
    std::vector<Material> items_;
    std::map<std::string, std::size_t> index_; // symbol -> position in items_
    DuplicatePolicy policy_;
};

/**
 * @brief Whether the symbol is usable as a collection key (identifier-like, case-sensitive).
 */
bool
is_valid_symbol(const std::string &symbol);

} // namespace ocdb

#endif // COLLECTION_HPP
