#include "collection.hpp"
#include "errors.hpp"

#include <cctype>
#include <iostream>
#include <stdexcept>

namespace ocdb {

bool
is_valid_symbol(const std::string &symbol) {
    if (symbol.empty()) { return false; }
    const auto first = static_cast<unsigned char>(symbol.front());
    if (!std::isalpha(first) && first != '_') { return false; }
    for (char c : symbol) {
        const auto uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && uc != '_') { return false; }
    }
    return true;
}

Collection::Collection(DuplicatePolicy policy)
  : policy_(policy) {}

void
Collection::add_item(Material item) {
    if (item.symbol.empty()) { throw MissingInput("Material has no symbol", "symbol"); }
    if (!is_valid_symbol(item.symbol)) {
        throw std::invalid_argument("Invalid material symbol '" + item.symbol +
                                    "': must start with a letter or underscore and contain only letters, digits "
                                    "and underscores.");
    }

    auto it = index_.find(item.symbol);
    if (it == index_.end()) {
        index_.emplace(item.symbol, items_.size());
        items_.push_back(std::move(item));
        return;
    }

    if (policy_ == DuplicatePolicy::Reject) { throw DuplicateSymbol(item.symbol); }
    std::cerr << "Warning: Replacing material '" << item.symbol << "'"
              << (name.empty() ? std::string() : " in collection '" + name + "'") << "." << std::endl;
    items_[it->second] = std::move(item);
}

const Material &
Collection::at(const std::string &symbol) const {
    auto it = index_.find(symbol);
    if (it == index_.end()) {
        throw std::out_of_range("No material with symbol '" + symbol + "' in collection" +
                                (name.empty() ? std::string() : " '" + name + "'"));
    }
    return items_[it->second];
}

const Material *
Collection::find(const std::string &symbol) const {
    auto it = index_.find(symbol);
    return it == index_.end() ? nullptr : &items_[it->second];
}

std::vector<std::string>
Collection::symbols() const {
    std::vector<std::string> result;
    result.reserve(items_.size());
    for (const auto &item : items_) { result.push_back(item.symbol); }
    return result;
}

} // namespace ocdb
