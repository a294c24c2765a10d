#ifndef REFERENCE_HPP
#define REFERENCE_HPP

#include <string>
#include <vector>

namespace ocdb {

/**
 * @brief Bibliographic record for a dataset or the publication describing it.
 */
struct Reference {
    std::string key;                  ///< Citation key, e.g. "saadeh-optik-273-170455".
    std::string type = "article";     ///< Entry type.
    std::vector<std::string> authors; ///< Authors in publication order.
    std::string title;
    std::string journal;
    std::string volume;
    std::string pages;
    std::string year;
    std::string doi;

    /**
     * @brief Human-readable citation as found in the reference section of a publication.
     *
     * Format: "A. Author, B. Author: Title. Journal Volume:Pages, Year. doi:DOI".
     * Parts that are empty are left out together with their separators.
     */
    std::string to_string() const;
};

} // namespace ocdb

#endif // REFERENCE_HPP
