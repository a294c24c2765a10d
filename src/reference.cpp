#include "reference.hpp"

#include <sstream>

namespace ocdb {

std::string
Reference::to_string() const {
    std::ostringstream ss;
    for (size_t i = 0; i < authors.size(); ++i) {
        if (i > 0) { ss << ", "; }
        ss << authors[i];
    }
    if (!authors.empty() && !title.empty()) { ss << ": "; }
    ss << title;

    std::string source = journal;
    if (!volume.empty()) { source += (source.empty() ? "" : " ") + volume; }
    if (!pages.empty()) { source += (volume.empty() ? (source.empty() ? "" : " ") : ":") + pages; }
    if (!year.empty()) { source += (source.empty() ? "" : ", ") + year; }

    std::string citation = ss.str();
    if (!source.empty()) { citation += (citation.empty() ? "" : ". ") + source; }
    if (!doi.empty()) { citation += (citation.empty() ? "" : ". ") + std::string("doi:") + doi; }
    return citation;
}

} // namespace ocdb
