#include "fastxls/reader/HyperlinkIndex.hpp"

namespace fastxls {
namespace reader {

void HyperlinkIndex::add(const biff::Hyperlink& link) {
    if (link.first_row == link.last_row && link.first_col == link.last_col) {
        cells_.emplace(std::make_pair(link.first_row, link.first_col), link.target());
    } else {
        ranges_.push_back(link);
    }
}

std::optional<std::string> HyperlinkIndex::find(uint16_t row, uint16_t col) const {
    auto it = cells_.find(std::make_pair(row, col));
    if (it != cells_.end()) {
        return it->second;
    }
    for (const auto& link : ranges_) {
        if (link.contains(row, col)) {
            return link.target();
        }
    }
    return std::nullopt;
}

}} // namespace fastxls::reader
