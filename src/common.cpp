#include "skillmint/common.hpp"
#include <cctype>

namespace skillmint {

std::string normalize_tag(const std::string& tag) {
    size_t begin = 0;
    size_t end = tag.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(tag[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(tag[end - 1]))) {
        --end;
    }

    std::string normalized;
    normalized.reserve(end - begin);
    for (size_t i = begin; i < end; ++i) {
        normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(tag[i]))));
    }
    return normalized;
}

} // namespace skillmint
