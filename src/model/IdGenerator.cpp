#include "starmap/model/IdGenerator.h"

#include <algorithm>
#include <cctype>
#include <format>

namespace starmap {

std::string IdGenerator::next() {
    return std::format("{}-{:06}", prefix_, ++counter_);
}

void IdGenerator::observe(const std::string& existingId) {
    const std::string head = prefix_ + "-";
    if (existingId.size() <= head.size() || existingId.compare(0, head.size(), head) != 0) {
        return;
    }

    std::string digits = existingId.substr(head.size());
    bool numeric = digits.size() <= 18 &&
        std::all_of(digits.begin(), digits.end(),
                    [](unsigned char c) { return std::isdigit(c) != 0; });
    if (!numeric) {
        return;
    }
    counter_ = std::max<uint64_t>(counter_, std::stoull(digits));
}

}  // namespace starmap
