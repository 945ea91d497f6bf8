//
// Ordering of chunk indices and rasterized page names
//

#include "OrderKey.h"
#include <algorithm>
#include <cctype>

namespace {
    auto isInteger(const std::string& value) -> bool {
        return !value.empty() && std::all_of(value.begin(), value.end(), [](unsigned char character) {
            return std::isdigit(character) != 0;
        });
    }

    // Strips leading zeros so that numeric comparison doesn't depend on padding or overflow
    auto significantDigits(const std::string& value) -> std::string {
        auto first = value.find_first_not_of('0');
        return first == std::string::npos ? std::string("0") : value.substr(first);
    }
}

auto orderKeyLess(const std::string& left, const std::string& right) -> bool {
    auto leftIsInteger = isInteger(left);
    auto rightIsInteger = isInteger(right);

    if (leftIsInteger && rightIsInteger) {
        auto leftDigits = significantDigits(left);
        auto rightDigits = significantDigits(right);

        // Compare by magnitude first, then digit by digit
        if (leftDigits.size() != rightDigits.size()) {
            return leftDigits.size() < rightDigits.size();
        }

        if (leftDigits != rightDigits) {
            return leftDigits < rightDigits;
        }

        // "007" and "7" are numerically equal, keep the ordering strict and deterministic
        return left < right;
    }

    if (leftIsInteger != rightIsInteger) {
        return leftIsInteger;
    }

    return left < right;
}

auto orderKeyFromName(const std::string& name, const std::string& prefix) -> std::string {
    auto key = name;
    if (!prefix.empty() && key.rfind(prefix, 0) == 0) {
        key.erase(0, prefix.size());
    }

    // pdftoppm names pages "<prefix>-<n>.png"
    if (!key.empty() && key.front() == '-') {
        key.erase(0, 1);
    }

    auto dot = key.find('.');
    if (dot != std::string::npos) {
        key.erase(dot);
    }

    return key;
}

void sortByOrderKey(std::vector<std::filesystem::path>& paths, const std::string& prefix) {
    std::sort(paths.begin(), paths.end(), [&prefix](const auto& left, const auto& right) {
        return orderKeyLess(
                orderKeyFromName(left.filename().string(), prefix),
                orderKeyFromName(right.filename().string(), prefix)
        );
    });
}
