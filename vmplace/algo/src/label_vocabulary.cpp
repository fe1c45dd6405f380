#include <vmplace/algo/label_vocabulary.hpp>

#include <vmplace/core/error.hpp>

#include <algorithm>
#include <iterator>
#include <utility>

namespace vmplace::algo {

LabelVocabulary::LabelVocabulary(std::vector<std::string> labels)
    : classes_(std::move(labels)) {
    std::sort(classes_.begin(), classes_.end());
    classes_.erase(std::unique(classes_.begin(), classes_.end()), classes_.end());
}

int LabelVocabulary::transform(std::string_view label) const {
    auto it = std::lower_bound(classes_.begin(), classes_.end(), label);
    if (it == classes_.end() || *it != label) {
        throw core::UnknownCategoryError(std::string(label));
    }
    return static_cast<int>(std::distance(classes_.begin(), it));
}

const std::string& LabelVocabulary::inverse_transform(int code) const {
    if (code < 0 || static_cast<std::size_t>(code) >= classes_.size()) {
        throw core::UnknownCategoryError("code " + std::to_string(code));
    }
    return classes_[static_cast<std::size_t>(code)];
}

bool LabelVocabulary::contains(std::string_view label) const {
    return std::binary_search(classes_.begin(), classes_.end(), label);
}

} // namespace vmplace::algo
