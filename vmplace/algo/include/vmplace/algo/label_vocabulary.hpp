#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace vmplace::algo {

/// @brief Fixed category -> integer encoding produced at training time.
/// @ingroup algo_model
///
/// Classes are kept sorted and a label's code is its position in that
/// order, which is how the training tooling assigned codes. The mapping
/// never changes after construction.
///
/// @see FeatureBuilder
class LabelVocabulary {
public:
    LabelVocabulary() = default;

    /// @brief Build the vocabulary from a list of labels.
    ///
    /// Labels are sorted and deduplicated.
    explicit LabelVocabulary(std::vector<std::string> labels);

    /// @brief Encode a label.
    /// @throws core::UnknownCategoryError if @p label is not a known class.
    [[nodiscard]] int transform(std::string_view label) const;

    /// @brief Decode an integer code back to its label.
    /// @throws core::UnknownCategoryError if @p code is not a valid code.
    [[nodiscard]] const std::string& inverse_transform(int code) const;

    [[nodiscard]] bool contains(std::string_view label) const;

    /// @brief Known classes, in code order.
    [[nodiscard]] std::span<const std::string> classes() const noexcept { return classes_; }

    [[nodiscard]] std::size_t size() const noexcept { return classes_.size(); }
    [[nodiscard]] bool empty() const noexcept { return classes_.empty(); }

private:
    std::vector<std::string> classes_;
};

} // namespace vmplace::algo
