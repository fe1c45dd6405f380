#pragma once

#include <vmplace/algo/predictor.hpp>

#include <cstddef>
#include <span>
#include <string>
#include <vector>

namespace vmplace::algo {

/// @brief One node of an exported decision tree.
///
/// Split nodes route `x[feature] <= threshold` to @c left and everything
/// else to @c right. Leaf nodes have no feature and carry a label.
///
/// @ingroup algo_model
struct TreeNode {
    static constexpr int LEAF = -1;

    int feature{LEAF};
    double threshold{0.0};
    std::size_t left{0};
    std::size_t right{0};
    std::string label; ///< Predicted label (leaf nodes only).

    [[nodiscard]] bool is_leaf() const noexcept { return feature == LEAF; }
};

/// @brief A decision tree stored as a flat node array; node 0 is the root.
/// @ingroup algo_model
using DecisionTree = std::vector<TreeNode>;

/// @brief Majority-vote ensemble of decision trees.
/// @ingroup algo_model
///
/// A single tree is a plain decision tree; several trees form a random
/// forest style ensemble. Each tree votes for one label and the most voted
/// label wins. Ties go to the label listed first in classes().
///
/// Trees are validated at construction: children must point forward in
/// the node array (so evaluation always terminates), split features must
/// be valid feature indices and every leaf label must be a known class.
class TreeEnsemblePredictor : public Predictor {
public:
    /// @brief Build the ensemble.
    /// @param name     Display name.
    /// @param classes  Label order used for tie-breaking. If empty, labels
    ///                 are collected from the leaves in order of appearance.
    /// @param trees    At least one tree.
    /// @throws core::InvalidInputError if a tree is malformed.
    TreeEnsemblePredictor(std::string name, std::vector<std::string> classes,
                          std::vector<DecisionTree> trees);

    [[nodiscard]] std::string predict(const FeatureVector& features) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return name_; }

    [[nodiscard]] std::span<const std::string> classes() const noexcept { return classes_; }
    [[nodiscard]] std::size_t tree_count() const noexcept { return trees_.size(); }

private:
    // Leaf labels are resolved to class indices once, at construction
    struct CompiledNode {
        int feature;
        double threshold;
        std::size_t left;
        std::size_t right;
        std::size_t class_index;
    };

    [[nodiscard]] std::size_t evaluate(const std::vector<CompiledNode>& tree,
                                       const FeatureVector& features) const;

    std::string name_;
    std::vector<std::string> classes_;
    std::vector<std::vector<CompiledNode>> trees_;
};

} // namespace vmplace::algo
