#include <vmplace/algo/tree_ensemble_predictor.hpp>

#include <vmplace/core/error.hpp>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <utility>

namespace vmplace::algo {

TreeEnsemblePredictor::TreeEnsemblePredictor(std::string name, std::vector<std::string> classes,
                                             std::vector<DecisionTree> trees)
    : name_(std::move(name))
    , classes_(std::move(classes)) {
    if (trees.empty()) {
        throw core::InvalidInputError("model '" + name_ + "': at least one tree is required");
    }

    bool collect_classes = classes_.empty();
    auto class_index_of = [&](const std::string& label, const std::string& ctx) -> std::size_t {
        auto it = std::find(classes_.begin(), classes_.end(), label);
        if (it != classes_.end()) {
            return static_cast<std::size_t>(std::distance(classes_.begin(), it));
        }
        if (!collect_classes) {
            throw core::InvalidInputError(ctx + ": leaf label '" + label + "' is not a class");
        }
        classes_.push_back(label);
        return classes_.size() - 1;
    };

    trees_.reserve(trees.size());
    for (std::size_t t = 0; t < trees.size(); ++t) {
        const auto& tree = trees[t];
        std::string tctx = "model '" + name_ + "' tree " + std::to_string(t);
        if (tree.empty()) {
            throw core::InvalidInputError(tctx + ": tree has no nodes");
        }

        std::vector<CompiledNode> compiled;
        compiled.reserve(tree.size());
        for (std::size_t n = 0; n < tree.size(); ++n) {
            const auto& node = tree[n];
            std::string nctx = tctx + " node " + std::to_string(n);

            if (node.is_leaf()) {
                compiled.push_back(CompiledNode{TreeNode::LEAF, 0.0, 0, 0,
                                                class_index_of(node.label, nctx)});
                continue;
            }

            if (node.feature < 0 || static_cast<std::size_t>(node.feature) >= FEATURE_COUNT) {
                throw core::InvalidInputError(nctx + ": invalid feature index " +
                                              std::to_string(node.feature));
            }
            if (!std::isfinite(node.threshold)) {
                throw core::InvalidInputError(nctx + ": threshold must be finite");
            }
            if (node.left <= n || node.right <= n || node.left >= tree.size() ||
                node.right >= tree.size()) {
                throw core::InvalidInputError(nctx + ": children must be later nodes of the tree");
            }
            compiled.push_back(CompiledNode{node.feature, node.threshold, node.left, node.right, 0});
        }
        trees_.push_back(std::move(compiled));
    }
}

std::size_t TreeEnsemblePredictor::evaluate(const std::vector<CompiledNode>& tree,
                                            const FeatureVector& features) const {
    std::size_t idx = 0;
    while (tree[idx].feature != TreeNode::LEAF) {
        const auto& node = tree[idx];
        idx = features[static_cast<std::size_t>(node.feature)] <= node.threshold ? node.left
                                                                                  : node.right;
    }
    return tree[idx].class_index;
}

std::string TreeEnsemblePredictor::predict(const FeatureVector& features) const {
    std::vector<std::size_t> votes(classes_.size(), 0);
    for (const auto& tree : trees_) {
        ++votes[evaluate(tree, features)];
    }

    // max_element returns the first maximum: ties go to the earlier class
    auto best = std::max_element(votes.begin(), votes.end());
    return classes_[static_cast<std::size_t>(std::distance(votes.begin(), best))];
}

} // namespace vmplace::algo
