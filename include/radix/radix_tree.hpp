#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "radix/radix_iterator.hpp"
#include "radix/radix_node.hpp"

namespace radix {

/**
 * @brief Compressed prefix tree engine keyed by byte strings.
 *
 * RadixTree owns the root node and the count of stored keys, and is the only
 * component that changes node structure. After every completed mutation:
 * - the root label is empty and every other label is non-empty
 * - no node has two children whose labels start with the same byte
 * - every non-root node holds a value or has at least two children
 * - size() equals the number of nodes holding a value
 *
 * Every walk (insert, lookup, remove, traversal, destruction) is iterative, so a
 * degenerate chain as long as the longest key cannot exhaust the native stack.
 *
 * @tparam Value The stored value type.
 *
 * @note Not internally synchronized. Any number of concurrent readers is fine;
 *       a writer needs exclusive access.
 */
template<typename Value>
class RadixTree {
public:
    using node_type = RadixNode<Value>;
    using iterator = RadixIterator<Value, false>;
    using const_iterator = RadixIterator<Value, true>;
    using range = RadixRange<Value, false>;
    using const_range = RadixRange<Value, true>;

    /**
     * @brief Default constructor. Creates a tree holding only the root.
     * @complexity O(1)
     */
    RadixTree();

    /**
     * @brief Destructor. Frees every node without recursion.
     * @complexity O(n) where n is the number of nodes
     */
    ~RadixTree();

    RadixTree(const RadixTree&) = delete;
    RadixTree& operator=(const RadixTree&) = delete;

    /**
     * @brief Move constructor. @p other is left empty.
     */
    RadixTree(RadixTree&& other);
    RadixTree& operator=(RadixTree&& other);

    /**
     * @brief Insert or overwrite the value for a key.
     *
     * @param key The key bytes; the empty key is stored on the root
     * @param value The value to store
     * @return The value previously stored under @p key, or std::nullopt
     * @complexity O(m) where m is the key length, plus a child vector insert
     * @exception_safety Strong guarantee for the tree structure: new nodes are
     *                   allocated before anything is relinked.
     */
    std::optional<Value> insert(std::string_view key, Value value);

    /**
     * @brief Construct a value in place unless the key is already present.
     *
     * @return Pointer to the stored value and whether it was newly constructed.
     *         Arguments are left untouched when the key already exists.
     */
    template<typename... Args>
    std::pair<Value*, bool> try_emplace(std::string_view key, Args&&... args);

    /**
     * @brief Look up the value stored under a key.
     * @return Pointer to the value, or nullptr if the key is absent
     * @complexity O(m) where m is the key length
     */
    Value* get(std::string_view key);
    const Value* get(std::string_view key) const;

    /**
     * @brief Remove a key, compacting the path to it.
     *
     * A leaf left without a value is detached from its parent, and a non-root
     * node left with no value and a single child is merged into that child. A
     * detachment can leave the parent in that state, so it is merged as well.
     * The root is never detached or merged.
     *
     * @return The removed value, or std::nullopt if the key was absent
     * @complexity O(m) where m is the key length
     * @exception_safety Strong guarantee for the tree structure: the merged label
     *                   is built before anything is unlinked.
     */
    std::optional<Value> remove(std::string_view key);

    /**
     * @brief Remove every key.
     */
    void clear();

    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

    iterator begin() { return iterator(&root_, std::string()); }
    iterator end() { return iterator(); }
    const_iterator begin() const { return const_iterator(&root_, std::string()); }
    const_iterator end() const { return const_iterator(); }

    /**
     * @brief All entries whose key starts with @p prefix, in key order.
     *
     * The prefix may end in the middle of an edge label; the whole subtree below
     * that edge then matches.
     *
     * @complexity O(p) to locate the subtree, where p is the prefix length
     */
    range starting_with(std::string_view prefix);
    const_range starting_with(std::string_view prefix) const;

    /**
     * @brief Find the longest stored key that is a prefix of @p word.
     * @return The key, or std::nullopt if no stored key is a prefix of @p word
     */
    std::optional<std::string> longest_prefix(std::string_view word) const;

    /**
     * @brief Visit every node, root first, in key order.
     * @param func Called as func(const node_type& node, size_t depth)
     */
    template<typename Func>
    void for_each_node(Func&& func) const;

    /**
     * @brief Count the nodes in the tree, root included.
     * @complexity O(n)
     */
    size_t node_count() const;

    const node_type& root() const { return root_; }

    void swap(RadixTree& other);

private:
    template<typename... Args>
    std::pair<node_type*, bool> emplace_node(std::string_view key, Args&&... args);

    const node_type* locate(std::string_view key) const;

    /**
     * @brief Find the subtree matching a prefix.
     * @return The subtree root and the number of prefix bytes preceding its
     *         label, or nullptr if nothing matches
     */
    template<typename NodeT>
    static std::pair<NodeT*, size_t> find_prefix(NodeT& root, std::string_view prefix);

    static unsigned char byte_at(std::string_view s, size_t i) { return static_cast<unsigned char>(s[i]); }

    node_type root_;
    size_t size_;
};

template<typename Value>
RadixTree<Value>::RadixTree() : size_(0) {}

template<typename Value>
RadixTree<Value>::~RadixTree() {
    clear();
}

template<typename Value>
RadixTree<Value>::RadixTree(RadixTree&& other) : size_(0) {
    swap(other);
}

template<typename Value>
RadixTree<Value>& RadixTree<Value>::operator=(RadixTree&& other) {
    if (this != &other) {
        clear();
        swap(other);
    }
    return *this;
}

template<typename Value>
void RadixTree<Value>::swap(RadixTree& other) {
    std::swap(root_, other.root_);
    std::swap(size_, other.size_);
}

template<typename Value>
std::optional<Value> RadixTree<Value>::insert(std::string_view key, Value value) {
    auto result = emplace_node(key, std::move(value));
    if (result.second) {
        return std::nullopt;
    }
    // emplace_node leaves its arguments alone when the key exists
    return result.first->set_value(std::move(value));
}

template<typename Value>
template<typename... Args>
std::pair<Value*, bool> RadixTree<Value>::try_emplace(std::string_view key, Args&&... args) {
    auto result = emplace_node(key, std::forward<Args>(args)...);
    return {result.first->value(), result.second};
}

template<typename Value>
template<typename... Args>
std::pair<typename RadixTree<Value>::node_type*, bool>
RadixTree<Value>::emplace_node(std::string_view key, Args&&... args) {
    node_type* node = &root_;
    std::string_view rest = key;

    while (!rest.empty()) {
        node_type* child = node->find_child(byte_at(rest, 0));
        if (!child) {
            auto leaf = std::make_unique<node_type>(std::string(rest));
            leaf->emplace_value(std::forward<Args>(args)...);
            node_type* created = leaf.get();
            node->add_child(std::move(leaf));
            ++size_;
            return {created, true};
        }

        size_t lcp = common_prefix_length(rest, child->label());
        if (lcp == child->label().size()) {
            rest.remove_prefix(lcp);
            node = child;
            continue;
        }

        // The key diverges inside the child's label (or ends there): split it
        auto branch = std::make_unique<node_type>(std::string(rest.substr(0, lcp)));
        branch->reserve_children(2);
        node_type* split = branch.get();
        node_type* created = split;
        std::unique_ptr<node_type> leaf;
        if (lcp == rest.size()) {
            branch->emplace_value(std::forward<Args>(args)...);
        } else {
            leaf = std::make_unique<node_type>(std::string(rest.substr(lcp)));
            leaf->emplace_value(std::forward<Args>(args)...);
            created = leaf.get();
        }

        // A fresh string, so the old node does not keep the split-off capacity
        std::string remainder = child->label().substr(lcp);

        // No allocation from here on
        std::unique_ptr<node_type> old = node->replace_child(std::move(branch));
        old->set_label(std::move(remainder));
        split->add_child(std::move(old));
        if (leaf) {
            split->add_child(std::move(leaf));
        }
        ++size_;
        return {created, true};
    }

    if (node->has_value()) {
        return {node, false};
    }
    node->emplace_value(std::forward<Args>(args)...);
    ++size_;
    return {node, true};
}

template<typename Value>
const typename RadixTree<Value>::node_type* RadixTree<Value>::locate(std::string_view key) const {
    const node_type* node = &root_;
    while (!key.empty()) {
        const node_type* child = node->find_child(byte_at(key, 0));
        if (!child) {
            return nullptr;
        }
        const std::string& label = child->label();
        if (key.size() < label.size() || key.compare(0, label.size(), label) != 0) {
            return nullptr;
        }
        key.remove_prefix(label.size());
        node = child;
    }
    return node;
}

template<typename Value>
Value* RadixTree<Value>::get(std::string_view key) {
    return const_cast<Value*>(static_cast<const RadixTree*>(this)->get(key));
}

template<typename Value>
const Value* RadixTree<Value>::get(std::string_view key) const {
    const node_type* node = locate(key);
    return node ? node->value() : nullptr;
}

template<typename Value>
std::optional<Value> RadixTree<Value>::remove(std::string_view key) {
    std::vector<node_type*> path;
    path.push_back(&root_);

    std::string_view rest = key;
    while (!rest.empty()) {
        node_type* child = path.back()->find_child(byte_at(rest, 0));
        if (!child) {
            return std::nullopt;
        }
        const std::string& label = child->label();
        if (rest.size() < label.size() || rest.compare(0, label.size(), label) != 0) {
            return std::nullopt;
        }
        rest.remove_prefix(label.size());
        path.push_back(child);
    }

    node_type* target = path.back();
    if (!target->has_value()) {
        return std::nullopt;
    }

    // Work out the compaction before changing anything. Clearing the value can
    // leave the target with one child (merge it), or with none (detach it, which
    // may leave a valueless parent with one child to merge). Merging never
    // changes the grandparent's child count, so nothing cascades further.
    size_t depth = path.size() - 1;
    node_type* detach_from = nullptr;
    node_type* merge_node = nullptr;
    node_type* merge_parent = nullptr;
    const node_type* survivor = nullptr;

    if (depth > 0) {
        if (target->child_count() == 0) {
            detach_from = path[depth - 1];
            if (depth > 1 && !detach_from->has_value() && detach_from->child_count() == 2) {
                merge_node = detach_from;
                merge_parent = path[depth - 2];
                survivor = merge_node->child_at(0) == target ? merge_node->child_at(1) : merge_node->child_at(0);
            }
        } else if (target->child_count() == 1) {
            merge_node = target;
            merge_parent = path[depth - 1];
            survivor = target->child_at(0);
        }
    }

    std::string merged_label;
    if (merge_node) {
        merged_label.reserve(merge_node->label().size() + survivor->label().size());
        merged_label.append(merge_node->label());
        merged_label.append(survivor->label());
    }

    std::optional<Value> removed = target->take_value();
    --size_;

    if (detach_from) {
        detach_from->remove_child(target->first_byte());
    }
    if (merge_node) {
        std::vector<typename node_type::child_entry> remaining = merge_node->release_children();
        std::unique_ptr<node_type> child = std::move(remaining.front().second);
        child->set_label(std::move(merged_label));
        // Drops merge_node, which no longer has children
        merge_parent->replace_child(std::move(child));
    }
    return removed;
}

template<typename Value>
void RadixTree<Value>::clear() {
    std::vector<typename node_type::child_entry> pending = root_.release_children();
    while (!pending.empty()) {
        std::unique_ptr<node_type> node = std::move(pending.back().second);
        pending.pop_back();
        for (auto& entry : node->release_children()) {
            pending.push_back(std::move(entry));
        }
    }
    root_.take_value();
    size_ = 0;
}

template<typename Value>
template<typename NodeT>
std::pair<NodeT*, size_t> RadixTree<Value>::find_prefix(NodeT& root, std::string_view prefix) {
    NodeT* node = &root;
    size_t consumed = 0;
    while (consumed < prefix.size()) {
        NodeT* child = node->find_child(byte_at(prefix, consumed));
        if (!child) {
            return {nullptr, 0};
        }
        std::string_view rest = prefix.substr(consumed);
        size_t lcp = common_prefix_length(rest, child->label());
        if (lcp == rest.size()) {
            return {child, consumed};
        }
        if (lcp < child->label().size()) {
            return {nullptr, 0};
        }
        consumed += lcp;
        node = child;
    }
    return {node, 0};
}

template<typename Value>
typename RadixTree<Value>::range RadixTree<Value>::starting_with(std::string_view prefix) {
    auto found = find_prefix(root_, prefix);
    if (!found.first) {
        return range();
    }
    return range(found.first, std::string(prefix.substr(0, found.second)));
}

template<typename Value>
typename RadixTree<Value>::const_range RadixTree<Value>::starting_with(std::string_view prefix) const {
    auto found = find_prefix(root_, prefix);
    if (!found.first) {
        return const_range();
    }
    return const_range(found.first, std::string(prefix.substr(0, found.second)));
}

template<typename Value>
std::optional<std::string> RadixTree<Value>::longest_prefix(std::string_view word) const {
    const node_type* node = &root_;
    size_t consumed = 0;
    std::optional<size_t> best;
    if (node->has_value()) {
        best = 0;
    }

    while (consumed < word.size()) {
        node = node->find_child(byte_at(word, consumed));
        if (!node) {
            break;
        }
        const std::string& label = node->label();
        if (word.size() - consumed < label.size() || word.compare(consumed, label.size(), label) != 0) {
            break;
        }
        consumed += label.size();
        if (node->has_value()) {
            best = consumed;
        }
    }

    if (!best) {
        return std::nullopt;
    }
    return std::string(word.substr(0, *best));
}

template<typename Value>
template<typename Func>
void RadixTree<Value>::for_each_node(Func&& func) const {
    std::vector<std::pair<const node_type*, size_t>> stack;
    stack.emplace_back(&root_, 0);
    while (!stack.empty()) {
        auto [node, depth] = stack.back();
        stack.pop_back();
        func(*node, depth);
        for (size_t i = node->child_count(); i > 0; --i) {
            stack.emplace_back(node->child_at(i - 1), depth + 1);
        }
    }
}

template<typename Value>
size_t RadixTree<Value>::node_count() const {
    size_t count = 0;
    for_each_node([&count](const node_type&, size_t) { ++count; });
    return count;
}

} // namespace radix
