#pragma once

#include <algorithm>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace radix {

/**
 * @brief One node of a compressed prefix tree.
 *
 * A node stores the edge label leading to it from its parent, an optional value,
 * and its children. Children are kept in a vector of (first byte, child) pairs
 * sorted by the first byte of each child's label, so lookup is a binary search
 * and in-order enumeration is a plain scan. Most nodes have only a handful of
 * children, so the sorted vector is both smaller and faster than a 256-slot array.
 *
 * The node store makes no structural decisions: splitting, merging and the
 * compression invariant are maintained by RadixTree.
 *
 * @tparam Value The stored value type.
 */
template<typename Value>
class RadixNode {
public:
    using child_entry = std::pair<unsigned char, std::unique_ptr<RadixNode>>;

    /**
     * @brief Construct a valueless node with the given label.
     * @param label Edge label from the parent (empty only for the root)
     */
    explicit RadixNode(std::string label = std::string());

    /**
     * @brief Construct a node holding a value.
     * @param label Edge label from the parent
     * @param value The value to store
     */
    RadixNode(std::string label, Value value);

    RadixNode(const RadixNode&) = delete;
    RadixNode& operator=(const RadixNode&) = delete;
    RadixNode(RadixNode&&) = default;
    RadixNode& operator=(RadixNode&&) = default;

    const std::string& label() const { return label_; }

    /**
     * @brief First byte of the label. Undefined for the root.
     */
    unsigned char first_byte() const { return static_cast<unsigned char>(label_[0]); }

    /**
     * @brief Replace the label. Used when a split shortens a label or a merge
     *        concatenates two.
     * @note Never allocates.
     */
    void set_label(std::string label) { label_ = std::move(label); }

    bool has_value() const { return value_.has_value(); }
    Value* value() { return value_ ? &*value_ : nullptr; }
    const Value* value() const { return value_ ? &*value_ : nullptr; }

    /**
     * @brief Store a value, returning the one it replaces (if any).
     */
    std::optional<Value> set_value(Value value);

    /**
     * @brief Store a value constructed in place. The node must not hold a value.
     */
    template<typename... Args>
    Value& emplace_value(Args&&... args);

    /**
     * @brief Move the value out, leaving the node valueless.
     * @return The removed value, or std::nullopt if the node held none
     */
    std::optional<Value> take_value();

    size_t child_count() const { return children_.size(); }
    bool has_children() const { return !children_.empty(); }

    /**
     * @brief Access a child by position in first-byte order.
     * @param index Position, less than child_count()
     */
    RadixNode* child_at(size_t index) { return children_[index].second.get(); }
    const RadixNode* child_at(size_t index) const { return children_[index].second.get(); }

    /**
     * @brief Find the child whose label begins with @p byte.
     * @return The child, or nullptr if there is none
     */
    RadixNode* find_child(unsigned char byte);
    const RadixNode* find_child(unsigned char byte) const;

    /**
     * @brief Attach a child. No child with the same first byte may exist.
     * @param child Node with a non-empty label
     *
     * @exception_safety Strong guarantee. Cannot throw when capacity was reserved.
     */
    void add_child(std::unique_ptr<RadixNode> child);

    /**
     * @brief Put @p child in place of the existing child sharing its first byte.
     * @return The displaced child
     * @note Never allocates.
     */
    std::unique_ptr<RadixNode> replace_child(std::unique_ptr<RadixNode> child);

    /**
     * @brief Detach and return the child whose label begins with @p byte.
     * @return The detached child, or nullptr if there was none
     */
    std::unique_ptr<RadixNode> remove_child(unsigned char byte);

    /**
     * @brief Detach every child, leaving this node a leaf.
     */
    std::vector<child_entry> release_children();

    void reserve_children(size_t count) { children_.reserve(count); }

private:
    using child_iterator = typename std::vector<child_entry>::iterator;
    using const_child_iterator = typename std::vector<child_entry>::const_iterator;

    child_iterator lower_bound(unsigned char byte);
    const_child_iterator lower_bound(unsigned char byte) const;

    std::string label_;
    std::optional<Value> value_;
    std::vector<child_entry> children_;   ///< Sorted by first byte, unique
};

/**
 * @brief Length of the longest common prefix of two byte strings.
 */
inline size_t common_prefix_length(std::string_view a, std::string_view b) {
    size_t limit = std::min(a.size(), b.size());
    if (a.compare(0, limit, b.substr(0, limit)) == 0) {
        return limit;
    }
    size_t i = 0;
    while (i < limit && a[i] == b[i]) {
        ++i;
    }
    return i;
}

template<typename Value>
RadixNode<Value>::RadixNode(std::string label) : label_(std::move(label)) {}

template<typename Value>
RadixNode<Value>::RadixNode(std::string label, Value value)
    : label_(std::move(label)), value_(std::move(value)) {}

template<typename Value>
std::optional<Value> RadixNode<Value>::set_value(Value value) {
    std::optional<Value> previous;
    if (value_) {
        previous.emplace(std::move(*value_));
        *value_ = std::move(value);
    } else {
        value_.emplace(std::move(value));
    }
    return previous;
}

template<typename Value>
template<typename... Args>
Value& RadixNode<Value>::emplace_value(Args&&... args) {
    return value_.emplace(std::forward<Args>(args)...);
}

template<typename Value>
std::optional<Value> RadixNode<Value>::take_value() {
    std::optional<Value> removed = std::move(value_);
    value_.reset();
    return removed;
}

template<typename Value>
typename RadixNode<Value>::child_iterator RadixNode<Value>::lower_bound(unsigned char byte) {
    return std::lower_bound(children_.begin(), children_.end(), byte,
                            [](const child_entry& entry, unsigned char b) { return entry.first < b; });
}

template<typename Value>
typename RadixNode<Value>::const_child_iterator RadixNode<Value>::lower_bound(unsigned char byte) const {
    return std::lower_bound(children_.begin(), children_.end(), byte,
                            [](const child_entry& entry, unsigned char b) { return entry.first < b; });
}

template<typename Value>
RadixNode<Value>* RadixNode<Value>::find_child(unsigned char byte) {
    auto it = lower_bound(byte);
    if (it == children_.end() || it->first != byte) {
        return nullptr;
    }
    return it->second.get();
}

template<typename Value>
const RadixNode<Value>* RadixNode<Value>::find_child(unsigned char byte) const {
    auto it = lower_bound(byte);
    if (it == children_.end() || it->first != byte) {
        return nullptr;
    }
    return it->second.get();
}

template<typename Value>
void RadixNode<Value>::add_child(std::unique_ptr<RadixNode> child) {
    unsigned char byte = child->first_byte();
    auto it = lower_bound(byte);
    children_.emplace(it, byte, std::move(child));
}

template<typename Value>
std::unique_ptr<RadixNode<Value>> RadixNode<Value>::replace_child(std::unique_ptr<RadixNode> child) {
    auto it = lower_bound(child->first_byte());
    std::swap(it->second, child);
    return child;
}

template<typename Value>
std::unique_ptr<RadixNode<Value>> RadixNode<Value>::remove_child(unsigned char byte) {
    auto it = lower_bound(byte);
    if (it == children_.end() || it->first != byte) {
        return nullptr;
    }
    std::unique_ptr<RadixNode> removed = std::move(it->second);
    children_.erase(it);
    return removed;
}

template<typename Value>
std::vector<typename RadixNode<Value>::child_entry> RadixNode<Value>::release_children() {
    std::vector<child_entry> released;
    released.swap(children_);
    return released;
}

} // namespace radix
