#pragma once

#include <cstddef>
#include <iterator>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "radix/radix_node.hpp"

namespace radix {

/**
 * @brief Ordered traversal over the value-holding nodes of a subtree.
 *
 * The iterator walks the subtree depth-first and pre-order, visiting children in
 * ascending order of their first byte. Because no two siblings share a first byte,
 * this visits keys in ascending byte-lexicographic order, and a key that is a
 * strict prefix of another is produced first.
 *
 * State is an explicit stack of pending nodes plus a path buffer holding the key of
 * the node being visited. Each stack entry remembers the path length at which its
 * label starts, so backtracking is a single truncation and no key is rebuilt from
 * the root. Traversal depth is therefore limited only by heap memory.
 *
 * @tparam Value The stored value type
 * @tparam Const true for read-only traversal
 *
 * @warning Mutating the tree while an iterator is in use is unsupported.
 */
template<typename Value, bool Const>
class RadixIterator {
public:
    using node_type = std::conditional_t<Const, const RadixNode<Value>, RadixNode<Value>>;
    using value_reference = std::conditional_t<Const, const Value&, Value&>;

    using iterator_category = std::input_iterator_tag;
    using value_type = std::pair<std::string, Value>;
    using difference_type = std::ptrdiff_t;
    using reference = std::pair<const std::string&, value_reference>;
    using pointer = void;

    /**
     * @brief Construct the past-the-end iterator.
     */
    RadixIterator();

    /**
     * @brief Construct an iterator positioned on the first key of a subtree.
     * @param start Root of the subtree, or nullptr for an empty traversal
     * @param base Key bytes preceding @p start's label
     */
    RadixIterator(node_type* start, std::string base);

    /**
     * @brief Dereference operator to access the current entry.
     * @return Pair of references to the current key and value
     * @note The key reference is invalidated when the iterator advances.
     */
    reference operator*() const;

    const std::string& key() const { return path_; }
    value_reference value() const { return *current_->value(); }

    RadixIterator& operator++();
    RadixIterator operator++(int);

    bool operator==(const RadixIterator& other) const { return current_ == other.current_; }
    bool operator!=(const RadixIterator& other) const { return !(*this == other); }

private:
    struct Frame {
        node_type* node;
        size_t depth;   ///< Path length before this node's label
    };

    /**
     * @brief Pop nodes until one holding a value is reached, or the stack empties.
     */
    void advance();

    std::vector<Frame> stack_;
    std::string path_;
    node_type* current_;
};

/**
 * @brief A restartable, lazily evaluated view over a subtree.
 *
 * Each call to begin() starts an independent traversal, so a range can be
 * iterated any number of times.
 */
template<typename Value, bool Const>
class RadixRange {
public:
    using iterator = RadixIterator<Value, Const>;
    using node_type = typename iterator::node_type;

    RadixRange() : start_(nullptr) {}
    RadixRange(node_type* start, std::string base) : start_(start), base_(std::move(base)) {}

    iterator begin() const { return start_ ? iterator(start_, base_) : iterator(); }
    iterator end() const { return iterator(); }

    /**
     * @brief Check if the range yields nothing.
     * @complexity O(d) where d is the depth to the first value in the subtree
     */
    bool empty() const { return begin() == end(); }

private:
    node_type* start_;
    std::string base_;
};

template<typename Value, bool Const>
RadixIterator<Value, Const>::RadixIterator() : current_(nullptr) {}

template<typename Value, bool Const>
RadixIterator<Value, Const>::RadixIterator(node_type* start, std::string base)
    : path_(std::move(base)), current_(nullptr) {
    if (start) {
        stack_.push_back({start, path_.size()});
        advance();
    }
}

template<typename Value, bool Const>
void RadixIterator<Value, Const>::advance() {
    while (!stack_.empty()) {
        Frame frame = stack_.back();
        stack_.pop_back();

        path_.resize(frame.depth);
        path_.append(frame.node->label());

        // Reverse order so the smallest first byte is popped next
        for (size_t i = frame.node->child_count(); i > 0; --i) {
            stack_.push_back({frame.node->child_at(i - 1), path_.size()});
        }

        if (frame.node->has_value()) {
            current_ = frame.node;
            return;
        }
    }
    current_ = nullptr;
}

template<typename Value, bool Const>
typename RadixIterator<Value, Const>::reference RadixIterator<Value, Const>::operator*() const {
    return reference(path_, *current_->value());
}

template<typename Value, bool Const>
RadixIterator<Value, Const>& RadixIterator<Value, Const>::operator++() {
    if (current_) {
        advance();
    }
    return *this;
}

template<typename Value, bool Const>
RadixIterator<Value, Const> RadixIterator<Value, Const>::operator++(int) {
    RadixIterator tmp = *this;
    ++(*this);
    return tmp;
}

} // namespace radix
