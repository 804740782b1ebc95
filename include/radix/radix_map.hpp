#pragma once

#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "radix/radix_tree.hpp"

namespace radix {

/**
 * @brief An ordered map from byte-string keys to values, stored as a compressed prefix tree.
 *
 * RadixMap is an alternative to std::map and std::unordered_map for string keys.
 * Keys sharing a prefix share the tree path spelling it, so large key sets with long
 * common prefixes (titles, paths, n-grams) take noticeably less memory. Iteration is
 * in byte-lexicographic key order and prefix queries touch only the matching subtree.
 *
 * @tparam Value The type of values stored. Must be move constructible.
 *
 * Key Features:
 * - Ordered: iteration yields keys in ascending byte order
 * - Prefix queries: lazy, restartable ranges over every key with a given prefix
 * - Compact: chains of single-child nodes are collapsed into one labelled edge
 * - Byte keys: any byte may appear in a key, including NUL; the empty key is valid
 * - Non-recursive: no operation recurses proportionally to key length
 *
 * Performance Characteristics:
 * - Insert: O(m) where m is the length of the key
 * - Get: O(m) where m is the length of the key
 * - Remove: O(m) where m is the length of the key
 * - Prefix search: O(p) to locate, then O(1) amortized per produced entry
 * - Size: O(1)
 *
 * Usage Example:
 * @code
 * radix::RadixMap<int> map;
 *
 * map.insert("bar", 1);
 * map.insert("baz", 2);
 * map.insert("foo", 3);
 *
 * if (const int* value = map.get("baz")) {
 *     std::cout << "baz -> " << *value << std::endl;
 * }
 *
 * for (auto [key, value] : map.starting_with("ba")) {
 *     std::cout << key << " -> " << value << std::endl;
 * }
 *
 * map.remove("bar");
 * @endcode
 *
 * @note Not thread-safe for writers. Concurrent reads of a map no one is
 *       modifying are safe.
 * @warning Iterators and value pointers are invalidated by any mutation.
 */
template<typename Value>
class RadixMap {
public:
    using key_type = std::string;
    using mapped_type = Value;
    using size_type = size_t;
    using tree_type = RadixTree<Value>;
    using iterator = typename tree_type::iterator;
    using const_iterator = typename tree_type::const_iterator;
    using range = typename tree_type::range;
    using const_range = typename tree_type::const_range;

    /**
     * @brief Default constructor. Creates an empty map.
     * @complexity O(1)
     */
    RadixMap() = default;

    /**
     * @brief Construct from a list of key-value pairs.
     *
     * @param entries Pairs inserted in order; a later duplicate key overwrites an earlier one
     * @complexity O(n*m) where n is the number of entries, m the average key length
     */
    RadixMap(std::initializer_list<std::pair<std::string, Value>> entries);

    /**
     * @brief Construct from an iterator range of key-value pairs.
     *
     * @tparam InputIt Iterator whose elements have .first convertible to
     *                 std::string_view and .second convertible to Value
     */
    template<typename InputIt>
    RadixMap(InputIt first, InputIt last);

    // Non-copyable but movable
    RadixMap(const RadixMap&) = delete;
    RadixMap& operator=(const RadixMap&) = delete;
    RadixMap(RadixMap&&) = default;
    RadixMap& operator=(RadixMap&&) = default;

    /**
     * @brief Insert a key-value pair, replacing any existing value.
     *
     * @param key The key to insert
     * @param value The value to associate with the key
     * @return The previous value for the key, or std::nullopt if the key was new
     * @complexity O(m) where m is the length of the key
     * @exception_safety Strong guarantee - if allocation fails the map is unchanged
     */
    std::optional<Value> insert(std::string_view key, Value value);

    /**
     * @brief Construct a value in-place for the given key.
     *
     * @param key The key to associate with the constructed value
     * @param args Arguments to forward to Value's constructor
     * @return true if the value was constructed and inserted, false if the key already exists
     */
    template<typename... Args>
    bool emplace(std::string_view key, Args&&... args);

    /**
     * @brief Get the value associated with a key.
     *
     * @param key The key to search for
     * @return Pointer to the stored value, or nullptr if not found
     * @complexity O(m) where m is the length of the key
     */
    Value* get(std::string_view key) { return tree_.get(key); }
    const Value* get(std::string_view key) const { return tree_.get(key); }

    /**
     * @brief Find the value associated with a key.
     *
     * @param key The key to search for
     * @param result Reference to store the found value
     * @return true if the key was found and its value copied to result
     */
    bool find(std::string_view key, Value& result) const;

    bool contains(std::string_view key) const { return tree_.get(key) != nullptr; }

    /**
     * @brief Remove a key from the map.
     *
     * @param key The key to remove
     * @return The removed value, or std::nullopt if the key was not present
     * @complexity O(m) where m is the length of the key
     */
    std::optional<Value> remove(std::string_view key) { return tree_.remove(key); }

    /**
     * @brief Remove a key from the map, discarding its value.
     * @return true if the key was present
     */
    bool erase(std::string_view key) { return tree_.remove(key).has_value(); }

    void clear() { tree_.clear(); }

    size_t size() const { return tree_.size(); }
    bool empty() const { return tree_.empty(); }

    iterator begin() { return tree_.begin(); }
    iterator end() { return tree_.end(); }
    const_iterator begin() const { return tree_.begin(); }
    const_iterator end() const { return tree_.end(); }

    /**
     * @brief Lazily enumerate the entries whose key starts with a prefix.
     *
     * @param prefix The prefix to match; the empty prefix matches every key
     * @return Restartable range of (key, value) pairs in key order
     * @complexity O(p) to build where p is the prefix length
     */
    range starting_with(std::string_view prefix) { return tree_.starting_with(prefix); }
    const_range starting_with(std::string_view prefix) const { return tree_.starting_with(prefix); }

    /**
     * @brief Check if any key in the map starts with the given prefix.
     */
    bool starts_with(std::string_view prefix) const { return !tree_.starting_with(prefix).empty(); }

    /**
     * @brief Count the keys starting with the given prefix.
     * @complexity O(p + k*m) where k is the number of matches
     */
    size_t count_with_prefix(std::string_view prefix) const;

    /**
     * @brief Collect every key starting with the given prefix, in order.
     */
    std::vector<std::string> get_all_with_prefix(std::string_view prefix) const;

    /**
     * @brief Find the longest key in the map that is a prefix of @p word.
     * @return The key, or std::nullopt if none is
     */
    std::optional<std::string> longest_prefix(std::string_view word) const { return tree_.longest_prefix(word); }

    /**
     * @brief Collect every key in order.
     */
    std::vector<std::string> keys() const { return get_all_with_prefix(std::string_view()); }

    /**
     * @brief Access the underlying tree engine.
     */
    const tree_type& tree() const { return tree_; }

private:
    tree_type tree_;
};

template<typename Value>
RadixMap<Value>::RadixMap(std::initializer_list<std::pair<std::string, Value>> entries) {
    for (const auto& entry : entries) {
        tree_.insert(entry.first, entry.second);
    }
}

template<typename Value>
template<typename InputIt>
RadixMap<Value>::RadixMap(InputIt first, InputIt last) {
    for (; first != last; ++first) {
        tree_.insert(first->first, first->second);
    }
}

template<typename Value>
std::optional<Value> RadixMap<Value>::insert(std::string_view key, Value value) {
    return tree_.insert(key, std::move(value));
}

template<typename Value>
template<typename... Args>
bool RadixMap<Value>::emplace(std::string_view key, Args&&... args) {
    return tree_.try_emplace(key, std::forward<Args>(args)...).second;
}

template<typename Value>
bool RadixMap<Value>::find(std::string_view key, Value& result) const {
    const Value* value = tree_.get(key);
    if (value) {
        result = *value;
        return true;
    }
    return false;
}

template<typename Value>
size_t RadixMap<Value>::count_with_prefix(std::string_view prefix) const {
    const_range matches = tree_.starting_with(prefix);
    return static_cast<size_t>(std::distance(matches.begin(), matches.end()));
}

template<typename Value>
std::vector<std::string> RadixMap<Value>::get_all_with_prefix(std::string_view prefix) const {
    std::vector<std::string> result;
    for (auto it = tree_.starting_with(prefix).begin(); it != const_iterator(); ++it) {
        result.push_back(it.key());
    }
    return result;
}

} // namespace radix
