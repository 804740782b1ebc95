#pragma once

#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "radix/radix_map.hpp"

namespace radix {

/**
 * @brief An ordered set of byte-string keys, stored as a compressed prefix tree.
 *
 * RadixSet is a RadixMap whose value type carries no information
 * (std::monostate), so it shares the map's engine, ordering and memory profile.
 * Only presence is exposed: insert reports whether a key was added, and
 * iteration yields keys.
 *
 * Usage Example:
 * @code
 * radix::RadixSet set{"app", "apple", "banana"};
 *
 * set.insert("apply");
 * bool added = set.insert("apple");   // false, already present
 *
 * for (const std::string& word : set.starting_with("app")) {
 *     std::cout << word << std::endl;   // app, apple, apply
 * }
 * @endcode
 *
 * @note Same threading contract as RadixMap: one writer or many readers.
 */
class RadixSet {
public:
    using map_type = RadixMap<std::monostate>;
    using size_type = size_t;

    /**
     * @brief Input iterator over the keys of a set, in ascending order.
     */
    class const_iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = std::string;
        using difference_type = std::ptrdiff_t;
        using reference = const std::string&;
        using pointer = const std::string*;

        const_iterator() = default;
        explicit const_iterator(map_type::const_iterator it) : it_(std::move(it)) {}

        /**
         * @brief Dereference operator to access the current key.
         * @note The reference is invalidated when the iterator advances.
         */
        const std::string& operator*() const { return it_.key(); }
        const std::string* operator->() const { return &it_.key(); }

        const_iterator& operator++() {
            ++it_;
            return *this;
        }

        const_iterator operator++(int) {
            const_iterator tmp = *this;
            ++it_;
            return tmp;
        }

        bool operator==(const const_iterator& other) const { return it_ == other.it_; }
        bool operator!=(const const_iterator& other) const { return it_ != other.it_; }

    private:
        map_type::const_iterator it_;
    };

    /**
     * @brief Restartable range over the keys sharing a prefix.
     */
    class key_range {
    public:
        explicit key_range(map_type::const_range range) : range_(std::move(range)) {}

        const_iterator begin() const { return const_iterator(range_.begin()); }
        const_iterator end() const { return const_iterator(range_.end()); }
        bool empty() const { return range_.empty(); }

    private:
        map_type::const_range range_;
    };

    using iterator = const_iterator;

    /**
     * @brief Default constructor. Creates an empty set.
     */
    RadixSet() = default;

    /**
     * @brief Construct from a list of keys. Duplicates are stored once.
     */
    RadixSet(std::initializer_list<std::string> keys);

    /**
     * @brief Construct from an iterator range of keys.
     * @tparam InputIt Iterator whose elements convert to std::string_view
     */
    template<typename InputIt>
    RadixSet(InputIt first, InputIt last);

    // Non-copyable but movable
    RadixSet(const RadixSet&) = delete;
    RadixSet& operator=(const RadixSet&) = delete;
    RadixSet(RadixSet&&) = default;
    RadixSet& operator=(RadixSet&&) = default;

    /**
     * @brief Add a key to the set.
     *
     * @param key The key to add
     * @return true if the key was added, false if it was already present
     * @complexity O(m) where m is the length of the key
     */
    bool insert(std::string_view key) { return map_.emplace(key); }

    bool contains(std::string_view key) const { return map_.contains(key); }

    /**
     * @brief Remove a key from the set.
     * @return true if the key was present and has been removed
     */
    bool remove(std::string_view key) { return map_.erase(key); }
    bool erase(std::string_view key) { return map_.erase(key); }

    void clear() { map_.clear(); }

    size_t size() const { return map_.size(); }
    bool empty() const { return map_.empty(); }

    const_iterator begin() const { return const_iterator(map_.begin()); }
    const_iterator end() const { return const_iterator(map_.end()); }

    /**
     * @brief Lazily enumerate the keys starting with a prefix, in order.
     */
    key_range starting_with(std::string_view prefix) const { return key_range(map_.starting_with(prefix)); }

    bool starts_with(std::string_view prefix) const { return map_.starts_with(prefix); }
    size_t count_with_prefix(std::string_view prefix) const { return map_.count_with_prefix(prefix); }
    std::vector<std::string> get_all_with_prefix(std::string_view prefix) const {
        return map_.get_all_with_prefix(prefix);
    }
    std::optional<std::string> longest_prefix(std::string_view word) const { return map_.longest_prefix(word); }

    /**
     * @brief Keys present in this set, the other set, or both.
     *
     * Both sets are walked once in parallel, so the result is sorted and free
     * of duplicates.
     *
     * @complexity O(n + k) node visits where n and k are the node counts
     */
    std::vector<std::string> set_union(const RadixSet& other) const;

    /**
     * @brief Keys present in both sets, in ascending order.
     */
    std::vector<std::string> set_intersection(const RadixSet& other) const;

    const map_type& map() const { return map_; }

private:
    map_type map_;
};

inline RadixSet::RadixSet(std::initializer_list<std::string> keys) {
    for (const auto& key : keys) {
        map_.emplace(key);
    }
}

template<typename InputIt>
RadixSet::RadixSet(InputIt first, InputIt last) {
    for (; first != last; ++first) {
        map_.emplace(*first);
    }
}

inline std::vector<std::string> RadixSet::set_union(const RadixSet& other) const {
    std::vector<std::string> result;
    const_iterator left = begin();
    const_iterator right = other.begin();

    while (left != end() && right != other.end()) {
        int order = left->compare(*right);
        if (order < 0) {
            result.push_back(*left);
            ++left;
        } else if (order > 0) {
            result.push_back(*right);
            ++right;
        } else {
            result.push_back(*left);
            ++left;
            ++right;
        }
    }
    for (; left != end(); ++left) {
        result.push_back(*left);
    }
    for (; right != other.end(); ++right) {
        result.push_back(*right);
    }
    return result;
}

inline std::vector<std::string> RadixSet::set_intersection(const RadixSet& other) const {
    std::vector<std::string> result;
    const_iterator left = begin();
    const_iterator right = other.begin();

    while (left != end() && right != other.end()) {
        int order = left->compare(*right);
        if (order < 0) {
            ++left;
        } else if (order > 0) {
            ++right;
        } else {
            result.push_back(*left);
            ++left;
            ++right;
        }
    }
    return result;
}

} // namespace radix
