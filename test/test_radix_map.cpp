#include <iostream>
#include <cassert>
#include <atomic>
#include <map>
#include <memory>
#include <random>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include "radix/radix_map.hpp"

using namespace radix;

RadixMap<int> populated_map() {
    RadixMap<int> map;
    map.insert("cad", 5);
    map.insert("abc;0", 1);
    map.insert("c", 4);
    map.insert("abb;0", 2);
    map.insert("ab", 3);
    return map;
}

void test_basic_map_operations() {
    std::cout << "Testing basic map operations...\n";

    RadixMap<int> map;
    assert(map.empty());
    assert(map.size() == 0);

    assert(!map.insert("bar", 1).has_value());
    assert(!map.insert("baz", 2).has_value());
    assert(!map.insert("foo", 3).has_value());

    assert(!map.empty());
    assert(map.size() == 3);
    assert(*map.get("bar") == 1);
    assert(*map.get("baz") == 2);
    assert(*map.get("foo") == 3);
    assert(map.get("ba") == nullptr);

    assert(map.contains("bar"));
    assert(!map.contains("ba"));
    assert(!map.contains(""));

    // Shadowing
    auto previous = map.insert("bar", 10);
    assert(previous.has_value() && *previous == 1);
    assert(map.size() == 3);
    assert(*map.get("bar") == 10);

    std::cout << "Basic map operations test passed!\n";
}

void test_lookup_misses() {
    std::cout << "Testing lookup misses...\n";

    RadixMap<int> map = populated_map();
    assert(map.size() == 5);

    assert(*map.get("ab") == 3);
    assert(*map.get("abc;0") == 1);
    assert(*map.get("abb;0") == 2);
    assert(*map.get("c") == 4);
    assert(*map.get("cad") == 5);

    assert(map.get("d") == nullptr);
    assert(map.get("ac") == nullptr);
    assert(map.get("abd") == nullptr);
    assert(map.get("abc;") == nullptr);
    assert(map.get("abc;1") == nullptr);
    assert(map.get("") == nullptr);

    std::cout << "Lookup misses test passed!\n";
}

void test_find_and_get_mut() {
    std::cout << "Testing find and in-place modification...\n";

    RadixMap<std::string> map;
    map.insert("hello", "world");

    std::string value;
    assert(map.find("hello", value));
    assert(value == "world");
    assert(!map.find("help", value));
    assert(value == "world");

    std::string* stored = map.get("hello");
    assert(stored != nullptr);
    stored->append("!");
    assert(*map.get("hello") == "world!");

    const RadixMap<std::string>& view = map;
    const std::string* read_only = view.get("hello");
    assert(read_only && *read_only == "world!");

    std::cout << "Find and in-place modification test passed!\n";
}

void test_emplace_operations() {
    std::cout << "Testing emplace operations...\n";

    RadixMap<std::pair<int, std::string>> map;
    assert(map.emplace("first", 1, "one"));
    assert(map.emplace("second", 2, "two"));
    assert(!map.emplace("first", 100, "hundred"));
    assert(map.size() == 2);

    auto* first = map.get("first");
    assert(first->first == 1 && first->second == "one");

    RadixMap<std::unique_ptr<int>> owned;
    assert(owned.emplace("p", new int(7)));
    assert(**owned.get("p") == 7);
    auto previous = owned.insert("p", std::make_unique<int>(8));
    assert(previous.has_value() && **previous == 7);
    assert(**owned.get("p") == 8);
    auto removed = owned.remove("p");
    assert(removed.has_value() && **removed == 8);
    assert(owned.empty());

    std::cout << "Emplace operations test passed!\n";
}

void test_remove_operations() {
    std::cout << "Testing remove operations...\n";

    RadixMap<int> map;
    map.insert("bar", 1);
    map.insert("baz", 2);

    auto removed = map.remove("bar");
    assert(removed.has_value() && *removed == 1);
    assert(map.size() == 1);
    assert(map.get("bar") == nullptr);
    assert(*map.get("baz") == 2);
    // The branch "ba" merged back into a single edge
    assert(map.tree().node_count() == 2);
    assert(map.tree().root().find_child('b')->label() == "baz");

    assert(!map.remove("bar").has_value());
    assert(map.size() == 1);

    assert(map.erase("baz"));
    assert(!map.erase("baz"));
    assert(map.empty());
    assert(map.tree().node_count() == 1);

    std::cout << "Remove operations test passed!\n";
}

void test_bulk_construction() {
    std::cout << "Testing bulk construction...\n";

    RadixMap<int> from_list{{"foo", 3}, {"bar", 1}, {"baz", 2}, {"bar", 10}};
    assert(from_list.size() == 3);
    assert(*from_list.get("bar") == 10);  // later duplicate wins

    std::vector<std::pair<std::string, int>> entries = {{"x", 1}, {"xy", 2}, {"xyz", 3}};
    RadixMap<int> from_range(entries.begin(), entries.end());
    assert(from_range.size() == 3);
    assert(*from_range.get("xy") == 2);

    std::map<std::string, int> ordered = {{"k1", 1}, {"k2", 2}};
    RadixMap<int> from_map(ordered.begin(), ordered.end());
    assert(from_map.size() == 2);
    assert(*from_map.get("k2") == 2);

    std::cout << "Bulk construction test passed!\n";
}

void test_iteration() {
    std::cout << "Testing iteration...\n";

    RadixMap<int> map;
    assert(map.begin() == map.end());

    map.insert("foo", 3);
    map.insert("bar", 1);
    map.insert("baz", 2);

    std::vector<std::pair<std::string, int>> seen;
    for (auto [key, value] : map) {
        seen.emplace_back(key, value);
    }
    std::vector<std::pair<std::string, int>> expected = {{"bar", 1}, {"baz", 2}, {"foo", 3}};
    assert(seen == expected);

    // Strictly increasing, no duplicates
    std::string last;
    bool first = true;
    const RadixMap<int>& view = map;
    for (auto it = view.begin(); it != view.end(); ++it) {
        assert(first || last < it.key());
        last = it.key();
        first = false;
    }

    for (auto [key, value] : map) {
        value += 100;
    }
    assert(*map.get("bar") == 101);
    assert(*map.get("foo") == 103);

    assert((map.keys() == std::vector<std::string>{"bar", "baz", "foo"}));

    std::cout << "Iteration test passed!\n";
}

void test_prefix_operations() {
    std::cout << "Testing prefix operations...\n";

    RadixMap<int> map;
    std::vector<std::string> words = {
        "app", "apple", "application", "apply", "approach",
        "car", "card", "care", "careful",
        "cat", "catch"
    };
    for (size_t i = 0; i < words.size(); ++i) {
        map.insert(words[i], static_cast<int>(i));
    }

    assert(map.starts_with("app"));
    assert(map.starts_with("ca"));
    assert(map.starts_with("appl"));
    assert(map.starts_with(""));
    assert(!map.starts_with("xyz"));
    assert(!map.starts_with("apps"));

    assert(map.count_with_prefix("app") == 5);
    assert(map.count_with_prefix("car") == 4);
    assert(map.count_with_prefix("cat") == 2);
    assert(map.count_with_prefix("xyz") == 0);
    assert(map.count_with_prefix("") == words.size());

    auto app_words = map.get_all_with_prefix("app");
    std::vector<std::string> expected = {"app", "apple", "application", "apply", "approach"};
    assert(app_words == expected);

    assert((map.get_all_with_prefix("care") == std::vector<std::string>{"care", "careful"}));
    assert(map.get_all_with_prefix("carefully").empty());

    std::vector<std::pair<std::string, int>> matched;
    for (auto [key, value] : map.starting_with("cat")) {
        matched.emplace_back(key, value);
    }
    assert((matched == std::vector<std::pair<std::string, int>>{{"cat", 9}, {"catch", 10}}));

    assert(*map.longest_prefix("applesauce") == "apple");
    assert(*map.longest_prefix("cards") == "card");
    assert(!map.longest_prefix("ca").has_value());

    RadixMap<int> empty;
    assert(!empty.starts_with(""));
    assert(empty.count_with_prefix("") == 0);

    std::cout << "Prefix operations test passed!\n";
}

void test_clear_and_move() {
    std::cout << "Testing clear and move semantics...\n";

    RadixMap<int> map = populated_map();
    RadixMap<int> moved = std::move(map);
    assert(moved.size() == 5);
    assert(map.empty());
    assert(map.get("cad") == nullptr);

    map.insert("again", 1);
    assert(map.size() == 1);

    moved.clear();
    assert(moved.empty());
    assert(moved.begin() == moved.end());
    assert(moved.tree().node_count() == 1);
    moved.insert("cad", 6);
    assert(*moved.get("cad") == 6);

    std::cout << "Clear and move semantics test passed!\n";
}

void test_concurrent_readers() {
    std::cout << "Testing concurrent readers...\n";

    RadixMap<int> map;
    std::vector<std::string> keys;
    std::mt19937 gen(42);
    std::uniform_int_distribution<int> len_dist(1, 16);
    std::uniform_int_distribution<int> char_dist('a', 'f');
    size_t duplicates = 0;
    while (keys.size() < 5000) {
        std::string key;
        int len = len_dist(gen);
        for (int i = 0; i < len; ++i) {
            key.push_back(static_cast<char>(char_dist(gen)));
        }
        // A repeated key keeps the index it was first stored with
        if (map.emplace(key, static_cast<int>(keys.size()))) {
            keys.push_back(key);
        } else {
            ++duplicates;
        }
    }
    assert(duplicates > 0);
    assert(map.size() == keys.size());
    for (size_t i = 0; i < keys.size(); ++i) {
        assert(*map.get(keys[i]) == static_cast<int>(i));
    }

    const RadixMap<int>& view = map;
    const int num_threads = 4;
    std::atomic<int> mismatches{0};
    std::vector<std::thread> threads;

    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&, t]() {
            for (size_t i = static_cast<size_t>(t); i < keys.size(); i += num_threads) {
                const int* value = view.get(keys[i]);
                if (!value || *value != static_cast<int>(i)) {
                    mismatches.fetch_add(1);
                }
            }
            size_t count = 0;
            std::string last;
            for (auto it = view.begin(); it != view.end(); ++it) {
                if (count > 0 && !(last < it.key())) {
                    mismatches.fetch_add(1);
                }
                last = it.key();
                ++count;
            }
            if (count != keys.size()) {
                mismatches.fetch_add(1);
            }
            if (view.count_with_prefix("a") + view.count_with_prefix("b") + view.count_with_prefix("c") +
                view.count_with_prefix("d") + view.count_with_prefix("e") + view.count_with_prefix("f") != keys.size()) {
                mismatches.fetch_add(1);
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    std::cout << "Keys: " << keys.size() << ", nodes: " << view.tree().node_count()
              << ", mismatches: " << mismatches.load() << "\n";
    assert(mismatches.load() == 0);

    std::cout << "Concurrent readers test passed!\n";
}

int main() {
    std::cout << "RadixMap Tests\n";
    std::cout << "==============\n\n";

    test_basic_map_operations();
    test_lookup_misses();
    test_find_and_get_mut();
    test_emplace_operations();
    test_remove_operations();
    test_bulk_construction();
    test_iteration();
    test_prefix_operations();
    test_clear_and_move();
    test_concurrent_readers();

    std::cout << "\nAll map tests passed!\n";
    return 0;
}
