#include <iostream>
#include <iomanip>
#include <vector>
#include <string>
#include <sstream>
#include "radix/radix_set.hpp"

using namespace radix;

void print_keys(const std::string& title, const std::vector<std::string>& keys) {
    std::cout << title << " (" << keys.size() << "): ";
    for (const auto& key : keys) {
        std::cout << key << " ";
    }
    std::cout << "\n";
}

void demonstrate_basic_operations() {
    std::cout << "=== Basic Set Operations ===\n";

    RadixSet set;
    std::cout << "Initial state - empty: " << set.empty()
              << ", size: " << set.size() << "\n";

    std::cout << "Inserting words...\n";
    for (const char* word : {"romane", "romanus", "romulus", "rubens", "ruber", "rubicon"}) {
        set.insert(word);
    }
    std::cout << "After insertions - size: " << set.size() << "\n";

    std::cout << "Testing duplicate insertion:\n";
    bool duplicate_result = set.insert("ruber");
    std::cout << "  Inserting duplicate 'ruber': "
              << (duplicate_result ? "Success" : "Failed (expected)") << "\n";

    std::cout << "\nTesting membership:\n";
    for (const char* word : {"romane", "roman", "rubicon", "rubicundus"}) {
        std::cout << "  " << std::left << std::setw(12) << word
                  << (set.contains(word) ? "in set" : "not in set") << "\n";
    }

    std::cout << "\nRemoving 'romulus': " << (set.remove("romulus") ? "removed" : "absent") << "\n";
    std::cout << "Removing 'romulus' again: " << (set.remove("romulus") ? "removed" : "absent") << "\n";
    std::cout << "Final state - size: " << set.size() << "\n\n";
}

void demonstrate_iteration() {
    std::cout << "=== Ordered Iteration ===\n";

    RadixSet set{"cad", "abc;0", "c", "abb;0", "ab"};

    std::cout << "All keys:";
    for (const std::string& key : set) {
        std::cout << " " << key;
    }
    std::cout << "\n";

    for (const char* prefix : {"ab", "abb", "ca", "cada"}) {
        std::cout << "  Starting with \"" << prefix << "\":";
        auto range = set.starting_with(prefix);
        if (range.empty()) {
            std::cout << " (none)";
        }
        for (const std::string& key : range) {
            std::cout << " " << key;
        }
        std::cout << "\n";
    }
    std::cout << "\n";
}

void demonstrate_set_algebra() {
    std::cout << "=== Union and Intersection ===\n";

    RadixSet morning{"alice", "bob", "carol", "dave"};
    RadixSet evening{"bob", "dave", "erin", "frank"};

    print_keys("Morning shift", std::vector<std::string>(morning.begin(), morning.end()));
    print_keys("Evening shift", std::vector<std::string>(evening.begin(), evening.end()));
    print_keys("Either shift", morning.set_union(evening));
    print_keys("Both shifts", morning.set_intersection(evening));
    std::cout << "\n";
}

void demonstrate_vocabulary() {
    std::cout << "=== Vocabulary Index ===\n";

    std::istringstream text(
        "the quick brown fox jumps over the lazy dog then the dog "
        "thinks the fox is quite quick though the fox thinks otherwise");

    RadixSet vocabulary;
    std::string word;
    size_t total = 0;
    while (text >> word) {
        vocabulary.insert(word);
        ++total;
    }

    std::cout << "Words read: " << total << ", distinct: " << vocabulary.size() << "\n";
    std::cout << "Distinct words starting with \"th\": " << vocabulary.count_with_prefix("th") << "\n";
    print_keys("Starting with \"qu\"", vocabulary.get_all_with_prefix("qu"));
    std::cout << "Longest known prefix of \"thinking\": "
              << vocabulary.longest_prefix("thinking").value_or("(none)") << "\n";
    std::cout << "Longest known prefix of \"foxes\": "
              << vocabulary.longest_prefix("foxes").value_or("(none)") << "\n\n";
}

int main() {
    std::cout << "RadixSet Example\n";
    std::cout << "================\n\n";

    try {
        demonstrate_basic_operations();
        demonstrate_iteration();
        demonstrate_set_algebra();
        demonstrate_vocabulary();

        std::cout << "All set examples completed!\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
