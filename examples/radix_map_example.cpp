#include <iostream>
#include <iomanip>
#include <cctype>
#include <thread>
#include <vector>
#include <chrono>
#include <random>
#include <string>
#include "radix/radix_map.hpp"

using namespace radix;

void demonstrate_basic_operations() {
    std::cout << "=== Basic Map Operations ===\n\n";

    RadixMap<int> map;

    std::vector<std::pair<std::string, int>> entries = {
        {"foo", 3}, {"bar", 1}, {"baz", 2}, {"football", 7}, {"bark", 4}
    };

    std::cout << "Inserting entries: ";
    for (const auto& [key, value] : entries) {
        std::cout << key << "=" << value << " ";
        map.insert(key, value);
    }
    std::cout << "\n";
    std::cout << "Total entries: " << map.size() << "\n\n";

    std::cout << "Lookups:\n";
    for (const std::string key : {"bar", "ba", "football", "foot", "qux"}) {
        const int* value = map.get(key);
        std::cout << "  \"" << key << "\": ";
        if (value) {
            std::cout << *value << "\n";
        } else {
            std::cout << "(absent)\n";
        }
    }
    std::cout << "\n";

    auto previous = map.insert("bar", 10);
    std::cout << "Overwriting \"bar\" with 10, previous value: " << previous.value_or(-1) << "\n";

    if (int* value = map.get("baz")) {
        *value *= 100;
    }
    std::cout << "Modified \"baz\" in place: " << *map.get("baz") << "\n";

    auto removed = map.remove("foo");
    std::cout << "Removed \"foo\": " << (removed ? std::to_string(*removed) : "(absent)") << "\n";
    std::cout << "Removed \"foo\" again: " << (map.erase("foo") ? "yes" : "no") << "\n";
    std::cout << "Entries left: " << map.size() << "\n\n";
}

void demonstrate_ordered_iteration() {
    std::cout << "=== Ordered Iteration ===\n\n";

    RadixMap<std::string> capitals{
        {"norway", "oslo"}, {"nepal", "kathmandu"}, {"niger", "niamey"},
        {"netherlands", "amsterdam"}, {"new zealand", "wellington"}, {"peru", "lima"}
    };

    std::cout << "All entries in key order:\n";
    for (auto [country, capital] : capitals) {
        std::cout << "  " << std::left << std::setw(14) << country << capital << "\n";
    }
    std::cout << "\n";

    std::cout << "Entries under \"ne\":\n";
    for (auto [country, capital] : capitals.starting_with("ne")) {
        std::cout << "  " << country << " -> " << capital << "\n";
    }
    std::cout << "\n";

    std::cout << "Upper-casing every capital through mutable iteration\n";
    for (auto [country, capital] : capitals) {
        for (char& c : capital) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
    }
    std::cout << "  peru -> " << *capitals.get("peru") << "\n\n";
}

void demonstrate_prefix_queries() {
    std::cout << "=== Prefix Queries ===\n\n";

    RadixMap<int> routes;
    routes.insert("/api", 1);
    routes.insert("/api/users", 2);
    routes.insert("/api/users/admin", 3);
    routes.insert("/static", 4);

    std::vector<std::string> requests = {
        "/api/users/42", "/api/users/admin/edit", "/api/orders", "/static/app.js", "/health"
    };

    std::cout << "Longest matching route:\n";
    for (const auto& request : requests) {
        auto match = routes.longest_prefix(request);
        std::cout << "  " << std::left << std::setw(24) << request
                  << (match ? *match + " (handler " + std::to_string(*routes.get(*match)) + ")" : "(no route)")
                  << "\n";
    }
    std::cout << "\n";

    std::cout << "Routes under \"/api\": " << routes.count_with_prefix("/api") << "\n";
    std::cout << "Any route under \"/img\": " << (routes.starts_with("/img") ? "yes" : "no") << "\n\n";
}

void demonstrate_concurrent_readers() {
    std::cout << "=== Concurrent Readers ===\n\n";

    RadixMap<int> map;
    const int num_keys = 20000;
    for (int i = 0; i < num_keys; ++i) {
        map.insert("user:" + std::to_string(i), i);
    }

    const RadixMap<int>& view = map;
    const int num_threads = 4;
    std::vector<std::thread> threads;
    std::vector<long long> sums(num_threads, 0);

    auto start_time = std::chrono::high_resolution_clock::now();

    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&, t]() {
            std::mt19937 gen(t);
            std::uniform_int_distribution<int> dist(0, num_keys - 1);
            for (int i = 0; i < 50000; ++i) {
                if (const int* value = view.get("user:" + std::to_string(dist(gen)))) {
                    sums[t] += *value;
                }
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);

    std::cout << num_threads << " readers shared one map without locking\n";
    for (int t = 0; t < num_threads; ++t) {
        std::cout << "  Reader " << t << " checksum: " << sums[t] << "\n";
    }
    std::cout << "Time taken: " << duration.count() << " ms\n\n";
}

void demonstrate_node_layout() {
    std::cout << "=== Node Layout ===\n\n";

    RadixMap<int> map{{"romane", 1}, {"romanus", 2}, {"romulus", 3}, {"rubens", 4},
                      {"ruber", 5}, {"rubicon", 6}, {"rubicundus", 7}};

    std::cout << "Edges of the compressed tree:\n";
    map.tree().for_each_node([](const RadixNode<int>& node, size_t depth) {
        std::cout << "  " << std::string(depth * 2, ' ')
                  << (node.label().empty() ? "(root)" : node.label())
                  << (node.has_value() ? " *" : "") << "\n";
    });
    std::cout << "Keys: " << map.size() << ", nodes: " << map.tree().node_count() << "\n\n";
}

int main() {
    std::cout << "RadixMap Example\n";
    std::cout << "================\n\n";

    try {
        demonstrate_basic_operations();
        demonstrate_ordered_iteration();
        demonstrate_prefix_queries();
        demonstrate_concurrent_readers();
        demonstrate_node_layout();

        std::cout << "=== Summary ===\n\n";
        std::cout << "RadixMap provides:\n";
        std::cout << "• Ordered iteration over byte-string keys\n";
        std::cout << "• Lazy prefix ranges\n";
        std::cout << "• Longest prefix matching\n";
        std::cout << "• Shared prefixes stored once\n\n";

        std::cout << "Perfect for:\n";
        std::cout << "• Request routing tables\n";
        std::cout << "• Autocomplete indexes\n";
        std::cout << "• Sorted key-value dictionaries\n";

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
