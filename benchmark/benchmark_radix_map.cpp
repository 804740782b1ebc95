#include <iostream>
#include <iomanip>
#include <thread>
#include <vector>
#include <chrono>
#include <map>
#include <unordered_map>
#include <random>
#include <algorithm>
#include <string>
#include <string_view>
#include <cstdint>
#include "radix/radix_map.hpp"

using namespace radix;

// Adapters giving the standard containers the RadixMap interface
template<typename MapType>
class StdMapAdapter {
private:
    MapType map_;

public:
    void insert(std::string_view key, uint64_t value) {
        map_.insert_or_assign(std::string(key), value);
    }

    const uint64_t* get(std::string_view key) const {
        auto it = map_.find(std::string(key));
        return it != map_.end() ? &it->second : nullptr;
    }

    bool erase(std::string_view key) {
        return map_.erase(std::string(key)) > 0;
    }

    size_t size() const { return map_.size(); }

    const MapType& container() const { return map_; }
};

using OrderedMap = StdMapAdapter<std::map<std::string, uint64_t>>;
using HashMap = StdMapAdapter<std::unordered_map<std::string, uint64_t>>;

const std::vector<size_t> SIZES = {10000, 100000, 1000000};
const std::vector<size_t> KEY_LENS = {8, 32, 128};

// Random byte keys of the longest length; shorter lengths use a prefix
std::vector<std::pair<std::string, uint64_t>> generate_entries(size_t count, std::mt19937_64& gen) {
    size_t max_key_len = *std::max_element(KEY_LENS.begin(), KEY_LENS.end());
    std::uniform_int_distribution<int> byte_dist(0, 255);

    std::vector<std::pair<std::string, uint64_t>> entries;
    entries.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        std::string key(max_key_len, '\0');
        for (auto& c : key) {
            c = static_cast<char>(byte_dist(gen));
        }
        entries.emplace_back(std::move(key), gen());
    }
    return entries;
}

template<typename MapType>
void benchmark_single_thread(const std::string& name, size_t size, size_t key_len,
                             const std::vector<std::pair<std::string, uint64_t>>& entries) {
    constexpr size_t num_operations = 200000;
    std::mt19937_64 gen(size * 31 + key_len);
    std::uniform_int_distribution<size_t> index_dist(0, entries.size() - 1);

    std::vector<size_t> indices(num_operations);
    for (auto& index : indices) {
        index = index_dist(gen);
    }

    MapType map;
    auto start_time = std::chrono::high_resolution_clock::now();
    for (const auto& [key, value] : entries) {
        map.insert(std::string_view(key).substr(0, key_len), value);
    }
    auto end_time = std::chrono::high_resolution_clock::now();
    auto insert_duration = std::chrono::duration_cast<std::chrono::microseconds>(end_time - start_time);

    uint64_t checksum = 0;
    start_time = std::chrono::high_resolution_clock::now();
    for (size_t index : indices) {
        if (const uint64_t* value = map.get(std::string_view(entries[index].first).substr(0, key_len))) {
            checksum += *value;
        }
    }
    end_time = std::chrono::high_resolution_clock::now();
    auto get_duration = std::chrono::duration_cast<std::chrono::microseconds>(end_time - start_time);

    size_t removed = 0;
    start_time = std::chrono::high_resolution_clock::now();
    for (size_t index : indices) {
        if (map.erase(std::string_view(entries[index].first).substr(0, key_len))) {
            ++removed;
        }
    }
    end_time = std::chrono::high_resolution_clock::now();
    auto remove_duration = std::chrono::duration_cast<std::chrono::microseconds>(end_time - start_time);

    auto ns_per_op = [](std::chrono::microseconds duration, size_t ops) {
        return duration.count() * 1000.0 / static_cast<double>(ops);
    };

    std::cout << "  " << std::left << std::setw(14) << name << std::right << std::fixed << std::setprecision(1)
              << " insert " << std::setw(8) << ns_per_op(insert_duration, entries.size()) << " ns/op"
              << "  get " << std::setw(8) << ns_per_op(get_duration, num_operations) << " ns/op"
              << "  remove " << std::setw(8) << ns_per_op(remove_duration, num_operations) << " ns/op"
              << "  (checksum " << (checksum & 0xffff) << ", removed " << removed << ")\n";
}

void benchmark_key_lengths() {
    std::cout << "=== Insert / Get / Remove by Size and Key Length ===\n\n";

    std::mt19937_64 gen(12345);
    for (size_t size : SIZES) {
        auto entries = generate_entries(size, gen);
        for (size_t key_len : KEY_LENS) {
            std::cout << "--- n=" << size << ", key_len=" << key_len << " ---\n";
            benchmark_single_thread<RadixMap<uint64_t>>("RadixMap", size, key_len, entries);
            benchmark_single_thread<OrderedMap>("std::map", size, key_len, entries);
            benchmark_single_thread<HashMap>("unordered_map", size, key_len, entries);
        }
        std::cout << "\n";
    }
}

// Path-like keys: many shared prefixes, the workload prefix trees are built for
std::vector<std::string> generate_paths(size_t count) {
    std::vector<std::string> paths;
    paths.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        paths.push_back("/usr/share/doc/package_" + std::to_string(i % 997) + "/file_" + std::to_string(i));
    }
    return paths;
}

size_t count_prefix(const RadixMap<uint64_t>& map, std::string_view prefix) {
    return map.count_with_prefix(prefix);
}

// Ordered scan from the first key not below the prefix
size_t count_prefix(const OrderedMap& map, std::string_view prefix) {
    const auto& ordered = map.container();
    size_t count = 0;
    for (auto it = ordered.lower_bound(std::string(prefix));
         it != ordered.end() && std::string_view(it->first).substr(0, prefix.size()) == prefix; ++it) {
        ++count;
    }
    return count;
}

struct LatencySummary {
    double mean_ns;
    double median_ns;
    double p99_ns;
    double max_ns;
};

LatencySummary summarize(std::vector<double> samples) {
    LatencySummary summary{};
    if (samples.empty()) {
        return summary;
    }
    double total = 0.0;
    for (double sample : samples) {
        total += sample;
    }
    summary.mean_ns = total / static_cast<double>(samples.size());

    auto nth = [&samples](double fraction) {
        size_t index = std::min(samples.size() - 1, static_cast<size_t>(fraction * samples.size()));
        std::nth_element(samples.begin(), samples.begin() + index, samples.end());
        return samples[index];
    };
    summary.median_ns = nth(0.5);
    summary.p99_ns = nth(0.99);
    summary.max_ns = *std::max_element(samples.begin(), samples.end());
    return summary;
}

template<typename MapType>
void benchmark_prefix_latency(const std::string& name, const std::vector<std::string>& paths,
                              const std::vector<std::string>& prefixes) {
    MapType map;
    for (size_t i = 0; i < paths.size(); ++i) {
        map.insert(paths[i], i);
    }

    std::vector<double> samples;
    samples.reserve(prefixes.size());
    size_t matched = 0;
    for (const auto& prefix : prefixes) {
        auto start = std::chrono::steady_clock::now();
        matched += count_prefix(map, prefix);
        auto end = std::chrono::steady_clock::now();
        samples.push_back(std::chrono::duration<double, std::nano>(end - start).count());
    }

    LatencySummary summary = summarize(std::move(samples));
    std::cout << "  " << std::left << std::setw(10) << name << std::right << std::fixed << std::setprecision(0)
              << " mean " << std::setw(9) << summary.mean_ns << " ns"
              << "  median " << std::setw(9) << summary.median_ns << " ns"
              << "  p99 " << std::setw(9) << summary.p99_ns << " ns"
              << "  max " << std::setw(9) << summary.max_ns << " ns"
              << "  (" << matched << " keys matched)\n";
}

void benchmark_prefix_queries() {
    std::cout << "=== Prefix Count Latency (100000 path keys) ===\n\n";

    auto paths = generate_paths(100000);

    // Prefixes from broad to narrow, plus misses
    std::mt19937 gen(99);
    std::uniform_int_distribution<size_t> path_dist(0, paths.size() - 1);
    for (size_t cut : {size_t(15), size_t(24), size_t(28), size_t(0)}) {
        std::vector<std::string> prefixes;
        for (int i = 0; i < 2000; ++i) {
            const std::string& path = paths[path_dist(gen)];
            prefixes.push_back(cut == 0 ? path + "~" : path.substr(0, std::min(cut, path.size())));
        }
        if (cut == 0) {
            std::cout << "--- absent keys ---\n";
        } else {
            std::cout << "--- prefix length " << cut << " ---\n";
        }
        benchmark_prefix_latency<RadixMap<uint64_t>>("RadixMap", paths, prefixes);
        benchmark_prefix_latency<OrderedMap>("std::map", paths, prefixes);
    }
    std::cout << "\n";
}

template<typename MapType>
void benchmark_longest_prefix_readers(const std::string& name, int num_threads,
                                      const std::vector<std::string>& paths) {
    MapType routes;
    for (size_t i = 0; i < paths.size(); i += 10) {
        routes.insert(paths[i].substr(0, paths[i].rfind('/')), i);
    }
    const MapType& view = routes;

    constexpr int lookups_per_thread = 100000;
    std::vector<size_t> found(num_threads, 0);
    std::vector<std::thread> readers;

    auto start_time = std::chrono::steady_clock::now();
    for (int t = 0; t < num_threads; ++t) {
        readers.emplace_back([&, t]() {
            for (int i = 0; i < lookups_per_thread; ++i) {
                const std::string& request = paths[(static_cast<size_t>(i) * 7919 + t) % paths.size()];
                if (view.longest_prefix(request)) {
                    ++found[t];
                }
            }
        });
    }
    for (auto& reader : readers) {
        reader.join();
    }
    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time).count();

    size_t total_found = 0;
    for (size_t f : found) {
        total_found += f;
    }
    double lookups = static_cast<double>(num_threads) * lookups_per_thread;
    std::cout << "  " << std::left << std::setw(10) << name << std::right
              << " " << num_threads << " readers: " << static_cast<long>(lookups / elapsed) << " lookups/sec"
              << " (" << total_found << " routed)\n";
}

void benchmark_scaling() {
    std::cout << "=== Longest Prefix Routing, Reader Scaling ===\n\n";

    auto paths = generate_paths(100000);
    for (int threads : {1, 2, 4, 8}) {
        benchmark_longest_prefix_readers<RadixMap<uint64_t>>("RadixMap", threads, paths);
    }
    std::cout << "\n";
}

int main() {
    std::cout << "RadixMap Performance Benchmark\n";
    std::cout << "==============================\n\n";

    benchmark_key_lengths();
    benchmark_prefix_queries();
    benchmark_scaling();

    return 0;
}
