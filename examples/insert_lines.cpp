// Reads lines from standard input into the chosen container and reports how
// many distinct lines it holds. Intended for comparing memory and time with
// external tools, e.g. `/usr/bin/time -v insert_lines radix < words.txt`.

#include <iostream>
#include <set>
#include <string>
#include <unordered_set>
#include "radix/radix_set.hpp"

template<typename Func>
void each_line(Func&& func) {
    std::string line;
    while (std::getline(std::cin, line)) {
        func(line);
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <radix|hash|btree|count> < input\n";
        return 1;
    }

    std::ios::sync_with_stdio(false);

    std::string container = argv[1];
    std::cout << "Container: " << container << "\n";

    if (container == "radix") {
        radix::RadixSet set;
        each_line([&set](const std::string& line) { set.insert(line); });
        std::cout << "# LINES: " << set.size() << "\n";
    } else if (container == "hash") {
        std::unordered_set<std::string> set;
        each_line([&set](const std::string& line) { set.insert(line); });
        std::cout << "# LINES: " << set.size() << "\n";
    } else if (container == "btree") {
        std::set<std::string> set;
        each_line([&set](const std::string& line) { set.insert(line); });
        std::cout << "# LINES: " << set.size() << "\n";
    } else if (container == "count") {
        size_t count = 0;
        each_line([&count](const std::string&) { ++count; });
        std::cout << "# LINES: " << count << "\n";
    } else {
        std::cerr << "Unknown container: " << container << "\n";
        return 1;
    }

    return 0;
}
