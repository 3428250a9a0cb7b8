#include "parser/statement_splitter.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

std::string_view trim_sql(std::string_view s) {
    const auto not_space = [](unsigned char c) { return std::isspace(c) == 0; };
    const auto begin = std::find_if(s.begin(), s.end(), not_space);
    if (begin == s.end()) {
        return {};
    }
    const auto end = std::find_if(s.rbegin(), s.rend(), not_space).base();
    return s.substr(
        static_cast<std::size_t>(begin - s.begin()),
        static_cast<std::size_t>(end - begin)
    );
}

std::vector<std::string> split_statements(std::string_view skeleton) {
    std::vector<std::string> fragments;

    std::size_t start = 0;
    while (start <= skeleton.size()) {
        const auto semi = skeleton.find(';', start);
        const auto piece = (semi == std::string_view::npos)
            ? skeleton.substr(start)
            : skeleton.substr(start, semi - start);

        const auto trimmed = trim_sql(piece);
        if (!trimmed.empty()) {
            fragments.emplace_back(trimmed);
        }

        if (semi == std::string_view::npos) {
            break;
        }
        start = semi + 1;
    }

    return fragments;
}
