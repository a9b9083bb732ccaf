#include "core/Dictionary.hpp"

#include <cctype>
#include <fstream>
#include <iostream>
#include <utility>

namespace letterfall::core {

namespace {
    std::string trim(const std::string& s) {
        const auto first = s.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) return {};
        const auto last = s.find_last_not_of(" \t\r\n");
        return s.substr(first, last - first + 1);
    }

    // Base letters for U+00C0..U+00FF; '?' keeps the character unchanged
    constexpr char kLatin1Fold[] =
        "aaaaaa?ceeeeiiiidnooooo?ouuuuy??"
        "aaaaaa?ceeeeiiiidnooooo?ouuuuy?y";
}

std::string normalizeWord(const std::string& word) {
    std::string out;
    out.reserve(word.size());
    for (std::size_t i = 0; i < word.size(); ++i) {
        const auto c = static_cast<unsigned char>(word[i]);

        // UTF-8 lead byte 0xC3 covers the accented Latin-1 letters
        if (c == 0xC3 && i + 1 < word.size()) {
            const auto next = static_cast<unsigned char>(word[i + 1]);
            if (next >= 0x80 && next <= 0xBF && kLatin1Fold[next - 0x80] != '?') {
                out.push_back(kLatin1Fold[next - 0x80]);
                ++i;
                continue;
            }
        }
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

WordSet::WordSet(const std::vector<std::string>& words) {
    for (const auto& w : words) {
        add(w);
    }
}

WordSet WordSet::loadFromFile(const std::string& path) {
    WordSet set;

    std::ifstream in(path);
    if (!in) {
        std::cerr << "WordSet: cannot open word list '" << path
                  << "', continuing with an empty list\n";
        return set;
    }

    std::string line;
    while (std::getline(in, line)) {
        set.add(line);
    }
    return set;
}

bool WordSet::contains(const std::string& normalizedWord) const {
    return words_.find(normalizedWord) != words_.end();
}

void WordSet::add(const std::string& word) {
    std::string w = normalizeWord(trim(word));
    if (w.empty()) return;
    if (words_.insert(w).second) {
        ordered_.push_back(std::move(w));
    }
}

} // namespace letterfall::core
