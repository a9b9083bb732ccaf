#include "quiz/WordFilter.hpp"

#include <cctype>
#include <fstream>
#include <iostream>
#include <utility>

namespace letterfall::quiz {

namespace {
    char foldLeet(char c) {
        switch (c) {
        case '@': case '4': return 'a';
        case '0':           return 'o';
        case '1': case '!': return 'i';
        case '$': case '5': return 's';
        case '7':           return 't';
        case '3':           return 'e';
        default:            return c;
        }
    }
}

WordFilter::WordFilter(const std::vector<std::string>& bannedWords) {
    for (const auto& w : bannedWords) {
        add(w);
    }
}

WordFilter WordFilter::loadFromFile(const std::string& path) {
    WordFilter filter;

    std::ifstream in(path);
    if (!in) {
        std::cerr << "WordFilter: cannot open banned list '" << path
                  << "', quiz text is not filtered\n";
        return filter;
    }

    std::string line;
    while (std::getline(in, line)) {
        filter.add(line);
    }
    return filter;
}

std::string WordFilter::normalize(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool pendingSpace = false;

    for (char raw : text) {
        const char c = foldLeet(static_cast<char>(std::tolower(static_cast<unsigned char>(raw))));
        const bool keep = std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
        if (!keep) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out.push_back(' ');
            pendingSpace = false;
        }
        out.push_back(c);
    }
    return out;
}

void WordFilter::add(const std::string& word) {
    std::string w = normalize(word);
    if (!w.empty()) {
        banned_.insert(std::move(w));
    }
}

bool WordFilter::isBanned(const std::string& word) const {
    return banned_.count(normalize(word)) > 0;
}

bool WordFilter::containsBannedWord(const std::string& text) const {
    if (banned_.empty()) return false;

    // Pad with spaces so a plain find() respects word boundaries
    const std::string padded = " " + normalize(text) + " ";
    for (const auto& b : banned_) {
        if (padded.find(" " + b + " ") != std::string::npos) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> WordFilter::filterDefinitions(const std::vector<std::string>& definitions) const {
    std::vector<std::string> safe;
    safe.reserve(definitions.size());
    for (const auto& d : definitions) {
        if (!containsBannedWord(d)) {
            safe.push_back(d);
        }
    }
    return safe;
}

} // namespace letterfall::quiz
