#include "quiz/DefinitionSource.hpp"

#include "core/Dictionary.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <utility>

namespace letterfall::quiz {

namespace {
    std::string trim(const std::string& s) {
        const auto first = s.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) return {};
        const auto last = s.find_last_not_of(" \t\r\n");
        return s.substr(first, last - first + 1);
    }

    std::string clean(const std::string& definition) {
        std::string out;
        out.reserve(definition.size());
        for (char c : definition) {
            if (c == '[' || c == ']' || c == '\'') continue;
            out.push_back(c);
        }
        return trim(out);
    }
}

DefinitionTable DefinitionTable::loadFromFile(const std::string& path) {
    DefinitionTable table;

    std::ifstream in(path);
    if (!in) {
        std::cerr << "DefinitionTable: cannot open '" << path
                  << "', quizzes will show placeholders\n";
        return table;
    }

    std::string line;
    int lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        if (trim(line).empty()) continue;

        const auto tab = line.find('\t');
        if (tab == std::string::npos) {
            std::cerr << "DefinitionTable: " << path << ":" << lineNo << ": missing tab, skipped\n";
            continue;
        }
        table.add(line.substr(0, tab), line.substr(tab + 1));
    }
    return table;
}

std::vector<std::string> DefinitionTable::definitionsFor(const std::string& word) const {
    const auto it = table_.find(core::normalizeWord(trim(word)));
    if (it == table_.end()) return {};
    return it->second;
}

void DefinitionTable::add(const std::string& word, const std::string& definition) {
    const std::string key = core::normalizeWord(trim(word));
    std::string text = clean(definition);
    if (key.empty() || text.empty()) return;

    auto& defs = table_[key];
    const std::string folded = core::normalizeWord(text);
    const bool duplicate = std::any_of(defs.begin(), defs.end(), [&](const std::string& d) {
        return core::normalizeWord(d) == folded;
    });
    if (!duplicate) {
        defs.push_back(std::move(text));
    }
}

} // namespace letterfall::quiz
