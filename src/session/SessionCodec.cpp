#include "session/SessionCodec.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace letterfall::session {

namespace {
    std::string escape(const std::string& s) {
        std::string out;
        out.reserve(s.size());
        for (char c : s) {
            if (c == '\n') {
                out += "\\n";
                continue;
            }
            if (c == ';' || c == '\\') {
                out.push_back('\\');
            }
            out.push_back(c);
        }
        return out;
    }

    // Split on unescaped ';' and unescape each field
    std::vector<std::string> splitFields(const std::string& line) {
        std::vector<std::string> fields(1);
        bool esc = false;
        for (char c : line) {
            if (esc) {
                fields.back().push_back(c == 'n' ? '\n' : c);
                esc = false;
            } else if (c == '\\') {
                esc = true;
            } else if (c == ';') {
                fields.emplace_back();
            } else {
                fields.back().push_back(c);
            }
        }
        return fields;
    }

    std::string encodeOffsets(const std::vector<core::Position>& offsets) {
        std::ostringstream os;
        for (std::size_t i = 0; i < offsets.size(); ++i) {
            if (i > 0) os << ' ';
            os << offsets[i].row << ',' << offsets[i].col;
        }
        return os.str();
    }

    // Throws std::invalid_argument on a malformed pair
    std::vector<core::Position> decodeOffsets(const std::string& text) {
        std::vector<core::Position> out;
        std::istringstream is(text);
        std::string pair;
        while (is >> pair) {
            const auto comma = pair.find(',');
            if (comma == std::string::npos) {
                throw std::invalid_argument("offset without comma");
            }
            out.push_back(core::Position{std::stoi(pair.substr(0, comma)),
                                         std::stoi(pair.substr(comma + 1))});
        }
        return out;
    }

    void writePiece(std::ostream& os, const char* slot, const std::optional<PieceSnapshot>& piece) {
        if (!piece) return;
        os << "PIECE;" << slot << ';'
           << piece->minCorner.row << ';' << piece->minCorner.col << ';'
           << encodeOffsets(piece->offsets) << ';'
           << escape(std::string(piece->letters.begin(), piece->letters.end())) << '\n';
    }

    bool parseBool(const std::string& s) {
        if (s == "1") return true;
        if (s == "0") return false;
        throw std::invalid_argument("expected 0 or 1");
    }
}

std::string serialize(const SessionSnapshot& s)
{
    std::ostringstream os;
    os << "SESSION;" << s.version << '\n'
       << "SAVED_AT;" << s.savedAtMs << '\n'
       << "IDENTITY;" << escape(s.identity) << '\n'
       << "SCORE;" << s.score << '\n'
       << "LEVEL;" << s.level << '\n'
       << "GRAVITY;" << s.gravityIntervalMs << '\n'
       << "WORDS_FOUND;" << s.wordsFoundSinceLevelUp << '\n'
       << "HOLD_USED;" << (s.holdUsed ? 1 : 0) << '\n';

    for (const auto& row : s.boardRows) {
        os << "ROW;" << escape(row) << '\n';
    }
    for (const auto& w : s.foundWords) {
        os << "FOUND;" << escape(w) << '\n';
    }
    for (const auto& w : s.removedWords) {
        os << "REMOVED;" << escape(w) << '\n';
    }

    writePiece(os, "CURRENT", s.current);
    writePiece(os, "NEXT", s.next);
    writePiece(os, "HOLD", s.hold);
    return os.str();
}

std::optional<SessionSnapshot> deserialize(const std::string& text)
{
    std::istringstream is(text);
    std::string line;
    SessionSnapshot s;
    bool sawHeader = false;

    try {
        while (std::getline(is, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.empty()) continue;

            const auto f = splitFields(line);
            const std::string& type = f[0];

            // The header must come first so a foreign file is rejected early
            if (!sawHeader) {
                if (type != "SESSION" || f.size() != 2) return std::nullopt;
                s.version = std::stoi(f[1]);
                sawHeader = true;
                continue;
            }

            if (type == "PIECE") {
                if (f.size() != 6) return std::nullopt;
                PieceSnapshot p;
                p.minCorner = core::Position{std::stoi(f[2]), std::stoi(f[3])};
                p.offsets = decodeOffsets(f[4]);
                p.letters.assign(f[5].begin(), f[5].end());

                if (f[1] == "CURRENT")   s.current = std::move(p);
                else if (f[1] == "NEXT") s.next = std::move(p);
                else if (f[1] == "HOLD") s.hold = std::move(p);
                else return std::nullopt;
                continue;
            }

            if (f.size() != 2) return std::nullopt;
            const std::string& value = f[1];

            if (type == "SAVED_AT")         s.savedAtMs = std::stoll(value);
            else if (type == "IDENTITY")    s.identity = value;
            else if (type == "SCORE")       s.score = std::stoll(value);
            else if (type == "LEVEL")       s.level = std::stoi(value);
            else if (type == "GRAVITY")     s.gravityIntervalMs = std::stoi(value);
            else if (type == "WORDS_FOUND") s.wordsFoundSinceLevelUp = std::stoi(value);
            else if (type == "HOLD_USED")   s.holdUsed = parseBool(value);
            else if (type == "ROW")         s.boardRows.push_back(value);
            else if (type == "FOUND")       s.foundWords.push_back(value);
            else if (type == "REMOVED")     s.removedWords.push_back(value);
            else return std::nullopt;
        }
    } catch (const std::logic_error&) {
        // stoi/stoll throw invalid_argument or out_of_range
        return std::nullopt;
    }

    if (!sawHeader) return std::nullopt;
    return s;
}

} // namespace letterfall::session
