// tests/test_session_codec.cpp

#include <catch2/catch_test_macros.hpp>

#include "session/SessionCodec.hpp"
#include "session/SessionSnapshot.hpp"

using namespace letterfall::session;
using letterfall::core::Position;

namespace {
    SessionSnapshot sampleSnapshot() {
        SessionSnapshot s;
        s.savedAtMs = 1'700'000'123'456;
        s.identity = "Ada;Love\\lace\nJr";
        s.score = 98765;
        s.level = 12;
        s.gravityIntervalMs = 310;
        s.wordsFoundSinceLevelUp = 4;
        s.holdUsed = true;
        s.boardRows = {"..........", "CAT.......", "KITE..DOG."};
        s.foundWords = {"cat", "dog"};
        s.removedWords = {"CAT", "DOG", "CAT"};
        s.current = PieceSnapshot{Position{3, 4}, {Position{0, 0}, Position{1, 0}, Position{1, 1}}, {'A', 'B', 'C'}};
        s.next = PieceSnapshot{Position{0, 5}, {Position{0, 0}}, {'E'}};
        return s;
    }
}

TEST_CASE("SessionCodec: snapshot round-trip", "[session][serialization]")
{
    const SessionSnapshot original = sampleSnapshot();

    const auto text   = serialize(original);
    const auto parsed = deserialize(text);

    REQUIRE(parsed.has_value());
    const auto& s = *parsed;

    CHECK(s.version                == kSessionVersion);
    CHECK(s.savedAtMs              == original.savedAtMs);
    CHECK(s.identity               == "Ada;Love\\lace\nJr");
    CHECK(s.score                  == 98765);
    CHECK(s.level                  == 12);
    CHECK(s.gravityIntervalMs      == 310);
    CHECK(s.wordsFoundSinceLevelUp == 4);
    CHECK(s.holdUsed);
    CHECK(s.boardRows              == original.boardRows);
    CHECK(s.foundWords             == original.foundWords);
    CHECK(s.removedWords           == original.removedWords);

    REQUIRE(s.current.has_value());
    CHECK(s.current->minCorner == Position{3, 4});
    CHECK(s.current->offsets   == original.current->offsets);
    CHECK(s.current->letters   == original.current->letters);
    REQUIRE(s.next.has_value());
    CHECK(s.next->letters == std::vector<char>{'E'});
    CHECK_FALSE(s.hold.has_value());
}

TEST_CASE("SessionCodec: one record per line, header first", "[session][serialization]")
{
    const auto text = serialize(sampleSnapshot());

    REQUIRE(text.rfind("SESSION;1\n", 0) == 0);
    CHECK(text.find("ROW;CAT.......\n") != std::string::npos);
    CHECK(text.find("PIECE;CURRENT;3;4;0,0 1,0 1,1;ABC\n") != std::string::npos);
    // The newline inside the identity is escaped, so it cannot split a record
    CHECK(text.find("IDENTITY;Ada\\;Love\\\\lace\\nJr\n") != std::string::npos);
}

TEST_CASE("SessionCodec: other versions still parse", "[session][serialization]")
{
    const auto parsed = deserialize("SESSION;2\nSCORE;5\n");
    REQUIRE(parsed.has_value());
    CHECK(parsed->version == 2);
    CHECK(parsed->score == 5);
}

TEST_CASE("SessionCodec: malformed input is rejected", "[session][serialization]")
{
    CHECK_FALSE(deserialize("").has_value());
    CHECK_FALSE(deserialize("SCORE;5\n").has_value());                  // no header
    CHECK_FALSE(deserialize("SESSION;one\n").has_value());
    CHECK_FALSE(deserialize("SESSION;1\nSCORE;lots\n").has_value());
    CHECK_FALSE(deserialize("SESSION;1\nLEVEL;99999999999999\n").has_value());
    CHECK_FALSE(deserialize("SESSION;1\nCOLOR;red\n").has_value());     // unknown record
    CHECK_FALSE(deserialize("SESSION;1\nSCORE;5;6\n").has_value());     // extra field
    CHECK_FALSE(deserialize("SESSION;1\nHOLD_USED;2\n").has_value());
    CHECK_FALSE(deserialize("SESSION;1\nPIECE;SPARE;0;0;0,0;A\n").has_value());
    CHECK_FALSE(deserialize("SESSION;1\nPIECE;NEXT;0;0;00;A\n").has_value());
    CHECK_FALSE(deserialize("SESSION;1\nPIECE;NEXT;0;0\n").has_value());
}

TEST_CASE("SessionCodec: tolerates CRLF line endings", "[session][serialization]")
{
    const auto parsed = deserialize("SESSION;1\r\nLEVEL;3\r\nROW;AB.\r\n");
    REQUIRE(parsed.has_value());
    CHECK(parsed->level == 3);
    CHECK(parsed->boardRows == std::vector<std::string>{"AB."});
}
