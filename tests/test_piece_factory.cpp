#include <catch2/catch_test_macros.hpp>

#include <algorithm>

#include "core/PieceFactory.hpp"
#include "core/RandomSource.hpp"
#include "ScriptedRandom.hpp"

using namespace letterfall::core;

TEST_CASE("PieceFactory always includes a consonant", "[piece][factory]") {
    MersenneRandomSource random{1234};
    PieceFactory factory{random, 10};

    for (int i = 0; i < 200; ++i) {
        const Piece p = factory.createRandom();
        REQUIRE(p.size() == 4);

        const auto& shapes = PieceFactory::shapes();
        REQUIRE(std::find(shapes.begin(), shapes.end(), p.shapeOffsets()) != shapes.end());

        const auto& ls = p.letters();
        REQUIRE(std::all_of(ls.begin(), ls.end(), [](Letter l) { return l >= 'A' && l <= 'Z'; }));
        REQUIRE(std::any_of(ls.begin(), ls.end(), [](Letter l) { return !PieceFactory::isVowel(l); }));
    }
}

TEST_CASE("PieceFactory replaces one slot when every letter is a vowel", "[piece][factory]") {
    // All zeros: first shape, four 'A's, then slot 0 gets the first consonant
    ScriptedRandom random{{0}};
    PieceFactory factory{random, 10};

    const Piece p = factory.createRandom();
    REQUIRE(p.shapeOffsets() == PieceFactory::shapes().front());
    REQUIRE(p.letters() == Piece::Letters{'B', 'A', 'A', 'A'});
    REQUIRE(p.minCorner() == Position{0, 5});
}

TEST_CASE("PieceFactory random rows span the board", "[piece][factory]") {
    MersenneRandomSource random{7};
    PieceFactory factory{random, 10};

    const auto row = factory.createRandomRow(10);
    REQUIRE(row.size() == 10);
    REQUIRE(std::none_of(row.begin(), row.end(), [](Letter l) { return l == '\0'; }));
}

TEST_CASE("RandomSource helpers validate their input", "[random]") {
    MersenneRandomSource random{99};

    REQUIRE_THROWS_AS(random.rangeInt(3, 3), std::invalid_argument);
    REQUIRE_THROWS_AS(random.choice(std::vector<int>{}), std::invalid_argument);
    REQUIRE_THROWS_AS(random.weightedChoice(std::vector<char>{'a'}, std::vector<int>{0}),
                      std::invalid_argument);

    ScriptedRandom scripted{{4}};
    // Weights 3 and 2: a pick of 4 lands in the second bucket
    REQUIRE(scripted.weightedChoice(std::vector<char>{'x', 'y'}, std::vector<int>{3, 2}) == 'y');
}
