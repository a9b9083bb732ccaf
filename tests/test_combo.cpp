#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "core/ComboTracker.hpp"

using letterfall::core::ComboSettings;
using letterfall::core::ComboTracker;
using Catch::Matchers::WithinAbs;

TEST_CASE("ComboTracker grows by one step per clear up to the cap", "[combo]") {
    ComboTracker combo;

    REQUIRE(combo.step() == 0);
    REQUIRE_THAT(combo.multiplier(), WithinAbs(1.0, 1e-9));
    REQUIRE_FALSE(combo.isActive());

    combo.onClear();
    REQUIRE(combo.step() == 1);
    REQUIRE_THAT(combo.multiplier(), WithinAbs(1.0, 1e-9));

    combo.onClear();
    REQUIRE_THAT(combo.multiplier(), WithinAbs(1.5, 1e-9));

    for (int i = 0; i < 10; ++i) {
        combo.onClear();
        REQUIRE(combo.multiplier() <= 4.0);
    }
    REQUIRE_THAT(combo.multiplier(), WithinAbs(4.0, 1e-9));
}

TEST_CASE("ComboTracker decays one step per idle window", "[combo]") {
    ComboTracker combo;
    combo.onClear();
    combo.onClear();
    combo.onClear(); // step 3, x2.0

    combo.update(9000);
    REQUIRE(combo.step() == 3); // window must be exceeded, not reached

    combo.update(1);
    REQUIRE(combo.step() == 2);
    REQUIRE_THAT(combo.multiplier(), WithinAbs(1.5, 1e-9));
    REQUIRE(combo.msSinceLastClear() == 0);

    combo.update(9001);
    combo.update(9001);
    REQUIRE(combo.step() == 0);
    REQUIRE_THAT(combo.multiplier(), WithinAbs(1.0, 1e-9));

    // Never below the start value
    combo.update(20000);
    REQUIRE_THAT(combo.multiplier(), WithinAbs(1.0, 1e-9));
}

TEST_CASE("ComboTracker clear restarts the idle timer", "[combo]") {
    ComboTracker combo;
    combo.onClear();
    combo.onClear();

    combo.update(8000);
    combo.onClear();
    combo.update(8000);
    REQUIRE(combo.step() == 3);
}

TEST_CASE("ComboTracker flash time and effective multiplier", "[combo]") {
    ComboTracker combo{ComboSettings{9000, 0.5, 1.0, 4.0}};

    combo.onClear();
    REQUIRE(combo.flashMs() == 300);
    combo.update(100);
    REQUIRE(combo.flashMs() == 200);
    combo.update(-50); // ignored
    REQUIRE(combo.flashMs() == 200);

    combo.onClear();
    REQUIRE_THAT(combo.effectiveMultiplier(2.0), WithinAbs(3.0, 1e-9));

    combo.reset();
    REQUIRE(combo.step() == 0);
    REQUIRE(combo.flashMs() == 0);
}
