#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <trailfx/bounds.hpp>
#include <trailfx/trail_state.hpp>

using Catch::Approx;
using namespace trailfx;

TEST_CASE("adapt_bounds widens one side per axis") {
  BoundingBox b{};

  SECTION("points outside on opposite sides") {
    adapt_bounds(b, {-3.0f, 4.0f});
    REQUIRE(b.min.x == Approx(-3.0));
    REQUIRE(b.max.x == Approx(0.0));
    REQUIRE(b.min.y == Approx(0.0));
    REQUIRE(b.max.y == Approx(4.0));

    adapt_bounds(b, {5.0f, -1.0f});
    REQUIRE(b.min.x == Approx(-3.0));
    REQUIRE(b.max.x == Approx(5.0));
    REQUIRE(b.min.y == Approx(-1.0));
    REQUIRE(b.max.y == Approx(4.0));
  }

  SECTION("points inside leave the box alone") {
    b = BoundingBox{{-2.0f, -2.0f}, {2.0f, 2.0f}};
    adapt_bounds(b, {1.0f, -1.0f});
    REQUIRE(b.min.x == Approx(-2.0));
    REQUIRE(b.max.x == Approx(2.0));
    REQUIRE(b.min.y == Approx(-2.0));
    REQUIRE(b.max.y == Approx(2.0));
  }
}

TEST_CASE("adapt_bounds never moves min and max of one axis in the same call") {
  // Inverted box: a point between max and min is below min and above max.
  BoundingBox b{{10.0f, 10.0f}, {-10.0f, -10.0f}};
  adapt_bounds(b, {0.0f, 0.0f});

  REQUIRE(b.min.x == Approx(0.0));
  REQUIRE(b.max.x == Approx(-10.0));   // untouched
  REQUIRE(b.min.y == Approx(0.0));
  REQUIRE(b.max.y == Approx(-10.0));   // untouched
}

TEST_CASE("recalculate_bounds replays points from the zero box") {
  TrailState st;
  st.bounds = BoundingBox{{-100.0f, -100.0f}, {100.0f, 100.0f}};
  st.points = {
    {{4.0f, 2.0f}, 0.0},
    {{6.0f, 8.0f}, 1.0},
  };
  recalculate_bounds(st);

  // Starts from (0,0)-(0,0), so the origin stays inside.
  REQUIRE(st.bounds.min.x == Approx(0.0));
  REQUIRE(st.bounds.min.y == Approx(0.0));
  REQUIRE(st.bounds.max.x == Approx(6.0));
  REQUIRE(st.bounds.max.y == Approx(8.0));
  REQUIRE(st.bounds.size().x == Approx(6.0));

  st.points.clear();
  recalculate_bounds(st);
  REQUIRE(st.bounds.size().x == Approx(0.0));
  REQUIRE(st.bounds.size().y == Approx(0.0));
}
