#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <string>

#include <trailfx/path_sampler.hpp>
#include <trailfx/trail_state.hpp>

using Catch::Approx;
using namespace trailfx;

TEST_CASE("attach starts the trail once") {
  TrailState st;
  REQUIRE(st.phase == TrailPhase::Uninitialized);
  REQUIRE_FALSE(st.is_active());

  REQUIRE(attach(st, 250.0));
  REQUIRE(st.is_active());
  REQUIRE(st.start_time == Approx(250.0));
  REQUIRE_FALSE(st.end_time.has_value());

  REQUIRE_FALSE(attach(st, 900.0));
  REQUIRE(st.start_time == Approx(250.0));
}

TEST_CASE("end_trail is idempotent") {
  LifetimeParams lp;
  lp.afterlife_ms = 2000.0;
  lp.fixed_buffer_ms = 100.0;

  TrailState st;
  REQUIRE_FALSE(end_trail(st, lp, 10.0)); // not attached yet
  REQUIRE(st.phase == TrailPhase::Uninitialized);

  REQUIRE(attach(st, 0.0));
  REQUIRE(end_trail(st, lp, 500.0));
  REQUIRE(st.phase == TrailPhase::Ending);
  REQUIRE(*st.end_time == Approx(500.0));
  REQUIRE(*st.expiry == Approx(2600.0));

  REQUIRE_FALSE(end_trail(st, lp, 900.0));
  REQUIRE(*st.end_time == Approx(500.0));
  REQUIRE(*st.expiry == Approx(2600.0));
}

TEST_CASE("PathSampler::on_end twice has no extra effect") {
  PathSampler sampler;
  TrailState st;
  REQUIRE(attach(st, 0.0));
  REQUIRE(sampler.on_end(st, 40.0));
  const TrailState before = st;
  REQUIRE_FALSE(sampler.on_end(st, 80.0));
  REQUIRE(st.phase == before.phase);
  REQUIRE(*st.end_time == *before.end_time);
  REQUIRE(*st.expiry == *before.expiry);
}

TEST_CASE("tick_lifecycle expires strictly after expiry") {
  LifetimeParams lp;
  lp.afterlife_ms = 1000.0;

  TrailState st;
  REQUIRE(attach(st, 0.0));
  REQUIRE_FALSE(tick_lifecycle(st, 1.0e9)); // active trails never expire

  REQUIRE(end_trail(st, lp, 100.0));        // expiry = 1200
  REQUIRE_FALSE(tick_lifecycle(st, 1199.0));
  REQUIRE_FALSE(tick_lifecycle(st, 1200.0));
  REQUIRE(st.phase == TrailPhase::Ending);

  REQUIRE(tick_lifecycle(st, 1200.5));
  REQUIRE(st.phase == TrailPhase::Expired);
  REQUIRE_FALSE(tick_lifecycle(st, 5000.0));
}

TEST_CASE("phase_name covers every phase") {
  REQUIRE(std::string(phase_name(TrailPhase::Uninitialized)) == "Uninitialized");
  REQUIRE(std::string(phase_name(TrailPhase::Active)) == "Active");
  REQUIRE(std::string(phase_name(TrailPhase::Ending)) == "Ending");
  REQUIRE(std::string(phase_name(TrailPhase::Expired)) == "Expired");
}
