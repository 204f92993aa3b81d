#include <catch2/catch.hpp>
#include <string>

#include <f1s/domain.hpp>

using namespace f1s;

TEST_CASE("domain names round-trip") {
  for (Domain d : kAllDomains) {
    auto back = domain_from_name(domain_name(d));
    REQUIRE(back.has_value());
    REQUIRE(*back == d);
    REQUIRE(std::string(domain_description(d)).size() > 0);
  }
  REQUIRE(std::string(domain_name(Domain::PitStop)) == "pit_stop");
}

TEST_CASE("domain_from_name accepts short aliases") {
  REQUIRE(domain_from_name("tire") == Domain::TireStrategy);
  REQUIRE(domain_from_name("pit-stop") == Domain::PitStop);
  REQUIRE(domain_from_name("pace") == Domain::RacePace);
  REQUIRE_FALSE(domain_from_name("weather").has_value());
}

TEST_CASE("compound lookups") {
  REQUIRE(compound_from_name("soft") == Compound::Soft);
  REQUIRE(compound_from_name("INTER") == Compound::Intermediate);
  REQUIRE(compound_from_name("Intermediate") == Compound::Intermediate);
  REQUIRE_FALSE(compound_from_name("UNKNOWN").has_value());

  REQUIRE(compound_from_index(4) == Compound::Wet);
  REQUIRE_FALSE(compound_from_index(5).has_value());
  REQUIRE_FALSE(compound_from_index(-1).has_value());
  REQUIRE(std::string(compound_name(Compound::Hard)) == "HARD");
}
