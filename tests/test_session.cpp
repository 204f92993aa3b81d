#include <catch2/catch.hpp>
#include <sstream>

#include <f1s/session.hpp>

using Catch::Detail::Approx;
using namespace f1s;

static std::string csv_laps = R"(# exported laps
session_key,driver_number,lap_number,lap_duration,compound,stint_number,tire_age,track_temperature,rainfall,position,interval,pit_in
9158,1,1,92.4,soft,1,1,38.5,0,1,0.0,0
9158,1,2,91.8,SOFT,1,2,38.6,false,1,,1
9158,44,1,93.0,MEDIUM,1,1,38.5,0,2,1.2,0
,44,2,93.1,MEDIUM,1,2,38.5,0,2,1.1,0
9158,44,x,93.1,MEDIUM,1,2,38.5,0,2,1.1,0
)";

TEST_CASE("session_records_from_csv_stream parses rows by header name") {
  std::istringstream ss(csv_laps);
  auto recs = session_records_from_csv_stream(ss);
  REQUIRE(recs.size() == 3);

  const auto& a = recs[0];
  REQUIRE(a.session_key == 9158);
  REQUIRE(a.driver_number == 1);
  REQUIRE(a.lap_number == 1);
  REQUIRE(a.lap_duration.value() == Approx(92.4));
  REQUIRE(a.compound.value() == "SOFT");
  REQUIRE(a.stint_number.value() == 1);
  REQUIRE(a.track_temperature.value() == Approx(38.5));
  REQUIRE(a.rainfall.value() == false);
  REQUIRE_FALSE(a.pit_in);
  REQUIRE_FALSE(a.humidity.has_value());

  const auto& b = recs[1];
  REQUIRE(b.pit_in);
  REQUIRE_FALSE(b.interval.has_value());
  REQUIRE(recs[2].interval.value() == Approx(1.2));
}

TEST_CASE("session_records_from_csv_stream tolerates column order and float integers") {
  std::istringstream ss("lap_number,driver_number,session_key,position\n3.0,16,100,4.0\n");
  auto recs = session_records_from_csv_stream(ss);
  REQUIRE(recs.size() == 1);
  REQUIRE(recs[0].lap_number == 3);
  REQUIRE(recs[0].driver_number == 16);
  REQUIRE(recs[0].position.value() == 4);
}

TEST_CASE("session_records_from_csv_stream leaves non-finite cells unset") {
  std::istringstream ss("session_key,driver_number,lap_number,lap_duration,track_temperature,position\n"
                        "9158,44,4,nan,inf,2.5\n");
  auto recs = session_records_from_csv_stream(ss);
  REQUIRE(recs.size() == 1);
  REQUIRE_FALSE(recs[0].lap_duration.has_value());
  REQUIRE_FALSE(recs[0].track_temperature.has_value());
  REQUIRE_FALSE(recs[0].position.has_value());
}

TEST_CASE("load_session_csv returns nullopt on missing file") {
  REQUIRE_FALSE(load_session_csv("/no/such/session.csv").has_value());
}

TEST_CASE("CsvSessionSource yields nothing for an unknown session") {
  CsvSessionSource src("/no/such/dir");
  REQUIRE(src.fetch(1234).empty());
}
