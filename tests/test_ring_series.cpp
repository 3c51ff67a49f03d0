#include <catch2/catch_test_macros.hpp>
#include <gscoach/ring_series.hpp>

using namespace gscoach;

TEST_CASE("RingSeries keeps insertion order below capacity") {
  RingSeries<int, 4> r;
  REQUIRE(r.empty());
  r.push(1); r.push(2); r.push(3);
  REQUIRE(r.size() == 3);
  REQUIRE(r.front() == 1);
  REQUIRE(r.back() == 3);
  REQUIRE(r[1] == 2);
}

TEST_CASE("RingSeries evicts the oldest entry once full") {
  RingSeries<int, 4> r;
  for (int i = 1; i <= 6; ++i) r.push(i);
  REQUIRE(r.size() == 4);
  REQUIRE(r.pushed() == 6);
  REQUIRE(r.to_vector() == std::vector<int>{3, 4, 5, 6});
  REQUIRE(r.front() == 3);
  REQUIRE(r.back() == 6);

  r.clear();
  REQUIRE(r.empty());
  r.push(9);
  REQUIRE(r.to_vector() == std::vector<int>{9});
}
