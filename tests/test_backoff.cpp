#include <doctest/doctest.h>
#include "beacon/backoff.hpp"

using namespace beacon;

TEST_CASE("Default policy: immediate first try, then base, doubling to the cap") {
  RetryPolicy p;
  CHECK(p.delay_before(1) == 0);
  CHECK(p.delay_before(2) == 1000);
  CHECK(p.delay_before(3) == 2000);
  CHECK(p.delay_before(4) == 4000);
  CHECK(p.delay_before(5) == 4000);
  CHECK(p.delay_before(40) == 4000);
}

TEST_CASE("Attempt count bounds the retries") {
  RetryPolicy p;
  CHECK_FALSE(p.exhausted(0));
  CHECK_FALSE(p.exhausted(2));
  CHECK(p.exhausted(3));
  CHECK(p.exhausted(4));
}

TEST_CASE("Cap below base clamps every delay") {
  RetryPolicy p{5, 3000, 1500};
  CHECK(p.delay_before(2) == 1500);
  CHECK(p.delay_before(3) == 1500);
}
