#include "mtc_exception.hpp"

#include <gtest/gtest.h>

#include "mtc_invalid_argument_exception.hpp"

namespace mtc {

TEST(MtcExceptionTest, InfoTakenFromConstCharStar) {
  EXPECT_STREQ(exception("Open-Meteo did not return any hourly data").what(),
               "Open-Meteo did not return any hourly data");
}

TEST(MtcExceptionTest, FormatUntruncated) {
  EXPECT_STREQ(exception("Unknown location '{}'. Please check its spelling.", "Zagrebb").what(),
               "Unknown location 'Zagrebb'. Please check its spelling.");
}

TEST(MtcExceptionTest, FormatTruncated) {
  EXPECT_STREQ(exception("Cannot reach {} after {} retries because the remote server answered with an unexpected status",
                         "api.open-meteo.com", 3)
                   .what(),
               "Cannot reach api.open-meteo.com after 3 retries because the remote server answered w...");
}

TEST(MtcExceptionTest, InvalidArgumentIsAnException) {
  EXPECT_THROW(throw invalid_argument("Invalid date '{}'", "2025-13-01"), exception);
}

}  // namespace mtc
