#include "meteocenteroptions.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <numeric>
#include <optional>
#include <sstream>
#include <string_view>
#include <type_traits>

#include "apioutputtype.hpp"
#include "commandlineoptionsparser.hpp"
#include "meteocenteroptionsdef.hpp"
#include "mtc_invalid_argument_exception.hpp"
#include "mtc_vector.hpp"

namespace mtc {

TEST(MeteocenterOptionsTest, PrintVersion) {
  std::ostringstream os;
  MeteocenterCmdLineOptions::PrintVersion("test", os);
  EXPECT_TRUE(os.view().starts_with("test version "));
  EXPECT_NE(os.view().find("curl"), std::string_view::npos);
}

class MeteocenterCmdLineOptionsTest : public ::testing::Test {
 protected:
  MeteocenterCmdLineOptions parse(std::initializer_list<const char *> init) {
    vector<const char *> args(init.begin(), init.end());
    return _parser.parse(args);
  }

  void validate(std::initializer_list<const char *> init) { parse(init).validate(); }

  CommandLineOptionsParser<MeteocenterCmdLineOptions> _parser{
      MeteocenterAllowedOptions<MeteocenterCmdLineOptions>::value};
  MeteocenterCmdLineOptions opts;
};

TEST_F(MeteocenterCmdLineOptionsTest, DefaultConstructorShouldValueInitializeAll) {
  alignas(MeteocenterCmdLineOptions) std::uint8_t data[sizeof(MeteocenterCmdLineOptions)];

  // fill memory with garbage
  std::iota(std::begin(data), std::end(data), static_cast<std::remove_reference_t<decltype(data[0])>>(0));

  // default construct
  ::new (data) MeteocenterCmdLineOptions;

  const auto *pRhs = reinterpret_cast<const MeteocenterCmdLineOptions *>(data);

  EXPECT_EQ(opts, *pRhs);

  if constexpr (!std::is_trivially_destructible_v<MeteocenterCmdLineOptions>) {
    std::destroy_at(pRhs);
  }
}

TEST_F(MeteocenterCmdLineOptionsTest, ForecastFullCommandLine) {
  opts = parse({"--data", "/tmp/meteo", "--log", "debug", "-o", "table", "-v", "forecast", "Zagreb", "tomorrow..sat",
                "--models", "ecmwf_ifs,icon_seamless", "--full"});
  EXPECT_EQ(opts.getDataDir(), "/tmp/meteo");
  EXPECT_EQ(opts.logConsole, "debug");
  EXPECT_EQ(opts.getApiOutputType(), ApiOutputType::table);
  EXPECT_TRUE(opts.verbose);
  EXPECT_EQ(opts.forecast, CommandLineValueAndOptionalValue("Zagreb", "tomorrow..sat"));
  EXPECT_EQ(opts.models, "ecmwf_ifs,icon_seamless");
  EXPECT_TRUE(opts.full);
  EXPECT_NO_THROW(opts.validate());
}

TEST_F(MeteocenterCmdLineOptionsTest, Current) {
  opts = parse({"current", "45.81,15.98", "--json"});
  EXPECT_EQ(opts.current, "45.81,15.98");
  EXPECT_FALSE(opts.forecast.isPresent());
  EXPECT_EQ(opts.getApiOutputType(), ApiOutputType::json);
  EXPECT_NO_THROW(opts.validate());
}

TEST_F(MeteocenterCmdLineOptionsTest, NoOutputType) {
  EXPECT_EQ(parse({"current", "Paris"}).getApiOutputType(), std::nullopt);
}

TEST_F(MeteocenterCmdLineOptionsTest, InvalidOutputType) {
  EXPECT_THROW(parse({"current", "Paris", "-o", "yaml"}).getApiOutputType(), invalid_argument);
}

TEST_F(MeteocenterCmdLineOptionsTest, JsonConsistentWithOutputType) {
  EXPECT_NO_THROW(validate({"current", "Paris", "--json", "-o", "json"}));
  EXPECT_THROW(validate({"current", "Paris", "--json", "-o", "table"}), invalid_argument);
}

TEST_F(MeteocenterCmdLineOptionsTest, CommandIsMandatory) {
  EXPECT_THROW(validate({"-o", "json"}), invalid_argument);
}

TEST_F(MeteocenterCmdLineOptionsTest, OnlyOneCommand) {
  EXPECT_THROW(validate({"forecast", "Paris", "current", "Berlin"}), invalid_argument);
}

TEST_F(MeteocenterCmdLineOptionsTest, ForecastOptionsWithoutForecast) {
  EXPECT_THROW(validate({"current", "Paris", "--models", "gfs_seamless"}), invalid_argument);
  EXPECT_THROW(validate({"current", "Paris", "--full"}), invalid_argument);
}

TEST_F(MeteocenterCmdLineOptionsTest, UnknownOption) {
  EXPECT_THROW(parse({"forecast", "Paris", "--modles", "gfs_seamless"}), invalid_argument);
}

TEST_F(MeteocenterCmdLineOptionsTest, MissingValue) {
  EXPECT_THROW(parse({"forecast"}), invalid_argument);
  EXPECT_THROW(parse({"current", "Paris", "--log"}), invalid_argument);
}

}  // namespace mtc
