#include "util/GTestUtil.hpp"

#include "util/BoostUtil.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"

#include <boost/program_options.hpp>

#include <iostream>
#include <string>

// testing::InitGoogleTest() exits after printing its own help, and consumes the gtest flags that
// our parser would reject. So --help is scanned for by hand and answered first, and our options
// are parsed from what gtest leaves behind.
int launch_gtest(int argc, char** argv) {
  namespace po2 = boost_util::program_options;
  util::Logging::Params log_params;
  util::Random::Params random_params;

  po2::options_description raw_desc("ggpcore test options");
  auto desc = raw_desc.template add_option<"help", 'h'>("help")
                .add(log_params.make_options_description())
                .add(random_params.make_options_description());

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      std::cout << desc << std::endl;
      argv[i] = const_cast<char*>("--help");
      break;
    }
  }

  testing::InitGoogleTest(&argc, argv);

  po2::parse_args(desc, argc, argv);
  util::Logging::init(log_params);
  util::Random::init(random_params);
  return RUN_ALL_TESTS();
}
