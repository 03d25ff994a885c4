#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <util/struct_args.hpp>

namespace {

class cli_args {
public:
  cli_args(std::initializer_list<const char*> args) {
    arg_strings_.push_back("prog_name");
    for (const char* arg : args)
      arg_strings_.push_back(arg);
    for (auto& arg : arg_strings_)
      args_.push_back(arg.data());
  }

  operator std::span<char*>() noexcept { return args_; }

private:
  std::vector<std::string> arg_strings_;
  std::vector<char*> args_;
};

struct opts {
  std::string_view type =
      args::option<std::string_view>{"-t", "--type", "Token type"};
  std::string_view input =
      args::option<std::string_view>{"-i", "--input", "Input file"}.default_value("");
  bool strict = args::flag{"--strict", "Fail on the first bad token"};
};

} // namespace

SCENARIO("parse CLI options") {
  GIVEN("opts type") {
    WHEN("args with all required options are parsed") {
      cli_args argv{{"--type", "u64"}};
      auto opt = args::parse<opts>(argv);

      THEN("type value is parsed") { REQUIRE(opt.type == "u64"); }
      THEN("input is set to default value") { REQUIRE(opt.input.empty()); }
      THEN("strict flag is not set") { REQUIRE_FALSE(opt.strict); }
    }

    WHEN("short option names and flags are used") {
      cli_args argv{{"--strict", "-i", "numbers.txt", "-t", "f32"}};
      auto opt = args::parse<opts>(argv);

      THEN("all values are parsed") {
        REQUIRE(opt.type == "f32");
        REQUIRE(opt.input == "numbers.txt");
        REQUIRE(opt.strict);
      }
    }

    WHEN("required option is missing") {
      cli_args argv{{"-i", "numbers.txt"}};

      THEN("invalid_argument naming the option is thrown") {
        REQUIRE_THROWS_MATCHES(args::parse<opts>(argv), std::invalid_argument,
            Catch::Matchers::MessageMatches(Catch::Matchers::ContainsSubstring("--type")));
      }
    }

    WHEN("args help is requestd") {
      std::ostringstream out;
      args::args_help<opts>(out);

      THEN("all members are documented") {
        REQUIRE(out.str() == "\t--type, -t VAL\tToken type\n"
                             "\t--input, -i VAL\tInput file\n"
                             "\t--strict\tFail on the first bad token\n");
      }
    }

    WHEN("usage is requested") {
      std::ostringstream out;
      args::usage<opts>("prog_name", out);

      THEN("all members are listed") {
        REQUIRE(out.str() == "Usage: prog_name -t VAL [--input VAL] [--strict]\n");
      }
    }
  }
}
