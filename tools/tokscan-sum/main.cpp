#include <unistd.h>

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <expected>
#include <iostream>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <util/io.hpp>
#include <util/io/buffered_reader.hpp>
#include <util/struct_args.hpp>

#include <libs/tokscan/parse.hpp>
#include <libs/tokscan/stream.hpp>

#include "sum_tokens.hpp"

using namespace std::literals;

namespace {

struct opts {
  std::string_view input =
      args::option<std::string_view>{"-i", "--input",
          "Read tokens from the file instead of standard input"}
          .default_value({});
  std::string_view type =
      args::option<std::string_view>{"-t", "--type",
          "Token type: i8 i16 i32 i64 u8 u16 u32 u64 f32 f64 string"}
          .default_value("i32");
  std::string_view limit =
      args::option<std::string_view>{"-l", "--limit", "Maximal token size in bytes"}
          .default_value({});
  bool strict = args::flag{"--strict", "Stop on the first token which fails to scan"};
};

void setup_logger() {
  auto term = std::make_shared<spdlog::sinks::stderr_color_sink_mt>(
      spdlog::color_mode::automatic);
  spdlog::default_logger()->sinks() = {term};
  spdlog::cfg::load_env_levels();
}

io::file_descriptor open_input(std::string_view path) {
  if (path.empty())
    return io::file_descriptor{STDIN_FILENO};
  return io::open(std::string{path}, io::mode::read_only | io::mode::cloexec);
}

using input_stream = tokscan::stream<io::buffered_reader<io::file_descriptor>>;

std::expected<summary, tokscan::error> run(
    input_stream& in, token_type type, const sum_options& opts) {
  switch (type) {
  case token_type::i8:
    return sum_tokens<std::int8_t>(in, opts);
  case token_type::i16:
    return sum_tokens<std::int16_t>(in, opts);
  case token_type::i32:
    return sum_tokens<std::int32_t>(in, opts);
  case token_type::i64:
    return sum_tokens<std::int64_t>(in, opts);
  case token_type::u8:
    return sum_tokens<std::uint8_t>(in, opts);
  case token_type::u16:
    return sum_tokens<std::uint16_t>(in, opts);
  case token_type::u32:
    return sum_tokens<std::uint32_t>(in, opts);
  case token_type::u64:
    return sum_tokens<std::uint64_t>(in, opts);
  case token_type::f32:
    return sum_tokens<float>(in, opts);
  case token_type::f64:
    return sum_tokens<double>(in, opts);
  case token_type::string:
    return sum_tokens<std::string>(in, opts);
  }
  std::unreachable();
}

} // namespace

int main(int argc, char** argv) try {
  std::span<char*> args{argv, static_cast<size_t>(argc)};
  if (get_flag(args, "-h")) {
    args::usage<opts>(args.front(), std::cout);
    std::cout << '\n';
    args::args_help<opts>(std::cout);
    return EXIT_SUCCESS;
  }
  setup_logger();
  const auto opt = args::parse<opts>(args);

  const auto type = parse_token_type(opt.type);
  if (!type) {
    spdlog::error("Unknown token type '{}'", opt.type);
    return EXIT_FAILURE;
  }
  sum_options sum_opts{.strict = opt.strict};
  if (!opt.limit.empty()) {
    const auto limit = tokscan::parse_traits<size_t>::parse(opt.limit);
    if (!limit) {
      spdlog::error("Invalid token size limit '{}': {}", opt.limit,
          limit.error().message());
      return EXIT_FAILURE;
    }
    sum_opts.limit = *limit;
  }

  input_stream in{io::buffered_reader{open_input(opt.input)}};
  spdlog::debug("Scanning {} tokens from {}", to_string(*type),
      opt.input.empty() ? "stdin"sv : opt.input);
  const auto res = run(in, *type, sum_opts);
  if (!res) {
    spdlog::error("Scanning failed: {}", res.error());
    return EXIT_FAILURE;
  }
  fmt::print("{}", format_summary(*res));
  return EXIT_SUCCESS;
} catch (const std::exception& err) {
  spdlog::critical("{}", err.what());
  return EXIT_FAILURE;
}
