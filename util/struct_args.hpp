#pragma once

#include <optional>
#include <ostream>
#include <span>
#include <stdexcept>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include <util/get_option.hpp>

namespace args {

namespace detail {

struct option_info {
  std::string_view long_name;
  std::string_view short_name;
  std::string_view description;
};

struct parser_iface {
  virtual const char* get_option(const option_info& opt) = 0;
  virtual const char* get_required_option(const option_info& opt) = 0;
  virtual bool get_flag(const option_info& opt) = 0;

protected:
  ~parser_iface() = default;
};

inline parser_iface* current_parser = nullptr;

class arguments_parser final : public parser_iface {
public:
  explicit arguments_parser(std::span<char*> args) noexcept : args_{args} {}

  const char* get_option(const option_info& opt) override {
    const char* val = ::get_option(args_, opt.long_name);
    if (!val && !opt.short_name.empty())
      val = ::get_option(args_, opt.short_name);
    return val;
  }

  const char* get_required_option(const option_info& opt) override {
    const char* val = get_option(opt);
    if (!val)
      missing_opts_.push_back(opt.long_name);
    return val;
  }

  bool get_flag(const option_info& opt) override {
    bool res = ::get_flag(args_, opt.long_name);
    if (!opt.short_name.empty())
      res = ::get_flag(args_, opt.short_name) || res;
    return res;
  }

  void check() const {
    if (!missing_opts_.empty())
      throw std::invalid_argument{fmt::format(
          "Missing required options: {}", fmt::join(missing_opts_, ", "))};
  }

private:
  std::span<char*> args_;
  std::vector<std::string_view> missing_opts_;
};

class args_help_parser final : public parser_iface {
public:
  explicit args_help_parser(std::ostream& out) noexcept : out_{out} {}

  const char* get_option(const option_info& opt) override {
    describe(opt, " VAL");
    return nullptr;
  }

  const char* get_required_option(const option_info& opt) override {
    return get_option(opt);
  }

  bool get_flag(const option_info& opt) override {
    describe(opt, "");
    return false;
  }

private:
  void describe(const option_info& opt, std::string_view val) {
    out_ << '\t' << opt.long_name << (opt.short_name.empty() ? "" : ", ")
         << opt.short_name << val << '\t' << opt.description << '\n';
  }

private:
  std::ostream& out_;
};

class usage_parser final : public parser_iface {
public:
  explicit usage_parser(std::ostream& out) noexcept : out_{out} {}

  const char* get_option(const option_info& opt) override {
    out_ << " [" << opt.long_name << " VAL]";
    return nullptr;
  }
  const char* get_required_option(const option_info& opt) override {
    out_ << ' ' << (opt.short_name.empty() ? opt.long_name : opt.short_name)
         << " VAL";
    return nullptr;
  }
  bool get_flag(const option_info& opt) override {
    out_ << " [" << opt.long_name << ']';
    return false;
  }

private:
  std::ostream& out_;
};

} // namespace detail

template <typename T>
class option : private detail::option_info {
public:
  option(const char* long_name, const char* description)
      : detail::option_info{.long_name = long_name,
            .short_name = {},
            .description = description} {}

  option(const char* short_name, const char* long_name, const char* description)
      : detail::option_info{.long_name = long_name,
            .short_name = short_name,
            .description = description} {}

  option& default_value(const T& val) {
    default_ = val;
    return *this;
  }

  operator T() const {
    const char* val = default_
                          ? detail::current_parser->get_option(*this)
                          : detail::current_parser->get_required_option(*this);
    return val ? T{val} : default_.value_or(T{});
  }

private:
  std::optional<T> default_;
};

class flag : private detail::option_info {
public:
  flag(const char* long_name, const char* description)
      : detail::option_info{.long_name = long_name,
            .short_name = {},
            .description = description} {}

  flag(const char* short_name, const char* long_name, const char* description)
      : detail::option_info{.long_name = long_name,
            .short_name = short_name,
            .description = description} {}

  operator bool() const { return detail::current_parser->get_flag(*this); }
};

template <typename T>
T parse(std::span<char*> args) {
  detail::arguments_parser p{args};
  detail::current_parser = &p;
  T res{};
  detail::current_parser = nullptr;
  p.check();
  return res;
}

template <typename T>
void args_help(std::ostream& out) {
  detail::args_help_parser p{out};
  detail::current_parser = &p;
  [[maybe_unused]] T res{};
  detail::current_parser = nullptr;
}

template <typename T>
void usage(std::string_view progname, std::ostream& out) {
  out << "Usage: " << progname;
  detail::usage_parser p{out};
  detail::current_parser = &p;
  [[maybe_unused]] T res{};
  detail::current_parser = nullptr;
  out << '\n';
}

} // namespace args
