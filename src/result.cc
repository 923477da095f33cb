#include "codebox/result.hpp"

#include <cerrno>

namespace codebox {

namespace {

class CodeboxCategory final : public std::error_category {
 public:
  [[nodiscard]] const char* name() const noexcept override { return "codebox"; }

  [[nodiscard]] std::string message(int value) const override {
    switch (static_cast<errc>(value)) {
      case errc::ok:
        return "success";
      case errc::empty_argv:
        return "no program to run";
      case errc::invalid_config:
        return "invalid configuration";
      case errc::no_process:
        return "no process attached";
      case errc::timeout:
        return "time limit exceeded";
    }
    return "unrecognised codebox error " + std::to_string(value);
  }
};

}  // namespace

const std::error_category& error_category() noexcept {
  static const CodeboxCategory category;
  return category;
}

std::error_code make_error_code(errc value) noexcept {
  return {static_cast<int>(value), error_category()};
}

Error errno_error(std::string context) {
  return Error{.code = std::error_code(errno, std::system_category()),
               .context = std::move(context)};
}

std::string describe(const Error& error) {
  auto message = error.code.message();
  return error.context.empty() ? message : error.context + ": " + message;
}

}  // namespace codebox
