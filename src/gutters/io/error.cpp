/**
 * @file error.cpp
 * @brief "gutters" error category.
 */
#include "gutters/io/error.hpp"

#include <string>

namespace gutters {

namespace {

class GutterCategory final : public std::error_category {
public:
  const char* name() const noexcept override { return "gutters"; }

  std::string message(int ev) const override {
    switch (static_cast<GutterError>(ev)) {
      case GutterError::UnexpectedEof: return "stream ended before the whole log arrived";
      case GutterError::WriteZero:     return "gutter accepted zero bytes";
      case GutterError::NotOpen:       return "gutter is not open";
      case GutterError::ResolveFailed: return "could not resolve host/port";
    }
    return "unknown gutters error";
  }

  std::error_condition default_error_condition(int ev) const noexcept override {
    if (static_cast<GutterError>(ev) == GutterError::NotOpen) {
      return std::errc::bad_file_descriptor;
    }
    return std::error_condition(ev, *this);
  }
};

} // namespace

const std::error_category& gutter_category() noexcept {
  static const GutterCategory cat;
  return cat;
}

std::error_code make_error_code(GutterError e) noexcept {
  return std::error_code(static_cast<int>(e), gutter_category());
}

} // namespace gutters
