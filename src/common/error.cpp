#include <vellum/common/error.hpp>

namespace vellum::common {

std::string describe(const error& value) {
  auto out = std::string{};
  if (!value.codespace.empty()) {
    out += value.codespace;
    out += ": ";
  }
  out += to_string(value.code);
  out += " error: ";
  out += value.log;
  if (!value.info.empty()) {
    out += " (";
    out += value.info;
    out += ")";
  }
  return out;
}

}  // namespace vellum::common
