#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quarry {

// A rock version, "modrev-specrev". modrev is a dotted numeric list that may carry
// alpha/beta/pre/rc/work tags, or one of the development markers scm/dev/git.
// specrev defaults to 1 when absent.
//
// Ordering: development versions sort below every release; otherwise modrev is
// compared component-wise (missing trailing components are 0), then specrev.
class version {
 public:
  version() = default;

  static version parse(std::string_view text);  // throws parse_error
  static std::optional<version> try_parse(std::string_view text);
  static version from_components(std::vector<std::int64_t> components,
                                 std::int64_t specrev = 1);

  std::string const &text() const { return text_; }
  std::string modrev_text() const;

  bool is_dev() const { return dev_; }
  bool is_prerelease() const;
  bool has_specrev() const { return explicit_specrev_; }
  std::int64_t specrev() const { return specrev_; }
  std::vector<std::int64_t> const &components() const { return components_; }

  // Number of leading numeric components before any tag weight.
  std::size_t release_component_count() const;

  std::strong_ordering compare_modrev(version const &other) const;

  std::strong_ordering operator<=>(version const &other) const;
  bool operator==(version const &other) const {
    return (*this <=> other) == std::strong_ordering::equal;
  }

 private:
  std::string text_;
  std::string dev_tag_;
  std::vector<std::int64_t> components_;
  std::int64_t specrev_{ 1 };
  bool explicit_specrev_{ false };
  bool dev_{ false };
};

}  // namespace quarry
