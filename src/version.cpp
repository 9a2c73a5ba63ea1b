#include "version.h"

#include "errors.h"
#include "util.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace quarry {

namespace {

struct tag_weight {
  std::string_view name;
  std::int64_t weight;
};

constexpr std::array<tag_weight, 5> kTagWeights{ {
    { "alpha", -1000000 },
    { "beta", -100000 },
    { "pre", -10000 },
    { "rc", -1000 },
    { "work", -10 },
} };

constexpr std::size_t kMaxDigits{ 18 };

bool is_dev_marker(std::string_view s) { return s == "scm" || s == "dev" || s == "git"; }

// Parses a modrev like "1.2.3" or "2.0rc1" into components. Offsets in errors are
// relative to the full input.
std::vector<std::int64_t> parse_modrev(std::string_view modrev,
                                       std::string_view full_text,
                                       std::size_t base_offset) {
  std::vector<std::int64_t> components;
  std::size_t i{ 0 };
  bool expect_token{ true };

  while (i < modrev.size()) {
    char const c{ modrev[i] };

    if (c == '.') {
      if (expect_token) {
        throw parse_error("unexpected '.' in version", base_offset + i, full_text);
      }
      expect_token = true;
      ++i;
      continue;
    }

    if (std::isdigit(static_cast<unsigned char>(c))) {
      std::size_t const start{ i };
      while (i < modrev.size() && std::isdigit(static_cast<unsigned char>(modrev[i]))) {
        ++i;
      }
      if (i - start > kMaxDigits) {
        throw parse_error("version component too large", base_offset + start, full_text);
      }
      std::int64_t value{ 0 };
      for (std::size_t j{ start }; j < i; ++j) { value = value * 10 + (modrev[j] - '0'); }
      components.push_back(value);
      expect_token = false;
      continue;
    }

    if (std::isalpha(static_cast<unsigned char>(c))) {
      std::size_t const start{ i };
      while (i < modrev.size() && std::isalpha(static_cast<unsigned char>(modrev[i]))) {
        ++i;
      }
      auto const word{ util_to_lower(modrev.substr(start, i - start)) };
      auto const it{ std::ranges::find_if(kTagWeights,
                                          [&](auto const &t) { return t.name == word; }) };
      if (it == kTagWeights.end()) {
        throw parse_error("unknown version tag '" + word + "'",
                          base_offset + start,
                          full_text);
      }
      components.push_back(it->weight);
      expect_token = false;
      continue;
    }

    throw parse_error(std::string{ "invalid character '" } + c + "' in version",
                      base_offset + i,
                      full_text);
  }

  if (components.empty()) {
    throw parse_error("version has no components", base_offset, full_text);
  }
  if (expect_token) {
    throw parse_error("trailing '.' in version", base_offset + modrev.size(), full_text);
  }

  return components;
}

std::strong_ordering compare_components(std::vector<std::int64_t> const &a,
                                        std::vector<std::int64_t> const &b) {
  std::size_t const n{ std::max(a.size(), b.size()) };
  for (std::size_t i{ 0 }; i < n; ++i) {
    std::int64_t const lhs{ i < a.size() ? a[i] : 0 };
    std::int64_t const rhs{ i < b.size() ? b[i] : 0 };
    if (lhs != rhs) { return lhs <=> rhs; }
  }
  return std::strong_ordering::equal;
}

}  // namespace

version version::parse(std::string_view text) {
  auto const trimmed{ util_trim(text) };
  if (trimmed.empty()) { throw parse_error("empty version", 0, text); }

  auto const leading{ static_cast<std::size_t>(trimmed.data() - text.data()) };

  version v;
  v.text_ = std::string{ trimmed };

  std::string_view modrev{ trimmed };
  if (auto const dash{ trimmed.rfind('-') }; dash != std::string_view::npos) {
    auto const rev{ trimmed.substr(dash + 1) };
    if (rev.empty() || rev.size() > kMaxDigits ||
        !std::ranges::all_of(rev, [](unsigned char c) { return std::isdigit(c); })) {
      throw parse_error("revision must be a non-negative integer",
                        leading + dash + 1,
                        text);
    }
    std::int64_t value{ 0 };
    for (char const c : rev) { value = value * 10 + (c - '0'); }
    v.specrev_ = value;
    v.explicit_specrev_ = true;
    modrev = trimmed.substr(0, dash);
  }

  if (modrev.empty()) { throw parse_error("empty version", leading, text); }

  if (auto const lowered{ util_to_lower(modrev) }; is_dev_marker(lowered)) {
    v.dev_ = true;
    v.dev_tag_ = lowered;
    return v;
  }

  v.components_ = parse_modrev(modrev, text, leading);
  return v;
}

std::optional<version> version::try_parse(std::string_view text) {
  try {
    return parse(text);
  } catch (parse_error const &) { return std::nullopt; }
}

version version::from_components(std::vector<std::int64_t> components,
                                 std::int64_t specrev) {
  version v;
  v.components_ = std::move(components);
  v.specrev_ = specrev;
  v.explicit_specrev_ = false;
  v.text_ = v.modrev_text();
  return v;
}

std::string version::modrev_text() const {
  if (dev_) { return dev_tag_; }
  if (!text_.empty()) {
    auto const dash{ text_.rfind('-') };
    return explicit_specrev_ && dash != std::string::npos ? text_.substr(0, dash) : text_;
  }

  std::string out;
  for (std::size_t i{ 0 }; i < components_.size(); ++i) {
    if (i) { out += '.'; }
    out += std::to_string(components_[i]);
  }
  return out;
}

bool version::is_prerelease() const {
  return std::ranges::any_of(components_, [](std::int64_t c) { return c < 0; });
}

std::size_t version::release_component_count() const {
  auto const it{ std::ranges::find_if(components_,
                                      [](std::int64_t c) { return c < 0; }) };
  return static_cast<std::size_t>(it - components_.begin());
}

std::strong_ordering version::compare_modrev(version const &other) const {
  if (dev_ != other.dev_) {
    return dev_ ? std::strong_ordering::less : std::strong_ordering::greater;
  }
  if (dev_) { return dev_tag_ <=> other.dev_tag_; }
  return compare_components(components_, other.components_);
}

std::strong_ordering version::operator<=>(version const &other) const {
  if (auto const c{ compare_modrev(other) }; c != std::strong_ordering::equal) { return c; }
  return specrev_ <=> other.specrev_;
}

}  // namespace quarry
