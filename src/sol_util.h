#pragma once

#include "util.h"

#include "sol/sol.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace quarry {

using sol_state_ptr = std::unique_ptr<sol::state>;

// Full standard libraries, error()/assert() augmented with tracebacks. For trusted
// local files such as the project manifest.
sol_state_ptr sol_util_make_lua_state();

// base (without dofile/loadfile, text-only load), string, table and math. For
// registry manifests, rockspecs and build scripts.
sol_state_ptr sol_util_make_sandboxed_state();

// Runs `code` as a chunk named `chunk_name`. Throws std::runtime_error carrying the Lua
// error message.
void sol_util_run_script(sol::state &lua, std::string_view code, std::string const &chunk_name);

// Deadline for evaluating registry manifests and rockspecs.
inline constexpr std::chrono::milliseconds kSolUtilEvalTimeout{ 10000 };

// While alive, chunks running on `lua` raise a Lua error once `limit` has elapsed or
// `*cancel` turns true. Checked every kHookInstructionCount VM instructions.
class sol_util_script_guard : unmovable {
 public:
  static constexpr int kHookInstructionCount{ 1000 };

  sol_util_script_guard(sol::state &lua,
                        std::chrono::milliseconds limit,
                        std::atomic_bool const *cancel = nullptr);
  ~sol_util_script_guard();

  bool timed_out() const { return timed_out_; }
  bool was_cancelled() const { return was_cancelled_; }

 private:
  static void hook(lua_State *L, lua_Debug *);

  lua_State *L_;
  std::chrono::steady_clock::time_point deadline_;
  std::atomic_bool const *cancel_;
  sol_util_script_guard *previous_;
  bool timed_out_{ false };
  bool was_cancelled_{ false };
};

namespace detail {

template <typename T>
constexpr std::string_view type_name_for_error() {
  if constexpr (std::is_same_v<T, bool>) {
    return "boolean";
  } else if constexpr (std::is_same_v<T, std::string>) {
    return "string";
  } else if constexpr (std::is_same_v<T, sol::table>) {
    return "table";
  } else if constexpr (std::is_same_v<T, sol::protected_function> ||
                       std::is_same_v<T, sol::function>) {
    return "function";
  } else if constexpr (std::is_integral_v<T> || std::is_floating_point_v<T>) {
    return "number";
  } else {
    return "value";
  }
}

inline bool is_absent(sol::optional<sol::object> const &obj) {
  return !obj || !obj->valid() || obj->get_type() == sol::type::lua_nil;
}

[[noreturn]] inline void throw_wrong_type(std::string_view context,
                                          std::string_view key,
                                          std::string_view type_name) {
  throw std::runtime_error(std::string(context) + ": " + std::string(key) +
                           " must be a " + std::string(type_name));
}

}  // namespace detail

template <typename T>
std::optional<T> sol_util_get_optional(sol::table const &table,
                                       std::string_view key,
                                       std::string_view context) {
  sol::optional<sol::object> obj = table[key];
  if (detail::is_absent(obj)) { return std::nullopt; }

  // sol coerces numbers to strings; rockspec fields must be real strings.
  if constexpr (std::is_same_v<T, std::string>) {
    if (obj->get_type() != sol::type::string) {
      detail::throw_wrong_type(context, key, detail::type_name_for_error<T>());
    }
  }

  if (!obj->is<T>()) {
    detail::throw_wrong_type(context, key, detail::type_name_for_error<T>());
  }

  return obj->as<T>();
}

template <typename T>
T sol_util_get_required(sol::table const &table,
                        std::string_view key,
                        std::string_view context) {
  auto value{ sol_util_get_optional<T>(table, key, context) };
  if (!value) {
    throw std::runtime_error(std::string(context) + ": " + std::string(key) +
                             " is required");
  }
  return std::move(*value);
}

template <typename T>
T sol_util_get_or_default(sol::table const &table,
                          std::string_view key,
                          T const &default_value,
                          std::string_view context) {
  auto opt{ sol_util_get_optional<T>(table, key, context) };
  return opt.value_or(default_value);
}

// Array of strings at `key`. A bare string is accepted as a one-element list.
std::vector<std::string> sol_util_get_string_list(sol::table const &table,
                                                  std::string_view key,
                                                  std::string_view context);

}  // namespace quarry
