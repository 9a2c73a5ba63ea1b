#include "sol_util.h"

namespace quarry {

namespace {

thread_local sol_util_script_guard *t_guard{ nullptr };

}  // namespace

sol_util_script_guard::sol_util_script_guard(sol::state &lua,
                                             std::chrono::milliseconds limit,
                                             std::atomic_bool const *cancel)
    : L_{ lua.lua_state() },
      deadline_{ std::chrono::steady_clock::now() + limit },
      cancel_{ cancel },
      previous_{ t_guard } {
  t_guard = this;
  lua_sethook(L_, &sol_util_script_guard::hook, LUA_MASKCOUNT, kHookInstructionCount);
}

sol_util_script_guard::~sol_util_script_guard() {
  lua_sethook(L_, nullptr, 0, 0);
  t_guard = previous_;
}

void sol_util_script_guard::hook(lua_State *L, lua_Debug *) {
  auto *g{ t_guard };
  if (!g) { return; }
  if (g->cancel_ && g->cancel_->load()) {
    g->was_cancelled_ = true;
    luaL_error(L, "cancelled");
  }
  if (std::chrono::steady_clock::now() > g->deadline_) {
    g->timed_out_ = true;
    luaL_error(L, "script deadline exceeded");
  }
}

sol_state_ptr sol_util_make_lua_state() {
  auto lua{ std::make_unique<sol::state>() };
  lua->open_libraries(sol::lib::base,
                      sol::lib::package,
                      sol::lib::coroutine,
                      sol::lib::string,
                      sol::lib::os,
                      sol::lib::math,
                      sol::lib::table,
                      sol::lib::debug,
                      sol::lib::io);

  lua->script(R"lua(
do
  local orig_error = error
  local orig_assert = assert

  _G.error = function(message, level)
    level = (level or 1) + 1
    return orig_error(debug.traceback(tostring(message), level), 0)
  end

  _G.assert = function(condition, message, ...)
    if not condition then
      message = message or "assertion failed"
      return orig_assert(false, debug.traceback(tostring(message), 2))
    end
    return condition, message, ...
  end
end
)lua");

  return lua;
}

sol_state_ptr sol_util_make_sandboxed_state() {
  auto lua{ std::make_unique<sol::state>() };
  lua->open_libraries(sol::lib::base, sol::lib::string, sol::lib::table, sol::lib::math);

  lua->script(R"lua(
do
  local orig_load = load
  dofile = nil
  loadfile = nil
  collectgarbage = nil
  load = function(chunk, name, mode, ...)
    if select("#", ...) > 0 then return orig_load(chunk, name, "t", ...) end
    return orig_load(chunk, name, "t")
  end
end
)lua");

  return lua;
}

void sol_util_run_script(sol::state &lua,
                         std::string_view code,
                         std::string const &chunk_name) {
  auto const result{ lua.safe_script(code, sol::script_pass_on_error, chunk_name) };
  if (!result.valid()) {
    sol::error err = result;
    throw std::runtime_error(err.what());
  }
}

std::vector<std::string> sol_util_get_string_list(sol::table const &table,
                                                  std::string_view key,
                                                  std::string_view context) {
  sol::optional<sol::object> obj = table[key];
  if (detail::is_absent(obj)) { return {}; }

  if (obj->get_type() == sol::type::string) { return { obj->as<std::string>() }; }
  if (obj->get_type() != sol::type::table) {
    detail::throw_wrong_type(context, key, "list of strings");
  }

  auto const list{ obj->as<sol::table>() };
  std::vector<std::string> out;
  for (std::size_t i{ 1 }, n{ list.size() }; i <= n; ++i) {
    sol::object const item{ list[i] };
    if (item.get_type() != sol::type::string) {
      throw std::runtime_error(std::string(context) + ": " + std::string(key) + "[" +
                               std::to_string(i) + "] must be a string");
    }
    out.push_back(item.as<std::string>());
  }
  return out;
}

}  // namespace quarry
