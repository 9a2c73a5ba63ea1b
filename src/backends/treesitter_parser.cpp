#include "backends/build_backend.h"
#include "backends/external_deps.h"

#include "errors.h"
#include "platform.h"
#include "tui.h"

namespace quarry {

namespace {

std::string var(variable_map const &vars, std::string const &key) {
  auto const it{ vars.find(key) };
  return it == vars.end() ? std::string{} : it->second;
}

void generate_grammar(build_context const &ctx,
                      variable_map const &vars,
                      std::filesystem::path const &grammar_dir) {
  auto argv{ backend_detail::split_words(var(vars, "TREE_SITTER")) };
  if (argv.empty()) { argv.push_back("tree-sitter"); }
  argv.push_back("generate");
  if (auto const abi{ var(vars, "TREE_SITTER_LANGUAGE_VERSION") }; !abi.empty()) {
    argv.insert(argv.end(), { "--abi", abi });
  }

  auto const r{ backend_detail::run_tool(argv, grammar_dir, std::nullopt, ctx.cancel) };
  if (r.exit_code != 0) { throw tool_exit_nonzero(argv.front(), r.exit_code, r.output); }
}

}  // namespace

installed_files backend_treesitter_parser(treesitter_parser_spec const &spec,
                                          package_descriptor const &d,
                                          build_context const &ctx) {
  std::filesystem::path const location{ spec.location.value_or(".") };
  auto const grammar_dir{ backend_detail::require_source_file(ctx, location.string()) };
  auto const vars{ context_merge_variables(
      ctx.variables,
      external_deps_resolve(d.external_dependencies, ctx.variables, ctx.cancel)) };

  if (spec.generate) {
    tui::debug("%s: generating the %s grammar", d.name.c_str(), spec.lang.c_str());
    generate_grammar(ctx, vars, grammar_dir);
  }

  installed_files out;
  if (spec.parser) {
    auto const src{ (location / "src").lexically_normal() };
    native_module m{ .module = "parser." + spec.lang,
                     .sources = { (src / "parser.c").string() },
                     .incdirs = { src.string() } };
    if (platform::file_exists(ctx.source_dir / src / "scanner.c")) {
      m.sources.push_back((src / "scanner.c").string());
    }

    std::filesystem::path const rel{ std::filesystem::path{ "parser" } /
                                     (spec.lang + "." + backend_detail::lib_extension(vars)) };
    auto const built{ ctx.scratch_dir / rel };
    backend_detail::compile_native(m, ctx, vars, {}, built);
    out.push_back({ rel, built });
  }

  for (auto const &[file, text] : spec.queries) {
    out.push_back({ std::filesystem::path{ "queries" } / file, text });
  }

  backend_detail::append_install_spec(out, d, ctx);
  return out;
}

}  // namespace quarry
