#include "context.h"

#include "doctest.h"

namespace quarry {

TEST_CASE("context default variables follow the platform") {
  auto const linux_vars{ context_default_variables("linux") };
  CHECK(linux_vars.at("LIBFLAG") == "-shared");
  CHECK(linux_vars.at("CFLAGS") == "-O2 -fPIC");
  CHECK(context_default_variables("macosx").at("LIBFLAG").starts_with("-bundle"));
}

TEST_CASE("context_merge_variables overrides defaults") {
  auto const merged{ context_merge_variables(context_default_variables("linux"),
                                             { { "CC", "clang" }, { "EXTRA", "1" } }) };
  CHECK(merged.at("CC") == "clang");
  CHECK(merged.at("EXTRA") == "1");
  CHECK(merged.at("LD") == "cc");
}

}  // namespace quarry
