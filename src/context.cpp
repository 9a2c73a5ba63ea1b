#include "context.h"

namespace quarry {

variable_map context_default_variables(std::string_view os) {
  bool const mac{ os == "macosx" };
  return {
    { "CC", "cc" },
    { "LD", "cc" },
    { "CFLAGS", "-O2 -fPIC" },
    { "LIBFLAG", mac ? "-bundle -undefined dynamic_lookup -all_load" : "-shared" },
    { "MAKE", "make" },
    { "CMAKE", "cmake" },
    { "LIB_EXTENSION", "so" },
  };
}

variable_map context_merge_variables(variable_map defaults, variable_map const &overrides) {
  for (auto const &[k, v] : overrides) { defaults[k] = v; }
  return defaults;
}

}  // namespace quarry
