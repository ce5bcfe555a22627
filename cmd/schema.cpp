#include <fmt/ranges.h>
#include <rfl/json.hpp>
#include <distclean/project.h>
#include "options.h"


distclean::Result<void> Schema::exec() {
    auto j = rfl::json::to_schema<distclean::Project>(YYJSON_WRITE_PRETTY_TWO_SPACES);
    fmt::print("{}\n", j);
    return {};
}
