#include <fmt/ranges.h>
#include <distclean/clean.h>
#include "options.h"


distclean::Result<void> Clean::exec() {
    auto project = distclean::Project::New(root.value_or(""));
    if (not project)
        return distclean::unexpected_move(project);

    return distclean::clean_products(*project, products.value_or(std::vector<std::string>{}), dry_run);
}
