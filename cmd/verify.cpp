#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <distclean/project.h>
#include "options.h"


distclean::Result<void> Verify::exec() {
    auto project = distclean::Project::New(root.value_or(""));
    if (not project)
        return distclean::unexpected_move(project);

    auto spec = distclean::resolve_product(*project, product);
    if (not spec)
        return distclean::unexpected_move(spec);

    if (spec->dists.empty()) {
        spdlog::warn("product {:?} has no dist", product);
        return {};
    }

    for (const auto &dist : spec->dists) {
        if (auto res = dist.dister->verify(dist.output_dir, dist.rendered_name); not res)
            return distclean::wrap(res.error(), "{} dist of {}", dist.dister->type_name(), product);
        spdlog::info("{} dist {:?} of {} is in {:?}", dist.dister->type_name(), dist.rendered_name, product, dist.output_dir);
    }
    return {};
}
