#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <distclean/clean.h>
#include <distclean/classify.h>
#include <distclean/dist_match.h>
#include <distclean/remover.h>

using namespace distclean;


Result<RemovalPlan> distclean::plan_product(const ProductSpec &spec) {
    auto bins = classify_bin_output(spec.bin_output_dir, ProductTargets{{spec.name, spec.os_archs}});
    if (not bins)
        return unexpected_move(bins);

    std::vector<DistOutput> dists;
    for (const auto &dist : spec.dists) {
        auto patterns = dist_patterns(spec.name, dist.dister->artifacts(dist.rendered_name));
        dists.push_back(DistOutput{.dir = dist.output_dir, .entries = match_dist_output(dist.output_dir, patterns)});
    }

    return plan_removals({BinOutput{.root = spec.bin_output_dir, .paths = std::move(*bins)}}, dists);
}

Result<std::vector<std::string>> distclean::clean_product(const ProductSpec &spec, bool dry_run, std::FILE *out) {
    auto plan = plan_product(spec);
    if (not plan)
        return unexpected_move(plan);

    spdlog::debug("clean {:?}: {} path(s) planned", spec.name, plan->size());

    if (not dry_run)
        return execute(*plan, false);

    fmt::print(out, "{} Clean {} will remove paths:\n", DISTCLEAN_DRY_RUN_PREFIX, spec.name);
    return execute(*plan, true, [out](const std::string &path) { fmt::print(out, "{}     {}\n", DISTCLEAN_DRY_RUN_PREFIX, path); });
}

Result<void> distclean::clean_products(const Project &project, const std::vector<std::string> &names, bool dry_run, std::FILE *out) {
    std::vector<std::string> products = names;
    if (products.empty())
        for (const auto &[name, _] : project.product)
            products.push_back(name);

    for (const auto &name : products) {
        auto spec = resolve_product(project, name);
        if (not spec)
            return unexpected_move(spec);

        auto removed = clean_product(*spec, dry_run, out);
        if (not removed)
            return wrap(removed.error(), "failed to clean {}", name);

        if (not dry_run)
            spdlog::info("cleaned {}: {} path(s) removed", name, removed->size());
    }

    return {};
}
