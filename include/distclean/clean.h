#ifndef DISTCLEAN_CLEAN_H
#define DISTCLEAN_CLEAN_H

#include <distclean/error.h>
#include <distclean/plan.h>
#include <distclean/project.h>
#include <cstdio>
#include <string>
#include <vector>

#define DISTCLEAN_DRY_RUN_PREFIX "[DRY RUN]"


namespace distclean {
    /// binaries and dist artifacts of `spec` currently on disk
    Result<RemovalPlan> plan_product(const ProductSpec &spec);

    /// Remove the outputs of one product. A dry run prints what would be removed to `out` instead.
    Result<std::vector<std::string>> clean_product(const ProductSpec &spec, bool dry_run, std::FILE *out = stdout);

    /// all products when `names` is empty, stops at the first failure
    Result<void> clean_products(const Project &project, const std::vector<std::string> &names, bool dry_run, std::FILE *out = stdout);
} // namespace distclean

#endif
