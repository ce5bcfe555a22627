#include <spdlog/spdlog.h>
#include <distclean/dister.h>

namespace fs = std::filesystem;
using namespace distclean;


std::vector<std::string> ManualDister::artifacts(const std::string &rendered_name) const {
    if (extension.empty())
        return {rendered_name};
    return {rendered_name + '.' + extension};
}

Result<void> ManualDister::run_dist(const fs::path &output_dir) const {
    // the dist script does all the work
    spdlog::debug("manual dist into {:?}: nothing to do", output_dir.string());
    return {};
}

Result<void> ManualDister::verify(const fs::path &output_dir, const std::string &rendered_name) const {
    const auto paths = artifacts(rendered_name);
    if (paths.size() != 1)
        return unexpected_errorf(errc::config, "manual distribution must produce a single artifact, got {}", paths.size());

    const fs::path artifact = output_dir / paths.front();

    std::error_code ec;
    auto status = fs::status(artifact, ec);
    if (status.type() == fs::file_type::not_found)
        return unexpected_errorf(errc::io, "expected output does not exist at {:?}", artifact.string());
    if (ec)
        return unexpected_errorf(errc::io, "cannot stat {:?}: {}", artifact.string(), ec.message());
    if (fs::is_directory(status))
        return unexpected_errorf(errc::io, "output at {:?} is a directory", artifact.string());

    return {};
}

Result<std::unique_ptr<Dister>> distclean::make_dister(const DistConfig &cfg) {
    const std::string type = cfg.type.value_or(ManualDister::type);
    if (type == ManualDister::type)
        return std::make_unique<ManualDister>(cfg.extension.value_or(""));

    return unexpected_errorf(errc::config, "unknown dist type {:?}", type);
}
