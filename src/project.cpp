#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <rfl/toml.hpp>
#include <rfl/json.hpp>
#include <distclean/project.h>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using namespace distclean;


Result<Project> Project::parse(const std::string &content, bool toml, const std::string &project_dir) {
    auto res = toml ? rfl::toml::read<Project>(content) : rfl::json::read<Project>(content);
    if (not res)
        return unexpected_errorf(errc::config, "{}", res.error().what());

    Project project = std::move(res.value());
    project.project_dir = project_dir;
    return project;
}

Result<Project> Project::New(const std::string &root_dir) {
    std::error_code ec;
    fs::path root = root_dir.empty() ? fs::current_path(ec) : fs::path(root_dir);
    if (ec)
        return unexpected_errorf(errc::io, "failed to get current directory: {}", ec.message());

    root = fs::absolute(root, ec).lexically_normal();
    if (ec)
        return unexpected_errorf(errc::io, "failed to resolve root dir {:?}: {}", root_dir, ec.message());

    fs::path file;
    for (const char *name : {"distclean.toml", "distclean.json"}) {
        bool found = fs::exists(root / name, ec);
        if (ec)
            return unexpected_errorf(errc::io, "failed to check {:?}: {}", (root / name).string(), ec.message());
        if (found) {
            file = root / name;
            break;
        }
    }
    if (file.empty())
        return unexpected_errorf(errc::config, "Cannot find {:?} and {:?} in the root dir {:?}", "distclean.toml",
                                 "distclean.json", root.string());
    spdlog::debug("using {:?}", file.string());

    std::ifstream is(file);
    if (not is.is_open())
        return unexpected_errorf(errc::config, "File {:?} is not readable", file.string());

    std::stringstream ss;
    ss << is.rdbuf();

    auto project = parse(ss.str(), file.extension().string() == ".toml", root.string());
    if (not project)
        return wrap(project.error(), "Cannot parse {:?}", file.string());

    return project;
}

std::string distclean::render_name_template(const std::string &name_template, const std::string &product, const std::string &version) {
    std::string result;
    std::size_t pos = 0;
    while (pos < name_template.size()) {
        auto open = name_template.find("{{", pos);
        auto close = open == std::string::npos ? std::string::npos : name_template.find("}}", open + 2);
        if (close == std::string::npos)
            break;

        result.append(name_template, pos, open - pos);
        const std::string key = name_template.substr(open + 2, close - open - 2);
        if (key == "Product")
            result += product;
        else if (key == "Version")
            result += version;
        else
            result.append(name_template, open, close + 2 - open);
        pos = close + 2;
    }
    if (pos < name_template.size())
        result.append(name_template, pos);
    return result;
}

static std::string resolve_dir(const std::string &project_dir, const std::string &dir) {
    fs::path p = dir;
    if (p.is_relative())
        p = fs::path(project_dir) / p;
    return p.lexically_normal().string();
}

Result<ProductSpec> distclean::resolve_product(const Project &project, const std::string &name) {
    auto it = project.product.find(name);
    if (it == project.product.end()) {
        std::vector<std::string> available;
        for (const auto &[key, _] : project.product)
            available.push_back(key);
        return unexpected_errorf(errc::config, "product {:?} does not exist, available: {}", name, available);
    }

    const auto &cfg = it->second;
    const std::string &project_dir = project.project_dir();
    const std::string version = project.version.value_or("unspecified");

    ProductSpec spec = {
        .name = name,
        .bin_output_dir = resolve_dir(project_dir, cfg.output_dir.value_or(DISTCLEAN_DEFAULT_BIN_DIR)),
    };

    if (cfg.os_archs) {
        for (const auto &s : *cfg.os_archs) {
            auto os_arch = OSArch::parse(s);
            if (not os_arch)
                return wrap(os_arch.error(), "product {:?}", name);
            spec.os_archs.push_back(std::move(*os_arch));
        }
    } else {
        spec.os_archs.push_back(OSArch::current());
    }

    for (const auto &dist : cfg.dist.value_or(std::vector<DistConfig>{})) {
        auto dister = make_dister(dist);
        if (not dister)
            return wrap(dister.error(), "product {:?}", name);

        spec.dists.push_back(DistSpec{
            .output_dir = resolve_dir(project_dir, dist.output_dir.value_or(DISTCLEAN_DEFAULT_DIST_DIR)),
            .rendered_name = render_name_template(dist.name_template.value_or(DISTCLEAN_DEFAULT_NAME_TEMPLATE), name, version),
            .dister = std::move(*dister),
        });
    }

    spdlog::debug("product {:?}: bin output {:?}, os-archs {}, {} dist(s)", name, spec.bin_output_dir, spec.os_archs,
                  spec.dists.size());
    return spec;
}
