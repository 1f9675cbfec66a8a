#include "hoststore/storage/root_resolver.hpp"
#include "hoststore/storage/fs_ops.hpp"
#include "hoststore/core/log.hpp"

#include <algorithm>
#include <utility>

namespace hoststore::storage {

using namespace hoststore::core;

// ========================================================================
// Internal Helpers
// ========================================================================

namespace {

struct MarkerSet {
    const char* first;
    const char* second;
};

constexpr MarkerSet kRootMarkerSets[] = {
    {"web", "comfy"},
    {"web", "custom_nodes"},
    {"server.py", "main.py"},
};

// p, parent(p), ..., "/"
std::vector<std::string> ancestors_including_self(const std::string& p) {
    std::vector<std::string> chain;
    std::string cur = p;
    for (;;) {
        chain.push_back(cur);
        std::string parent = path_parent(cur);
        if (parent.empty() || parent == cur) {
            break;
        }
        cur = std::move(parent);
    }
    return chain;
}

void note_scanned(DiscoveryReport* report, const std::string& dir) {
    if (!report) return;
    if (std::find(report->scanned.begin(), report->scanned.end(), dir) == report->scanned.end()) {
        report->scanned.push_back(dir);
    }
}

// Looks for a custom_nodes component in the chain (the path itself, or the
// parent of the path) and accepts its parent when that carries markers.
bool scan_custom_nodes(const std::vector<std::string>& chain, DiscoveryReport* report, std::string* found) {
    for (const std::string& dir : chain) {
        note_scanned(report, dir);
        if (path_filename(dir) == kCustomNodesDirName) {
            std::string candidate = path_parent(dir);
            if (has_root_markers(candidate)) {
                *found = candidate;
                return true;
            }
        }
        std::string parent = path_parent(dir);
        if (!parent.empty() && parent != dir && path_filename(parent) == kCustomNodesDirName) {
            std::string candidate = path_parent(parent);
            if (has_root_markers(candidate)) {
                *found = candidate;
                return true;
            }
        }
    }
    return false;
}

Status found_root(HostRoot* out, std::string path, DiscoveryStep step, bool preserved) {
    HOSTSTORE_LOG_INFO("discovery", "host root %s (%s)", path.c_str(), discovery_step_name(step));
    out->path = std::move(path);
    out->step = step;
    out->symlinks_preserved = preserved;
    return ok_status();
}

} // namespace

// ========================================================================
// Public API Implementation
// ========================================================================

bool has_root_markers(const std::string& dir) noexcept {
    for (const MarkerSet& m : kRootMarkerSets) {
        if (path_exists(path_join(dir, m.first)) && path_exists(path_join(dir, m.second))) {
            return true;
        }
    }
    return false;
}

Status resolve_host_root(const Config& cfg, HostRoot* out, DiscoveryReport* report) noexcept {
    if (!out) {
        return make_status(StatusDomain::Discovery, StatusCode::Invalid);
    }

    // Scanned paths are always collected for the failure log.
    DiscoveryReport local;
    if (!report) {
        report = &local;
    }

    const bool resolve_all = cfg.strategy == ScanStrategy::ResolveAll;
    const std::string cwd = cfg.cwd;

    if (report) {
        report->cwd = cwd;
        report->scanned.clear();
    }

    // 1) Explicit override wins without a marker check.
    if (!cfg.root_override.empty()) {
        std::string p = path_absolute(cfg.root_override, cwd);
        if (resolve_all) {
            p = path_resolve(p);
        }
        return found_root(out, std::move(p), DiscoveryStep::EnvOverride, !resolve_all);
    }

    std::string start = path_absolute(cfg.install_path.empty() ? cwd : cfg.install_path, cwd);
    const std::string resolved_start = path_resolve(start);
    if (resolve_all) {
        start = resolved_start;
    }
    if (report) {
        report->start = start;
    }

    const std::vector<std::string> chain = ancestors_including_self(start);
    const std::vector<std::string> resolved_chain = ancestors_including_self(resolved_start);

    std::string candidate;

    // 2) Symlink-preserving custom_nodes scan.
    if (cfg.strategy != ScanStrategy::ResolveAll && scan_custom_nodes(chain, report, &candidate)) {
        return found_root(out, std::move(candidate), DiscoveryStep::CustomNodesScan, true);
    }

    // 3) Same scan over the real path.
    if (cfg.strategy != ScanStrategy::PreserveSymlink && scan_custom_nodes(resolved_chain, report, &candidate)) {
        return found_root(out, std::move(candidate), DiscoveryStep::ResolvedCustomNodesScan, false);
    }

    // 4) Marker-only scan.
    const bool preserve = cfg.strategy == ScanStrategy::PreserveSymlink;
    const std::vector<std::string>& bases = preserve ? chain : resolved_chain;
    for (const std::string& dir : bases) {
        note_scanned(report, dir);
        if (has_root_markers(dir)) {
            return found_root(out, dir, DiscoveryStep::MarkerScan, preserve);
        }
    }

    // 5) Working directory that looks like a portable host install.
    if (!cwd.empty()) {
        note_scanned(report, cwd);
        if (is_directory(path_join(cwd, kUserDirName)) && is_directory(path_join(cwd, kCustomNodesDirName))) {
            return found_root(out, cwd, DiscoveryStep::WorkingDirectory, true);
        }
    }

    // 6) custom_nodes ancestor without markers, accepted when its parent has user/.
    for (const std::string& dir : bases) {
        if (path_filename(dir) != kCustomNodesDirName) continue;
        std::string parent = path_parent(dir);
        if (is_directory(path_join(parent, kUserDirName))) {
            return found_root(out, std::move(parent), DiscoveryStep::CustomNodesWithUserDir, preserve);
        }
    }

    HOSTSTORE_LOG_ERROR("discovery",
                        "could not find the host root from %s (cwd %s) after %zu directories; install the "
                        "extension under <root>/custom_nodes/ or set %s",
                        start.c_str(), cwd.c_str(), report->scanned.size(), kEnvHostRoot);
    for (const std::string& dir : report->scanned) {
        HOSTSTORE_LOG_WARN("discovery", "  scanned %s", dir.c_str());
    }
    return make_status(StatusDomain::Discovery, StatusCode::NotFound, static_cast<u32>(report->scanned.size()));
}

const char* discovery_step_name(DiscoveryStep step) noexcept {
    switch (step) {
    case DiscoveryStep::EnvOverride: return "env override";
    case DiscoveryStep::CustomNodesScan: return "custom_nodes scan";
    case DiscoveryStep::ResolvedCustomNodesScan: return "resolved custom_nodes scan";
    case DiscoveryStep::MarkerScan: return "marker scan";
    case DiscoveryStep::WorkingDirectory: return "working directory";
    case DiscoveryStep::CustomNodesWithUserDir: return "custom_nodes parent with user dir";
    }
    return "unknown";
}

} // namespace hoststore::storage
