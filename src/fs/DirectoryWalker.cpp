#include "fs/DirectoryWalker.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <system_error>
#include <utility>
#include <sys/stat.h>

using namespace nf::logging;

namespace nf::fs {

// mtime of the link itself, std::filesystem only reports the target's
static std::filesystem::file_time_type linkMtime(const std::filesystem::path& p, std::error_code& ec) {
    struct stat st{};
    if (::lstat(p.c_str(), &st) != 0) {
        ec.assign(errno, std::generic_category());
        return {};
    }
    ec.clear();
    const auto sys = std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::seconds(st.st_mtim.tv_sec) + std::chrono::nanoseconds(st.st_mtim.tv_nsec)));
    return std::chrono::time_point_cast<std::filesystem::file_time_type::duration>(
        std::chrono::file_clock::from_sys(sys));
}

DirectoryWalker::DirectoryWalker(ExtensionFilter filter)
    : filter_(std::move(filter)) {}

std::vector<model::FileEntry> DirectoryWalker::walk(const std::filesystem::path& root) const {
    std::error_code ec;
    const auto st = std::filesystem::status(root, ec);
    if (ec) throw std::filesystem::filesystem_error("Cannot access walk root", root, ec);
    if (!std::filesystem::is_directory(st))
        throw std::filesystem::filesystem_error("Walk root is not a directory", root,
                                                std::make_error_code(std::errc::not_a_directory));

    std::vector<model::FileEntry> entries;
    walkDir(root, {}, entries);

    LogRegistry::fs()->debug("[DirectoryWalker] Collected {} entries under {}", entries.size(), root.string());
    return entries;
}

void DirectoryWalker::walkDir(const std::filesystem::path& root,
                              const std::filesystem::path& rel,
                              std::vector<model::FileEntry>& out) const {
    const auto dir = rel.empty() ? root : root / rel;

    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        if (rel.empty()) throw std::filesystem::filesystem_error("Cannot open walk root", dir, ec);
        LogRegistry::fs()->warn("Error accessing {}: {}", rel.string(), ec.message());
        return;
    }

    std::vector<std::filesystem::directory_entry> children;
    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) children.push_back(*it);
    // a failed increment leaves the iterator at end, keep what was read so far
    if (ec) LogRegistry::fs()->warn("Error reading {}: {}", rel.empty() ? dir.string() : rel.string(), ec.message());

    std::ranges::sort(children, {}, [](const std::filesystem::directory_entry& e) {
        return e.path().filename().native();
    });

    for (const auto& child : children) visit(child, root, rel / child.path().filename(), out);
}

void DirectoryWalker::visit(const std::filesystem::directory_entry& entry,
                            const std::filesystem::path& root,
                            const std::filesystem::path& rel,
                            std::vector<model::FileEntry>& out) const {
    std::error_code ec;

    const auto linkStatus = entry.symlink_status(ec);
    if (ec) {
        LogRegistry::fs()->warn("Error accessing {}: {}", rel.string(), ec.message());
        return;
    }

    if (std::filesystem::is_directory(linkStatus)) {
        walkDir(root, rel, out);
        return;
    }

    if (!filter_.matches(rel.filename().string())) return;

    const auto st = std::filesystem::is_symlink(linkStatus) ? entry.status(ec) : linkStatus;
    if (ec) {
        LogRegistry::fs()->warn("Error accessing {}: {}", rel.string(), ec.message());
        return;
    }

    model::FileEntry fe;
    fe.path = rel;

    // symlink to a directory: listed as the link, never descended
    if (std::filesystem::is_directory(st)) {
        fe.mtime = linkMtime(entry.path(), ec);
        if (ec) {
            LogRegistry::fs()->warn("Error reading modification time of {}: {}", rel.string(), ec.message());
            return;
        }
        out.push_back(std::move(fe));
        return;
    }

    fe.mtime = entry.last_write_time(ec);
    if (ec) {
        LogRegistry::fs()->warn("Error reading modification time of {}: {}", rel.string(), ec.message());
        return;
    }

    if (std::filesystem::is_regular_file(st)) {
        fe.size_bytes = entry.file_size(ec);
        if (ec) {
            LogRegistry::fs()->warn("Error reading size of {}: {}", rel.string(), ec.message());
            return;
        }
    }

    out.push_back(std::move(fe));
}

} // namespace nf::fs
