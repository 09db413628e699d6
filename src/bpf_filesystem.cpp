#include "bpf_filesystem.hpp"
#include "logger.hpp"
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <sys/mount.h>

namespace tproxy {

namespace {

constexpr const char* kComponent = "BpfFilesystem";

} // namespace

void SystemMounter::mountBpf(const std::filesystem::path& target) {
    if (mount("bpf", target.c_str(), "bpf", 0, nullptr) != 0) {
        throw std::runtime_error(std::strerror(errno));
    }
}

BpfFilesystem::BpfFilesystem(FilesystemMounter& mounter)
    : mounter_(mounter) {}

bool BpfFilesystem::isDirEmpty(const std::filesystem::path& path) {
    // Any file or symlink makes the tree non-empty; directories are descended
    for (const auto& entry : std::filesystem::directory_iterator(path)) {
        if (!entry.is_directory() || entry.is_symlink()) {
            return false;
        }
        if (!isDirEmpty(entry.path())) {
            return false;
        }
    }
    return true;
}

bool BpfFilesystem::initMaybe(const std::filesystem::path& path) {
    std::error_code ec;
    auto status = std::filesystem::status(path, ec);
    if (ec) {
        throw std::runtime_error("stat " + path.string() + ": " + ec.message());
    }
    if (!std::filesystem::is_directory(status)) {
        throw std::runtime_error("bpf fs path (" + path.string() + ") is not a directory");
    }

    bool empty = false;
    try {
        empty = isDirEmpty(path);
    } catch (const std::filesystem::filesystem_error& e) {
        throw std::runtime_error(
            "checking if BPF file system path is empty failed: " + std::string(e.what()));
    }

    if (!empty) {
        Logger::warning(kComponent, "BPF file system path " + path.string() +
                        " is not empty, assuming it is already initialized (contents not verified)");
        return false;
    }

    try {
        mounter_.mountBpf(path);
    } catch (const std::exception& e) {
        throw std::runtime_error("mounting BPF file system failed: " + std::string(e.what()));
    }

    // Pin directory for tc programs, owner rwx and group rx on both levels
    std::filesystem::path globals = path / kTcGlobalsDir;
    std::filesystem::create_directories(globals, ec);
    for (const auto& dir : {globals.parent_path(), globals}) {
        if (ec) break;
        std::filesystem::permissions(dir, static_cast<std::filesystem::perms>(0750),
                                     std::filesystem::perm_options::replace, ec);
    }
    if (ec) {
        throw std::runtime_error(
            "making directory for tc globals pinning failed: " + ec.message());
    }

    Logger::info(kComponent, "Mounted BPF file system at " + path.string());
    return true;
}

bool BpfFilesystem::initMaybe(const EbpfConfig& config) {
    if (!config.enabled) {
        Logger::debug(kComponent, "eBPF is disabled, skipping BPF file system initialization");
        return false;
    }
    return initMaybe(std::filesystem::path(config.bpffs_path));
}

} // namespace tproxy
