/**
 * @file bpf_filesystem.hpp
 * @brief One-time initialization of the BPF filesystem used to pin maps
 * @author tproxy-compose Development Team
 * @date 2024
 */

#pragma once

#include "config.hpp"
#include <filesystem>
#include <string>

namespace tproxy {

/**
 * @class FilesystemMounter
 * @brief Interface for mounting the BPF filesystem
 */
class FilesystemMounter {
public:
    virtual ~FilesystemMounter() = default;

    /**
     * @brief Mount a bpf filesystem at the given directory
     * @throws std::runtime_error if the mount fails
     */
    virtual void mountBpf(const std::filesystem::path& target) = 0;
};

/**
 * @class SystemMounter
 * @brief FilesystemMounter calling mount(2); requires CAP_SYS_ADMIN
 */
class SystemMounter : public FilesystemMounter {
public:
    void mountBpf(const std::filesystem::path& target) override;
};

/**
 * @class BpfFilesystem
 * @brief Mounts the BPF filesystem unless it looks initialized already
 *
 * A directory tree that contains only (empty) directories counts as empty.
 * A non-empty directory is taken as already initialized and its contents
 * are not verified, so a partially initialized or foreign directory is
 * accepted as is. The check is not a lock: concurrent initialization from
 * several processes can mount twice.
 */
class BpfFilesystem {
public:
    /// Directory created below the mount point for tc global pins
    static constexpr const char* kTcGlobalsDir = "tc/globals";

    explicit BpfFilesystem(FilesystemMounter& mounter);

    /**
     * @brief Initialize the BPF filesystem if needed
     * @param path Mount point, which has to exist and be a directory
     * @return true if the filesystem was mounted, false if it was already
     *         initialized
     * @throws std::runtime_error if the path is missing or not a directory,
     *         the tree cannot be read, mounting fails or the pin directory
     *         cannot be created
     */
    bool initMaybe(const std::filesystem::path& path);

    /**
     * @brief Initialize the BPF filesystem at the configured path
     * @return false without touching the filesystem when ebpf is disabled,
     *         otherwise the result of initMaybe(config.bpffs_path)
     */
    bool initMaybe(const EbpfConfig& config);

    /**
     * @brief Check whether a directory tree contains no files
     * @throws std::filesystem::filesystem_error if the tree cannot be read
     */
    static bool isDirEmpty(const std::filesystem::path& path);

private:
    FilesystemMounter& mounter_;
};

} // namespace tproxy
