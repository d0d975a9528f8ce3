// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef GHAFS_VFS_FUSE_HOST_HPP
#define GHAFS_VFS_FUSE_HOST_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <sys/stat.h>
#include <sys/types.h>

#include "ghafs/core/context.hpp"
#include "ghafs/core/error_handling.hpp"
#include "ghafs/vfs/release_filesystem.hpp"

namespace ghafs::vfs
{
    /** The `stat` structure reported to the kernel for an entry. */
    [[nodiscard]] auto to_stat(const Attributes& attrs, uid_t uid, gid_t gid) -> struct stat;

    /** The libfuse arguments for a mount, starting with the program name. */
    [[nodiscard]] auto fuse_arguments(const MountParams& params) -> std::vector<std::string>;

    /** A `readdir` reply: the packed entries and what went into it. */
    struct DirectoryPage
    {
        /** Packed directory entries, only the first `used` bytes are meaningful. */
        std::vector<char> buffer;
        std::size_t used = 0;
        std::vector<std::string> names;
        /** Offset handed to the kernel with each entry, to resume after it. */
        std::vector<off_t> cookies;
    };

    /**
     * Pack as many `entries` as fit in `buffer_size` bytes.
     *
     * The entries are the listing of a directory after its first `offset` ones, so the
     * i-th one is given the cookie `offset + i + 1`. Packing stops at the first entry
     * that does not fit.
     */
    [[nodiscard]] auto
    pack_directory(const std::vector<DirectoryEntry>& entries, std::size_t offset, std::size_t buffer_size)
        -> DirectoryPage;

    /** Errno answering `opendir`, or `0` when the directory can be opened. */
    [[nodiscard]] auto opendir_error(const std::optional<Attributes>& attrs) -> int;

    /** Errno answering `open` with `flags`, or `0` when the file can be opened. */
    [[nodiscard]] auto open_error(const std::optional<Attributes>& attrs, int flags) -> int;

    /** Errno answering a `read` of an entry that has no content. */
    [[nodiscard]] auto read_error(const std::optional<Attributes>& attrs) -> int;

    /**
     * Serves a `ReleaseFilesystem` through a libfuse low-level session.
     *
     * The session is read-only and single-threaded. Entries and attributes are reported
     * as owned by the mounting process.
     */
    class FuseHost
    {
    public:

        FuseHost(ReleaseFilesystem& filesystem, MountParams params);

        FuseHost(const FuseHost&) = delete;
        FuseHost& operator=(const FuseHost&) = delete;
        FuseHost(FuseHost&&) = delete;
        FuseHost& operator=(FuseHost&&) = delete;

        /**
         * Mount and serve until unmounted or interrupted by a signal.
         *
         * Fails with `ghafs_error_code::mount_failure` when the session cannot be created
         * or mounted.
         */
        [[nodiscard]] auto run() -> expected_t<void>;

        [[nodiscard]] auto filesystem() -> ReleaseFilesystem&;
        [[nodiscard]] auto params() const -> const MountParams&;
        [[nodiscard]] auto uid() const -> uid_t;
        [[nodiscard]] auto gid() const -> gid_t;

    private:

        ReleaseFilesystem& m_filesystem;
        MountParams m_params;
        uid_t m_uid;
        gid_t m_gid;
    };
}
#endif
