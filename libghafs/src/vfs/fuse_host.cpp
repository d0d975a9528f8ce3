// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#define FUSE_USE_VERSION 31

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <string_view>
#include <utility>

#include <fcntl.h>
#include <fmt/format.h>
#include <fuse_lowlevel.h>
#include <sys/statvfs.h>
#include <unistd.h>

#include "ghafs/core/logging.hpp"
#include "ghafs/vfs/fuse_host.hpp"

namespace ghafs::vfs
{
    auto to_stat(const Attributes& attrs, uid_t uid, gid_t gid) -> struct stat
    {
        struct stat st;
        std::memset(&st, 0, sizeof(st));
        st.st_ino = attrs.id;
        st.st_mode = ((attrs.kind == EntryKind::directory) ? S_IFDIR : S_IFREG) | attrs.perm;
        st.st_nlink = attrs.nlink;
        st.st_size = static_cast<off_t>(attrs.size);
        st.st_blocks = static_cast<blkcnt_t>(attrs.blocks);
        st.st_uid = uid;
        st.st_gid = gid;
        // Timestamps stay at the epoch.
        return st;
    }

    auto fuse_arguments(const MountParams& params) -> std::vector<std::string>
    {
        auto args = std::vector<std::string>{
            "ghafs",
            "-o",
            "ro",
            "-o",
            fmt::format("fsname=ghafs:{}/{}", params.owner, params.repo),
            "-o",
            "subtype=ghafs",
        };
        if (params.fuse_debug)
        {
            args.emplace_back("-d");
        }
        return args;
    }

    auto
    pack_directory(const std::vector<DirectoryEntry>& entries, std::size_t offset, std::size_t buffer_size)
        -> DirectoryPage
    {
        auto page = DirectoryPage();
        page.buffer.resize(buffer_size);
        auto cookie = static_cast<off_t>(offset);
        for (const auto& entry : entries)
        {
            struct stat st;
            std::memset(&st, 0, sizeof(st));
            st.st_ino = entry.id;
            st.st_mode = (entry.kind == EntryKind::directory) ? S_IFDIR : S_IFREG;
            ++cookie;

            // The request is not used by libfuse to pack an entry.
            const std::size_t remaining = buffer_size - page.used;
            const auto entry_size = fuse_add_direntry(
                nullptr,
                page.buffer.data() + page.used,
                remaining,
                entry.name.c_str(),
                &st,
                cookie
            );
            if (entry_size > remaining)
            {
                // Does not fit, the kernel asks again from this entry.
                break;
            }
            page.used += entry_size;
            page.names.push_back(entry.name);
            page.cookies.push_back(cookie);
        }
        return page;
    }

    auto opendir_error(const std::optional<Attributes>& attrs) -> int
    {
        if (!attrs)
        {
            return ENOENT;
        }
        if (attrs->kind != EntryKind::directory)
        {
            return ENOTDIR;
        }
        return 0;
    }

    auto open_error(const std::optional<Attributes>& attrs, int flags) -> int
    {
        if (!attrs)
        {
            return ENOENT;
        }
        if (attrs->kind == EntryKind::directory)
        {
            return EISDIR;
        }
        if ((flags & O_ACCMODE) != O_RDONLY)
        {
            return EROFS;
        }
        return 0;
    }

    auto read_error(const std::optional<Attributes>& attrs) -> int
    {
        return attrs ? EISDIR : ENOENT;
    }

    namespace
    {
        auto host_of(fuse_req_t req) -> FuseHost&
        {
            return *static_cast<FuseHost*>(fuse_req_userdata(req));
        }

        void reply_attr(fuse_req_t req, const Attributes& attrs)
        {
            auto& host = host_of(req);
            const auto st = to_stat(attrs, host.uid(), host.gid());
            fuse_reply_attr(req, &st, host.params().ttl_secs);
        }

        void ll_lookup(fuse_req_t req, fuse_ino_t parent, const char* name)
        {
            auto& host = host_of(req);
            const auto attrs = host.filesystem().lookup(parent, name);
            if (!attrs)
            {
                LOG_TRACE << "lookup(" << parent << ", " << name << "): not found";
                fuse_reply_err(req, ENOENT);
                return;
            }

            fuse_entry_param entry;
            std::memset(&entry, 0, sizeof(entry));
            entry.ino = attrs->id;
            entry.attr = to_stat(*attrs, host.uid(), host.gid());
            entry.attr_timeout = host.params().ttl_secs;
            entry.entry_timeout = host.params().ttl_secs;
            fuse_reply_entry(req, &entry);
        }

        void ll_getattr(fuse_req_t req, fuse_ino_t ino, fuse_file_info* /* fi */)
        {
            if (const auto attrs = host_of(req).filesystem().attributes_of(ino))
            {
                reply_attr(req, *attrs);
            }
            else
            {
                fuse_reply_err(req, ENOENT);
            }
        }

        void ll_opendir(fuse_req_t req, fuse_ino_t ino, fuse_file_info* fi)
        {
            const auto attrs = host_of(req).filesystem().attributes_of(ino);
            if (const int err = opendir_error(attrs); err != 0)
            {
                fuse_reply_err(req, err);
                return;
            }
            fuse_reply_open(req, fi);
        }

        void ll_readdir(fuse_req_t req, fuse_ino_t ino, size_t size, off_t off, fuse_file_info* /* fi */)
        {
            const auto offset = static_cast<std::size_t>(std::max<off_t>(off, 0));
            const auto entries = host_of(req).filesystem().list_directory(ino, offset);
            if (!entries)
            {
                fuse_reply_err(req, ENOENT);
                return;
            }
            const auto page = pack_directory(*entries, offset, size);
            fuse_reply_buf(req, page.buffer.data(), page.used);
        }

        void ll_open(fuse_req_t req, fuse_ino_t ino, fuse_file_info* fi)
        {
            const auto attrs = host_of(req).filesystem().attributes_of(ino);
            if (const int err = open_error(attrs, fi->flags); err != 0)
            {
                fuse_reply_err(req, err);
                return;
            }
            fi->direct_io = 1;
            fuse_reply_open(req, fi);
        }

        void ll_read(fuse_req_t req, fuse_ino_t ino, size_t size, off_t off, fuse_file_info* /* fi */)
        {
            auto& fs = host_of(req).filesystem();
            const auto offset = static_cast<std::uint64_t>(std::max<off_t>(off, 0));
            if (const auto data = fs.read(ino, offset, size))
            {
                fuse_reply_buf(req, data->data(), data->size());
                return;
            }
            fuse_reply_err(req, read_error(fs.attributes_of(ino)));
        }

        void ll_statfs(fuse_req_t req, fuse_ino_t /* ino */)
        {
            const auto tree = host_of(req).filesystem().responder().snapshot();

            struct statvfs st;
            std::memset(&st, 0, sizeof(st));
            st.f_bsize = 512;
            st.f_frsize = 512;
            st.f_blocks = tree->size();
            st.f_files = tree->size();
            st.f_namemax = 255;
            st.f_flag = ST_RDONLY;
            fuse_reply_statfs(req, &st);
        }

        auto make_operations() -> fuse_lowlevel_ops
        {
            fuse_lowlevel_ops ops;
            std::memset(&ops, 0, sizeof(ops));
            ops.lookup = ll_lookup;
            ops.getattr = ll_getattr;
            ops.opendir = ll_opendir;
            ops.readdir = ll_readdir;
            ops.open = ll_open;
            ops.read = ll_read;
            ops.statfs = ll_statfs;
            return ops;
        }

        /** Owns the libfuse arguments and session, and undoes each setup step it made. */
        class FuseSession
        {
        public:

            FuseSession(const std::vector<std::string>& arguments, FuseHost& host)
                : m_operations(make_operations())
            {
                for (const auto& arg : arguments)
                {
                    if (fuse_opt_add_arg(&m_args, arg.c_str()) != 0)
                    {
                        m_args_added = false;
                        return;
                    }
                }
                p_session = fuse_session_new(&m_args, &m_operations, sizeof(m_operations), &host);
            }

            ~FuseSession()
            {
                if (m_mounted)
                {
                    fuse_session_unmount(p_session);
                }
                if (m_signal_handlers_set)
                {
                    fuse_remove_signal_handlers(p_session);
                }
                if (p_session != nullptr)
                {
                    fuse_session_destroy(p_session);
                }
                fuse_opt_free_args(&m_args);
            }

            FuseSession(const FuseSession&) = delete;
            FuseSession& operator=(const FuseSession&) = delete;
            FuseSession(FuseSession&&) = delete;
            FuseSession& operator=(FuseSession&&) = delete;

            auto arguments_added() const -> bool
            {
                return m_args_added;
            }

            auto created() const -> bool
            {
                return p_session != nullptr;
            }

            auto set_signal_handlers() -> bool
            {
                m_signal_handlers_set = (fuse_set_signal_handlers(p_session) == 0);
                return m_signal_handlers_set;
            }

            auto mount(const std::string& mount_point) -> bool
            {
                m_mounted = (fuse_session_mount(p_session, mount_point.c_str()) == 0);
                return m_mounted;
            }

            auto loop() -> int
            {
                return fuse_session_loop(p_session);
            }

        private:

            fuse_lowlevel_ops m_operations;
            fuse_args m_args = FUSE_ARGS_INIT(0, nullptr);
            fuse_session* p_session = nullptr;
            bool m_args_added = true;
            bool m_signal_handlers_set = false;
            bool m_mounted = false;
        };

        auto mount_failure(std::string_view what, const std::string& mount_point)
        {
            return make_unexpected(
                fmt::format("Could not mount on '{}': {}", mount_point, what),
                ghafs_error_code::mount_failure
            );
        }
    }

    FuseHost::FuseHost(ReleaseFilesystem& filesystem, MountParams params)
        : m_filesystem(filesystem)
        , m_params(std::move(params))
        , m_uid(::getuid())
        , m_gid(::getgid())
    {
    }

    auto FuseHost::run() -> expected_t<void>
    {
        auto session = FuseSession(fuse_arguments(m_params), *this);
        if (!session.arguments_added())
        {
            return mount_failure("cannot build FUSE arguments", m_params.mount_point);
        }
        if (!session.created())
        {
            return mount_failure("cannot create FUSE session", m_params.mount_point);
        }
        if (!session.set_signal_handlers())
        {
            return mount_failure("cannot install signal handlers", m_params.mount_point);
        }
        if (!session.mount(m_params.mount_point))
        {
            return mount_failure("FUSE mount failed", m_params.mount_point);
        }

        LOG_INFO << "Mounted " << m_filesystem.owner() << '/' << m_filesystem.repo() << " on "
                 << m_params.mount_point;
        const int res = session.loop();
        LOG_INFO << "Unmounting " << m_params.mount_point;
        if (res < 0)
        {
            return make_unexpected(
                fmt::format("FUSE session loop failed: {}", std::strerror(-res)),
                ghafs_error_code::mount_failure
            );
        }
        return {};
    }

    auto FuseHost::filesystem() -> ReleaseFilesystem&
    {
        return m_filesystem;
    }

    auto FuseHost::params() const -> const MountParams&
    {
        return m_params;
    }

    auto FuseHost::uid() const -> uid_t
    {
        return m_uid;
    }

    auto FuseHost::gid() const -> gid_t
    {
        return m_gid;
    }
}
