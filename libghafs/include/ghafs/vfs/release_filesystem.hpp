// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef GHAFS_VFS_RELEASE_FILESYSTEM_HPP
#define GHAFS_VFS_RELEASE_FILESYSTEM_HPP

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ghafs/core/catalog_client.hpp"
#include "ghafs/core/context.hpp"
#include "ghafs/core/error_handling.hpp"
#include "ghafs/vfs/responder.hpp"

namespace ghafs::vfs
{
    /**
     * The read-only filesystem of the releases of one repository.
     *
     * Owns the catalog client and the responder, and decides when the tree is rebuilt
     * according to the `RefreshPolicy`.
     */
    class ReleaseFilesystem
    {
    public:

        ReleaseFilesystem(
            std::unique_ptr<CatalogClient> client,
            std::string owner,
            std::string repo,
            RefreshPolicy policy = RefreshPolicy::never
        );

        /** Build the client from the context, with the given transport. */
        static auto from_context(const Context& ctx, std::unique_ptr<download::Transport> transport)
            -> std::unique_ptr<ReleaseFilesystem>;

        /**
         * Fetch the catalog and publish the tree built from it.
         *
         * Must succeed once before mounting, the error is fatal for the mount.
         */
        [[nodiscard]] auto load() -> expected_t<void>;

        /**
         * Fetch the catalog again and publish a new tree.
         *
         * On failure the current tree is kept.
         */
        [[nodiscard]] auto refresh() -> expected_t<void>;

        [[nodiscard]] auto lookup(inode_t parent, std::string_view name) const
            -> std::optional<Attributes>;

        [[nodiscard]] auto attributes_of(inode_t id) const -> std::optional<Attributes>;

        [[nodiscard]] auto
        read(inode_t id, std::uint64_t offset, std::optional<std::size_t> max_length = std::nullopt) const
            -> std::optional<std::string>;

        /** Listing the root from the beginning triggers a refresh with `RefreshPolicy::root_listing`. */
        [[nodiscard]] auto list_directory(inode_t id, std::size_t offset = 0)
            -> std::optional<std::vector<DirectoryEntry>>;

        [[nodiscard]] auto responder() const -> const Responder&;
        [[nodiscard]] auto client() -> CatalogClient&;
        [[nodiscard]] auto owner() const -> const std::string&;
        [[nodiscard]] auto repo() const -> const std::string&;
        [[nodiscard]] auto policy() const -> RefreshPolicy;

    private:

        std::unique_ptr<CatalogClient> p_client;
        std::string m_owner;
        std::string m_repo;
        RefreshPolicy m_policy;
        Responder m_responder;
    };
}
#endif
