// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <utility>

#include "ghafs/core/logging.hpp"
#include "ghafs/vfs/release_filesystem.hpp"

namespace ghafs::vfs
{
    ReleaseFilesystem::ReleaseFilesystem(
        std::unique_ptr<CatalogClient> client,
        std::string owner,
        std::string repo,
        RefreshPolicy policy
    )
        : p_client(std::move(client))
        , m_owner(std::move(owner))
        , m_repo(std::move(repo))
        , m_policy(policy)
    {
        if (p_client == nullptr)
        {
            throw ghafs_error("Release filesystem requires a catalog client", ghafs_error_code::internal_failure);
        }
    }

    auto
    ReleaseFilesystem::from_context(const Context& ctx, std::unique_ptr<download::Transport> transport)
        -> std::unique_ptr<ReleaseFilesystem>
    {
        auto client = std::make_unique<CatalogClient>(
            ctx.remote_fetch_params,
            ctx.authentication_info(),
            std::move(transport)
        );
        return std::make_unique<ReleaseFilesystem>(
            std::move(client),
            ctx.mount_params.owner,
            ctx.mount_params.repo,
            ctx.mount_params.refresh
        );
    }

    auto ReleaseFilesystem::load() -> expected_t<void>
    {
        auto catalog = p_client->fetch_catalog(m_owner, m_repo);
        if (!catalog)
        {
            return forward_error(catalog);
        }

        auto tree = std::make_shared<const Tree>(Tree::build(*catalog));
        LOG_INFO << "Catalog of " << m_owner << '/' << m_repo << " has " << tree->tags().size()
                 << " tags and " << tree->asset_count() << " assets";
        m_responder.publish(std::move(tree));
        return {};
    }

    auto ReleaseFilesystem::refresh() -> expected_t<void>
    {
        LOG_DEBUG << "Refreshing catalog of " << m_owner << '/' << m_repo;
        return load();
    }

    auto ReleaseFilesystem::lookup(inode_t parent, std::string_view name) const
        -> std::optional<Attributes>
    {
        return m_responder.lookup(parent, name);
    }

    auto ReleaseFilesystem::attributes_of(inode_t id) const -> std::optional<Attributes>
    {
        return m_responder.attributes_of(id);
    }

    auto
    ReleaseFilesystem::read(inode_t id, std::uint64_t offset, std::optional<std::size_t> max_length) const
        -> std::optional<std::string>
    {
        return m_responder.read(id, offset, max_length);
    }

    auto ReleaseFilesystem::list_directory(inode_t id, std::size_t offset)
        -> std::optional<std::vector<DirectoryEntry>>
    {
        if ((m_policy == RefreshPolicy::root_listing) && (id == root_id) && (offset == 0))
        {
            if (auto res = refresh(); !res)
            {
                if (res.error().error_code() == ghafs_error_code::cache_consistency)
                {
                    LOG_ERROR << "Catalog cache is inconsistent, keeping the previous one: "
                              << res.error().what();
                }
                else
                {
                    LOG_WARNING << "Could not refresh catalog, keeping the previous one: "
                                << res.error().what();
                }
            }
        }
        return m_responder.list_directory(id, offset);
    }

    auto ReleaseFilesystem::responder() const -> const Responder&
    {
        return m_responder;
    }

    auto ReleaseFilesystem::client() -> CatalogClient&
    {
        return *p_client;
    }

    auto ReleaseFilesystem::owner() const -> const std::string&
    {
        return m_owner;
    }

    auto ReleaseFilesystem::repo() const -> const std::string&
    {
        return m_repo;
    }

    auto ReleaseFilesystem::policy() const -> RefreshPolicy
    {
        return m_policy;
    }
}
