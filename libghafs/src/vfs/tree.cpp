// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include "ghafs/core/logging.hpp"
#include "ghafs/vfs/tree.hpp"

namespace ghafs::vfs
{
    auto is_valid_entry_name(std::string_view name) -> bool
    {
        return !name.empty() && name != "." && name != ".."
               && name.find_first_of(std::string_view("/\0", 2)) == std::string_view::npos;
    }

    Tree::Tree() = default;

    auto Tree::build(const specs::Catalog& catalog) -> Tree
    {
        Tree tree;
        inode_t next_id = first_id;

        for (const specs::Release& release : catalog)
        {
            if (!is_valid_entry_name(release.tag_name))
            {
                LOG_WARNING << "Skipping release " << release.id << ": tag name '"
                            << release.tag_name << "' is not a valid directory name";
                continue;
            }
            if (tree.m_tag_by_name.contains(release.tag_name))
            {
                LOG_WARNING << "Skipping release " << release.id << ": tag '" << release.tag_name
                            << "' already exists";
                continue;
            }

            const std::size_t tag_index = tree.m_tags.size();
            TagNode& tag = tree.m_tags.emplace_back(TagNode{ next_id++, release.tag_name, {}, {} });
            tree.m_nodes.push_back({ EntryKind::directory, tag_index });
            tree.m_tag_by_name.emplace(tag.name, tag_index);

            for (const specs::Asset& asset : release.assets)
            {
                if (!is_valid_entry_name(asset.name))
                {
                    LOG_WARNING << "Skipping asset " << asset.id << " of '" << tag.name
                                << "': '" << asset.name << "' is not a valid file name";
                    continue;
                }
                if (tag.asset_ids.contains(asset.name))
                {
                    LOG_WARNING << "Skipping asset " << asset.id << " of '" << tag.name
                                << "': '" << asset.name << "' already exists";
                    continue;
                }

                const inode_t asset_id = next_id++;
                tree.m_nodes.push_back({ EntryKind::regular_file, tree.m_assets.size() });
                tree.m_assets.push_back(AssetNode{ asset_id, tag.id, asset.name });
                tag.assets.push_back(asset_id);
                tag.asset_ids.emplace(asset.name, asset_id);
            }
        }

        LOG_DEBUG << "Built tree with " << tree.m_tags.size() << " tags and "
                  << tree.m_assets.size() << " assets";
        return tree;
    }

    auto Tree::tags() const -> const std::vector<TagNode>&
    {
        return m_tags;
    }

    auto Tree::node_ref(inode_t id) const -> const NodeRef*
    {
        if (id < first_id || (id - first_id) >= m_nodes.size())
        {
            return nullptr;
        }
        return &m_nodes[static_cast<std::size_t>(id - first_id)];
    }

    auto Tree::find_tag(inode_t id) const -> const TagNode*
    {
        const NodeRef* ref = node_ref(id);
        if (ref == nullptr || ref->kind != EntryKind::directory)
        {
            return nullptr;
        }
        return &m_tags[ref->index];
    }

    auto Tree::find_tag(std::string_view name) const -> const TagNode*
    {
        if (auto it = m_tag_by_name.find(name); it != m_tag_by_name.end())
        {
            return &m_tags[it->second];
        }
        return nullptr;
    }

    auto Tree::find_asset(inode_t id) const -> const AssetNode*
    {
        const NodeRef* ref = node_ref(id);
        if (ref == nullptr || ref->kind != EntryKind::regular_file)
        {
            return nullptr;
        }
        return &m_assets[ref->index];
    }

    auto Tree::kind_of(inode_t id) const -> std::optional<EntryKind>
    {
        if (id == root_id)
        {
            return EntryKind::directory;
        }
        if (const NodeRef* ref = node_ref(id))
        {
            return ref->kind;
        }
        return std::nullopt;
    }

    auto Tree::parent_of(inode_t id) const -> std::optional<inode_t>
    {
        if (id == root_id || find_tag(id) != nullptr)
        {
            return root_id;
        }
        if (const AssetNode* asset = find_asset(id))
        {
            return asset->parent;
        }
        return std::nullopt;
    }

    auto Tree::contains(inode_t id) const -> bool
    {
        return kind_of(id).has_value();
    }

    auto Tree::size() const -> std::size_t
    {
        return m_nodes.size() + 1;
    }

    auto Tree::asset_count() const -> std::size_t
    {
        return m_assets.size();
    }
}
