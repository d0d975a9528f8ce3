// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef GHAFS_VFS_TREE_HPP
#define GHAFS_VFS_TREE_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ghafs/specs/release.hpp"

namespace ghafs::vfs
{
    /** Filesystem identifier, the inode number seen by the kernel. */
    using inode_t = std::uint64_t;

    /** The identifier of the mount point, fixed by the kernel protocol. */
    inline constexpr inode_t root_id = 1;

    enum class EntryKind
    {
        directory,
        regular_file
    };

    /** A file synthesized from one asset of a release. */
    struct AssetNode
    {
        inode_t id;
        inode_t parent;
        std::string name;
    };

    /** A directory synthesized from one release, named after its tag. */
    struct TagNode
    {
        inode_t id;
        std::string name;
        /** Children in catalog order. */
        std::vector<inode_t> assets;
        std::map<std::string, inode_t, std::less<>> asset_ids;
    };

    /**
     * The immutable two-level tree (root, tags, assets) built from one catalog snapshot.
     *
     * Identifiers are assigned sequentially from 2 in catalog order, each tag directly
     * followed by its assets, so that building twice from the same catalog gives the
     * same identifiers.
     *
     * A tag name appearing twice in the catalog, or an asset name appearing twice in
     * one release, is only kept at its first occurrence. Names that cannot be directory
     * entries ("", ".", "..", or containing '/') are skipped too.
     */
    class Tree
    {
    public:

        /** A tree with only the root. */
        Tree();

        [[nodiscard]] static auto build(const specs::Catalog& catalog) -> Tree;

        /** Tag directories in catalog order. */
        [[nodiscard]] auto tags() const -> const std::vector<TagNode>&;

        [[nodiscard]] auto find_tag(inode_t id) const -> const TagNode*;
        [[nodiscard]] auto find_tag(std::string_view name) const -> const TagNode*;
        [[nodiscard]] auto find_asset(inode_t id) const -> const AssetNode*;

        /** @returns `std::nullopt` for an unknown identifier. */
        [[nodiscard]] auto kind_of(inode_t id) const -> std::optional<EntryKind>;

        /** The root is its own parent. @returns `std::nullopt` for an unknown identifier. */
        [[nodiscard]] auto parent_of(inode_t id) const -> std::optional<inode_t>;

        [[nodiscard]] auto contains(inode_t id) const -> bool;

        /** Number of nodes, including the root. */
        [[nodiscard]] auto size() const -> std::size_t;

        [[nodiscard]] auto asset_count() const -> std::size_t;

    private:

        struct NodeRef
        {
            EntryKind kind;
            std::size_t index;
        };

        /** Identifier `id` is at position `id - first_id`. */
        static constexpr inode_t first_id = root_id + 1;

        auto node_ref(inode_t id) const -> const NodeRef*;

        std::vector<TagNode> m_tags;
        std::vector<AssetNode> m_assets;
        std::vector<NodeRef> m_nodes;
        std::map<std::string, std::size_t, std::less<>> m_tag_by_name;
    };

    /** @returns Whether the string can be used as a single directory entry name. */
    [[nodiscard]] auto is_valid_entry_name(std::string_view name) -> bool;
}
#endif
