// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef GHAFS_VFS_RESPONDER_HPP
#define GHAFS_VFS_RESPONDER_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ghafs/util/synchronized_value.hpp"
#include "ghafs/vfs/tree.hpp"

namespace ghafs::vfs
{
    /** Declared size of every synthesized file, large enough for any placeholder. */
    inline constexpr std::uint64_t placeholder_size = 32;

    /** Fixed attributes of an entry, the caller adds ownership and timestamps. */
    struct Attributes
    {
        inode_t id = 0;
        EntryKind kind = EntryKind::regular_file;
        std::uint64_t size = 0;
        std::uint32_t nlink = 1;
        std::uint32_t perm = 0;
        std::uint64_t blocks = 0;

        auto operator==(const Attributes& other) const -> bool = default;
    };

    /** Attributes of a directory (root or tag). */
    [[nodiscard]] auto directory_attributes(inode_t id) -> Attributes;

    /** Attributes of a synthesized file. */
    [[nodiscard]] auto file_attributes(inode_t id) -> Attributes;

    /** Deterministic content of a synthesized file. */
    [[nodiscard]] auto placeholder_content(inode_t id) -> std::string;

    struct DirectoryEntry
    {
        inode_t id;
        EntryKind kind;
        std::string name;

        auto operator==(const DirectoryEntry& other) const -> bool = default;
    };

    /**
     * Answers the filesystem protocol calls from the current tree snapshot.
     *
     * Every call is a pure function of (snapshot, arguments): an unknown identifier or
     * name is answered with `std::nullopt`, which the host reports as "no such entry".
     * The snapshot is replaced atomically with `publish`; calls in flight keep using
     * the snapshot they started with.
     */
    class Responder
    {
    public:

        using tree_ptr = std::shared_ptr<const Tree>;

        Responder();
        explicit Responder(tree_ptr tree);

        /** Child `name` of directory `parent`. */
        [[nodiscard]] auto lookup(inode_t parent, std::string_view name) const
            -> std::optional<Attributes>;

        [[nodiscard]] auto attributes_of(inode_t id) const -> std::optional<Attributes>;

        /**
         * Content of file `id` from byte `offset`, at most `max_length` bytes.
         *
         * Reading at or past the end gives an empty string. Directories and unknown
         * identifiers give `std::nullopt`.
         */
        [[nodiscard]] auto read(
            inode_t id,
            std::uint64_t offset,
            std::optional<std::size_t> max_length = std::nullopt
        ) const -> std::optional<std::string>;

        /**
         * Entries of directory `id` after the first `offset` ones.
         *
         * The full listing is ".", ".." then children in catalog order, so that the same
         * (id, offset) always gives the same suffix for one snapshot.
         */
        [[nodiscard]] auto list_directory(inode_t id, std::size_t offset = 0) const
            -> std::optional<std::vector<DirectoryEntry>>;

        /** Replace the tree. @returns The previous snapshot. */
        auto publish(tree_ptr tree) -> tree_ptr;

        [[nodiscard]] auto snapshot() const -> tree_ptr;

    private:

        util::synchronized_value<tree_ptr> m_tree;
    };
}
#endif
