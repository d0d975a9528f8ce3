// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <utility>

#include <fmt/format.h>

#include "ghafs/core/logging.hpp"
#include "ghafs/vfs/responder.hpp"

namespace ghafs::vfs
{
    auto directory_attributes(inode_t id) -> Attributes
    {
        return Attributes{
            /* .id = */ id,
            /* .kind = */ EntryKind::directory,
            /* .size = */ 0,
            /* .nlink = */ 2,
            /* .perm = */ 0755,
            /* .blocks = */ 1,
        };
    }

    auto file_attributes(inode_t id) -> Attributes
    {
        return Attributes{
            /* .id = */ id,
            /* .kind = */ EntryKind::regular_file,
            /* .size = */ placeholder_size,
            /* .nlink = */ 1,
            /* .perm = */ 0444,
            /* .blocks = */ 1,
        };
    }

    auto placeholder_content(inode_t id) -> std::string
    {
        return fmt::format("HelloWorld-{}\n", id);
    }

    Responder::Responder()
        : Responder(std::make_shared<const Tree>())
    {
    }

    Responder::Responder(tree_ptr tree)
        : m_tree(std::move(tree))
    {
    }

    auto Responder::publish(tree_ptr tree) -> tree_ptr
    {
        auto synched_tree = m_tree.synchronize();
        return std::exchange(*synched_tree, std::move(tree));
    }

    auto Responder::snapshot() const -> tree_ptr
    {
        return m_tree.value();
    }

    auto Responder::lookup(inode_t parent, std::string_view name) const -> std::optional<Attributes>
    {
        const auto tree = snapshot();
        if (parent == root_id)
        {
            if (const TagNode* tag = tree->find_tag(name))
            {
                return directory_attributes(tag->id);
            }
            return std::nullopt;
        }

        const TagNode* tag = tree->find_tag(parent);
        if (tag == nullptr)
        {
            LOG_TRACE << "lookup: " << parent << " is not a directory";
            return std::nullopt;
        }
        if (auto it = tag->asset_ids.find(name); it != tag->asset_ids.end())
        {
            return file_attributes(it->second);
        }
        return std::nullopt;
    }

    auto Responder::attributes_of(inode_t id) const -> std::optional<Attributes>
    {
        const auto kind = snapshot()->kind_of(id);
        if (!kind.has_value())
        {
            return std::nullopt;
        }
        return (kind == EntryKind::directory) ? directory_attributes(id) : file_attributes(id);
    }

    auto Responder::read(inode_t id, std::uint64_t offset, std::optional<std::size_t> max_length) const
        -> std::optional<std::string>
    {
        const auto tree = snapshot();
        if (tree->find_asset(id) == nullptr)
        {
            return std::nullopt;
        }

        const std::string content = placeholder_content(id);
        if (offset >= content.size())
        {
            return std::string();
        }
        const auto start = static_cast<std::size_t>(offset);
        return content.substr(start, max_length.value_or(std::string::npos));
    }

    auto Responder::list_directory(inode_t id, std::size_t offset) const
        -> std::optional<std::vector<DirectoryEntry>>
    {
        const auto tree = snapshot();
        std::vector<DirectoryEntry> entries;

        if (id == root_id)
        {
            entries.reserve(tree->tags().size() + 2);
            entries.push_back({ root_id, EntryKind::directory, "." });
            entries.push_back({ root_id, EntryKind::directory, ".." });
            for (const TagNode& tag : tree->tags())
            {
                entries.push_back({ tag.id, EntryKind::directory, tag.name });
            }
        }
        else if (const TagNode* tag = tree->find_tag(id))
        {
            entries.reserve(tag->assets.size() + 2);
            entries.push_back({ tag->id, EntryKind::directory, "." });
            entries.push_back({ root_id, EntryKind::directory, ".." });
            for (const inode_t asset_id : tag->assets)
            {
                entries.push_back({ asset_id, EntryKind::regular_file, tree->find_asset(asset_id)->name });
            }
        }
        else
        {
            return std::nullopt;
        }

        const auto skipped = std::min(offset, entries.size());
        entries.erase(entries.begin(), entries.begin() + static_cast<std::ptrdiff_t>(skipped));
        return entries;
    }
}
