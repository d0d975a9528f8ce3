// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <set>

#include <catch2/catch_all.hpp>

#include "ghafs/vfs/tree.hpp"

using namespace ghafs;
using namespace ghafs::vfs;

namespace
{
    auto make_asset(std::uint64_t id, std::string name, std::uint64_t size = 1) -> specs::Asset
    {
        auto asset = specs::Asset();
        asset.id = id;
        asset.name = std::move(name);
        asset.size = size;
        return asset;
    }

    auto make_release(std::uint64_t id, std::string tag, std::vector<specs::Asset> assets = {})
        -> specs::Release
    {
        auto release = specs::Release();
        release.id = id;
        release.tag_name = std::move(tag);
        release.assets = std::move(assets);
        return release;
    }

    TEST_CASE("is_valid_entry_name")
    {
        REQUIRE(is_valid_entry_name("v1.0"));
        REQUIRE(is_valid_entry_name("app .bin"));
        REQUIRE(is_valid_entry_name("..."));
        REQUIRE_FALSE(is_valid_entry_name(""));
        REQUIRE_FALSE(is_valid_entry_name("."));
        REQUIRE_FALSE(is_valid_entry_name(".."));
        REQUIRE_FALSE(is_valid_entry_name("release/1"));
        REQUIRE_FALSE(is_valid_entry_name(std::string_view("a\0b", 3)));
    }

    TEST_CASE("Tree empty")
    {
        for (const auto& tree : { Tree(), Tree::build({}) })
        {
            REQUIRE(tree.size() == 1);
            REQUIRE(tree.tags().empty());
            REQUIRE(tree.asset_count() == 0);
            REQUIRE(tree.kind_of(root_id) == EntryKind::directory);
            REQUIRE(tree.parent_of(root_id) == root_id);
            REQUIRE(tree.contains(root_id));
            REQUIRE_FALSE(tree.contains(2));
            REQUIRE_FALSE(tree.kind_of(0).has_value());
        }
    }

    TEST_CASE("Tree sequential identifiers")
    {
        const auto catalog = specs::Catalog{
            make_release(1001, "v2.0", { make_asset(11, "a.bin"), make_asset(12, "b.bin") }),
            make_release(1000, "v1.0"),
            make_release(999, "v0.9", { make_asset(11, "a.bin") }),
        };
        const auto tree = Tree::build(catalog);

        REQUIRE(tree.size() == 7);
        REQUIRE(tree.asset_count() == 3);
        REQUIRE(tree.tags().size() == 3);

        const TagNode* v2 = tree.find_tag("v2.0");
        REQUIRE(v2 != nullptr);
        REQUIRE(v2->id == 2);
        REQUIRE(v2->assets == std::vector<inode_t>{ 3, 4 });
        REQUIRE(tree.find_tag("v1.0")->id == 5);
        REQUIRE(tree.find_tag("v1.0")->assets.empty());
        REQUIRE(tree.find_tag("v0.9")->id == 6);
        REQUIRE(tree.find_tag("v0.9")->assets == std::vector<inode_t>{ 7 });

        // Same remote asset identifier in two releases, distinct nodes
        REQUIRE(tree.find_asset(3)->name == "a.bin");
        REQUIRE(tree.find_asset(7)->name == "a.bin");
        REQUIRE(tree.find_asset(7)->parent == 6);
        REQUIRE(tree.parent_of(3) == 2);
        REQUIRE(tree.parent_of(5) == root_id);

        REQUIRE(tree.kind_of(4) == EntryKind::regular_file);
        REQUIRE(tree.kind_of(6) == EntryKind::directory);
        REQUIRE_FALSE(tree.kind_of(8).has_value());
        REQUIRE_FALSE(tree.parent_of(8).has_value());
        REQUIRE(tree.find_tag(3) == nullptr);
        REQUIRE(tree.find_asset(2) == nullptr);
        REQUIRE(tree.find_tag(root_id) == nullptr);
    }

    TEST_CASE("Tree identifiers are unique")
    {
        const auto catalog = specs::Catalog{
            make_release(1, "a", { make_asset(1, "x"), make_asset(2, "y") }),
            make_release(2, "b", { make_asset(1, "x") }),
        };
        const auto tree = Tree::build(catalog);

        auto ids = std::set<inode_t>{ root_id };
        for (const TagNode& tag : tree.tags())
        {
            REQUIRE(ids.insert(tag.id).second);
            for (const inode_t asset : tag.assets)
            {
                REQUIRE(ids.insert(asset).second);
                REQUIRE(tree.parent_of(asset) == tag.id);
            }
        }
        REQUIRE(ids.size() == tree.size());
    }

    TEST_CASE("Tree build is deterministic")
    {
        const auto catalog = specs::Catalog{
            make_release(1, "a", { make_asset(1, "x"), make_asset(2, "y") }),
            make_release(2, "b", { make_asset(1, "z") }),
        };
        const auto first = Tree::build(catalog);
        const auto second = Tree::build(catalog);

        REQUIRE(first.size() == second.size());
        for (std::size_t i = 0; i < first.tags().size(); ++i)
        {
            REQUIRE(first.tags()[i].id == second.tags()[i].id);
            REQUIRE(first.tags()[i].name == second.tags()[i].name);
            REQUIRE(first.tags()[i].assets == second.tags()[i].assets);
        }
    }

    TEST_CASE("Tree duplicates")
    {
        const auto catalog = specs::Catalog{
            make_release(1, "v1", { make_asset(1, "app", 10), make_asset(2, "app", 20), make_asset(3, "doc") }),
            make_release(2, "v1", { make_asset(4, "other") }),
            make_release(3, "v2"),
        };
        const auto tree = Tree::build(catalog);

        REQUIRE(tree.tags().size() == 2);
        const TagNode* v1 = tree.find_tag("v1");
        REQUIRE(v1->assets.size() == 2);
        // First occurrence wins
        REQUIRE(v1->asset_ids.at("app") == 3);
        REQUIRE(tree.find_asset(3)->parent == v1->id);
        REQUIRE(v1->asset_ids.at("doc") == 4);
        REQUIRE_FALSE(v1->asset_ids.contains("other"));
        // Dropped entries take no identifier
        REQUIRE(tree.find_tag("v2")->id == 5);
        REQUIRE(tree.size() == 5);
    }

    TEST_CASE("Tree invalid names")
    {
        const auto catalog = specs::Catalog{
            make_release(1, "", { make_asset(1, "x") }),
            make_release(2, "..", { make_asset(2, "y") }),
            make_release(3, "feature/x", { make_asset(3, "z") }),
            make_release(4, "ok", { make_asset(4, "."), make_asset(5, "a/b"), make_asset(6, "fine") }),
        };
        const auto tree = Tree::build(catalog);

        REQUIRE(tree.tags().size() == 1);
        REQUIRE(tree.find_tag("ok")->id == 2);
        REQUIRE(tree.find_tag("ok")->assets == std::vector<inode_t>{ 3 });
        REQUIRE(tree.find_asset(3)->name == "fine");
    }
}
