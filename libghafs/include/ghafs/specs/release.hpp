// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef GHAFS_SPECS_RELEASE_HPP
#define GHAFS_SPECS_RELEASE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace ghafs::specs
{
    /**
     * A downloadable binary attached to a release.
     *
     * The identifier is only unique among the assets of one release.
     *
     * @see https://docs.github.com/en/rest/releases/assets
     */
    struct Asset
    {
        /** The remote identifier of the asset. */
        std::uint64_t id = 0;

        /** The file name of the asset, unique within its release. */
        std::string name = {};

        /** The declared MIME type, usually ``application/octet-stream``. */
        std::string content_type = {};

        /** The declared size of the asset in bytes. */
        std::uint64_t size = 0;

        /** The API URL of the asset. */
        std::string url = {};

        /** The URL a browser would use to download the asset. */
        std::string browser_download_url = {};
    };

    auto operator==(const Asset& a, const Asset& b) -> bool;
    auto operator!=(const Asset& a, const Asset& b) -> bool;

    /**
     * A published (or draft) version of a repository, identified by its tag.
     *
     * @see https://docs.github.com/en/rest/releases/releases
     */
    struct Release
    {
        /** The remote identifier of the release. */
        std::uint64_t id = 0;

        /** The name of the git tag, used as the directory name. */
        std::string tag_name = {};

        /** The API URL of the release. */
        std::string url = {};

        /** ISO 8601 creation timestamp. */
        std::string created_at = {};

        /** ISO 8601 publication timestamp, draft releases have none. */
        std::optional<std::string> published_at = {};

        /** The assets, in the order the API returned them. */
        std::vector<Asset> assets = {};
    };

    auto operator==(const Release& a, const Release& b) -> bool;
    auto operator!=(const Release& a, const Release& b) -> bool;

    /** All the releases of one repository, in the order the API returned them. */
    using Catalog = std::vector<Release>;

    /** Serialize to JSON in the GitHub API format. */
    void to_json(nlohmann::json& j, const Asset& asset);

    /**
     * Deserialize from JSON in the GitHub API format.
     *
     * Throws `nlohmann::json::exception` if a required key is missing or ill-typed.
     */
    void from_json(const nlohmann::json& j, Asset& asset);

    void to_json(nlohmann::json& j, const Release& release);
    void from_json(const nlohmann::json& j, Release& release);
}
#endif
