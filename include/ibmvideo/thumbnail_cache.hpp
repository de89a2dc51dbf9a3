#pragma once

#include <ibmvideo/ibmvideo_export.h>

#include <cstddef>
#include <filesystem>
#include <ibmvideo/result.hpp>
#include <ibmvideo/types.hpp>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

// Forward declarations
namespace ibmvideo::net {
class HttpClient;
}  // namespace ibmvideo::net

namespace ibmvideo::api {
class ApiClient;
}  // namespace ibmvideo::api

namespace ibmvideo::cache {

struct IBMVIDEO_EXPORT CacheConfig {
	std::filesystem::path thumbnails_directory = "ibm_video_thumbnails";
	// Paths remembered in memory; 0 disables the index.
	std::size_t max_index_entries = 1024;
};

struct IBMVIDEO_EXPORT CacheStats {
	std::size_t indexed_paths = 0;
	// Locks currently held or waited on.
	std::size_t file_locks = 0;
};

// Local thumbnail store. Each video data value maps to one file,
// "<directory>/<base_filename>.<extension>", downloaded on first use.
//
// Safe to share between threads: concurrent resolve() calls for the same
// file are serialised, so a thumbnail is downloaded at most once.
class IBMVIDEO_EXPORT ThumbnailCache {
   public:
	ThumbnailCache(const CacheConfig &config,
				   std::shared_ptr<net::HttpClient> http,
				   std::shared_ptr<api::ApiClient> api);
	ThumbnailCache(const ThumbnailCache &) = delete;
	ThumbnailCache &operator=(const ThumbnailCache &) = delete;
	~ThumbnailCache();

	/// "thumbnail_<sha1(ref)>_<recorded|stream>_<sha1(id)>"
	static std::string base_filename(std::string_view id, bool is_recorded,
									 std::string_view thumbnail_reference_id);

	/// Path of the local thumbnail for `data`, downloading it if needed.
	///
	/// Fails with errc::configuration_error if the thumbnails directory is
	/// unusable. Every other failure (API error, missing remote thumbnail,
	/// download or write failure) is logged and yields std::nullopt.
	Result<std::optional<std::filesystem::path>> resolve(const VideoData &data);

	/// Forget every remembered path; the next resolve() rescans the directory.
	void invalidate_index();

	[[nodiscard]] CacheStats stats() const;
	[[nodiscard]] const CacheConfig &config() const;

   private:
	struct Impl;
	std::unique_ptr<Impl> m_impl;
};

/// File extension for a MIME type such as "image/jpeg; charset=binary".
/// Parameters are ignored and the match is case-insensitive.
IBMVIDEO_EXPORT std::optional<std::string> extension_for_mime_type(
	std::string_view mime_type);

}  // namespace ibmvideo::cache
