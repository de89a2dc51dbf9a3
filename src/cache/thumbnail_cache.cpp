#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <boost/url.hpp>
#include <cctype>
#include <fstream>
#include <ibmvideo/api_client.hpp>
#include <ibmvideo/http_client.hpp>
#include <ibmvideo/thumbnail_cache.hpp>
#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "crypto/crypto.hpp"

namespace fs = std::filesystem;

namespace ibmvideo::cache {

namespace {

constexpr const char *kFilenamePrefix = "thumbnail";
constexpr const char *kSeparator = "_";
constexpr const char *kRecordedIdentifier = "recorded";
constexpr const char *kStreamIdentifier = "stream";

// Used when the extension can't be derived from the URL or the Content-Type.
constexpr const char *kDefaultExtension = "unknown";

// Lower-cased extension of the last path segment of `uri`, if it has a
// plain alphanumeric one.
std::optional<std::string> extension_from_uri(const std::string &uri) {
	auto u_res = boost::urls::parse_uri(uri);
	if (u_res.has_error()) return std::nullopt;

	std::string path = u_res.value().path();
	auto slash = path.find_last_of('/');
	std::string segment =
		slash == std::string::npos ? path : path.substr(slash + 1);

	auto dot = segment.find_last_of('.');
	if (dot == std::string::npos || dot + 1 == segment.size()) {
		return std::nullopt;
	}

	std::string ext = segment.substr(dot + 1);
	bool plain = std::all_of(ext.begin(), ext.end(), [](unsigned char c) {
		return std::isalnum(c) != 0;
	});
	if (!plain) return std::nullopt;

	std::transform(ext.begin(), ext.end(), ext.begin(),
				   [](unsigned char c) { return std::tolower(c); });
	return ext;
}

}  // namespace

struct ThumbnailCache::Impl {
	CacheConfig config;
	std::shared_ptr<net::HttpClient> http;
	std::shared_ptr<api::ApiClient> api;

	std::mutex index_mutex;
	std::unordered_map<std::string, fs::path> index;

	std::mutex locks_mutex;
	std::map<std::string, std::shared_ptr<std::mutex>> file_locks;

	Impl(CacheConfig c, std::shared_ptr<net::HttpClient> h,
		 std::shared_ptr<api::ApiClient> a)
		: config(std::move(c)), http(std::move(h)), api(std::move(a)) {}

	// Holds the lock of one cache file. The entry in file_locks is dropped
	// when its last holder releases it; copies of the shared_ptr are only
	// made under locks_mutex, so use_count() is exact there.
	class FileLock {
	   public:
		FileLock(Impl &impl, std::string base)
			: impl_(impl), base_(std::move(base)) {
			{
				std::lock_guard<std::mutex> lock(impl_.locks_mutex);
				auto &m = impl_.file_locks[base_];
				if (!m) m = std::make_shared<std::mutex>();
				mutex_ = m;
			}
			mutex_->lock();
		}

		FileLock(const FileLock &) = delete;
		FileLock &operator=(const FileLock &) = delete;

		~FileLock() {
			mutex_->unlock();
			std::lock_guard<std::mutex> lock(impl_.locks_mutex);
			mutex_.reset();
			auto it = impl_.file_locks.find(base_);
			if (it != impl_.file_locks.end() && it->second.use_count() == 1) {
				impl_.file_locks.erase(it);
			}
		}

	   private:
		Impl &impl_;
		std::string base_;
		std::shared_ptr<std::mutex> mutex_;
	};

	std::optional<fs::path> lookup_index(const std::string &base) {
		std::lock_guard<std::mutex> lock(index_mutex);
		auto it = index.find(base);
		if (it == index.end()) return std::nullopt;

		std::error_code ec;
		if (!fs::is_regular_file(it->second, ec)) {
			// Removed behind our back
			index.erase(it);
			return std::nullopt;
		}
		return it->second;
	}

	void remember(const std::string &base, const fs::path &path) {
		if (config.max_index_entries == 0) return;

		std::lock_guard<std::mutex> lock(index_mutex);
		if (index.size() >= config.max_index_entries && !index.count(base)) {
			// Evicted entries are found again by the directory scan.
			index.erase(index.begin());
		}
		index[base] = path;
	}

	Result<fs::path> prepare_directory() {
		const auto &dir = config.thumbnails_directory;
		if (dir.empty()) {
			spdlog::error("The thumbnails directory is not configured");
			return outcome::failure(errc::configuration_error);
		}
		if (dir.native().find('\0') != fs::path::string_type::npos) {
			spdlog::error("The thumbnails directory {} is invalid", dir.string());
			return outcome::failure(errc::configuration_error);
		}

		std::error_code ec;
		auto status = fs::status(dir, ec);
		if (fs::exists(status)) {
			if (!fs::is_directory(status)) {
				spdlog::error("The thumbnails directory {} is not a directory",
							  dir.string());
				return outcome::failure(errc::configuration_error);
			}
		} else {
			fs::create_directories(dir, ec);
			if (ec) {
				spdlog::error("Could not create the thumbnails directory {}: {}",
							  dir.string(), ec.message());
				return outcome::failure(errc::configuration_error);
			}
			spdlog::info("Created thumbnails directory {}", dir.string());
		}

		fs::permissions(dir, fs::perms::owner_all, fs::perm_options::add, ec);
		if (ec) {
			spdlog::error("Could not make the thumbnails directory {} writable: {}",
						  dir.string(), ec.message());
			return outcome::failure(errc::configuration_error);
		}
		return dir;
	}

	// First existing "<base>.<ext>" file, by name.
	std::optional<fs::path> scan(const fs::path &dir, const std::string &base) {
		const std::string prefix = base + ".";
		std::vector<fs::path> matches;

		std::error_code ec;
		for (fs::directory_iterator it(dir, ec), end; !ec && it != end;
			 it.increment(ec)) {
			if (!it->is_regular_file(ec)) continue;
			auto name = it->path().filename().string();
			if (name.size() > prefix.size() && name.compare(0, prefix.size(), prefix) == 0) {
				matches.push_back(it->path());
			}
		}
		if (ec) {
			spdlog::warn("Failed to scan thumbnails directory {}: {}",
						 dir.string(), ec.message());
		}

		if (matches.empty()) return std::nullopt;
		std::sort(matches.begin(), matches.end());
		return matches.front();
	}

	std::optional<std::string> remote_thumbnail_uri(const VideoData &data) {
		auto uri = data.is_recorded ? api->get_video_thumbnail_uri(data.id)
									: api->get_channel_thumbnail_uri(data.id);
		if (uri.has_error()) {
			spdlog::warn("Could not look up the thumbnail of {} {}: {}",
						 data.is_recorded ? "video" : "channel", data.id,
						 uri.error().message());
			return std::nullopt;
		}
		if (!uri.value()) {
			spdlog::info("{} {} has no remote thumbnail",
						 data.is_recorded ? "Video" : "Channel", data.id);
		}
		return uri.value();
	}

	std::string determine_extension(const std::string &uri) {
		if (auto ext = extension_from_uri(uri)) return *ext;

		auto res = http->head(uri);
		if (res.has_error()) {
			spdlog::debug("HEAD {} failed: {}", uri, res.error().message());
			return kDefaultExtension;
		}
		if (auto content_type = net::find_header(res.value(), "Content-Type")) {
			if (auto ext = extension_for_mime_type(*content_type)) return *ext;
			spdlog::debug("No extension known for Content-Type {}", *content_type);
		}
		return kDefaultExtension;
	}

	// Writes next to the target and renames over it, so readers never see a
	// partial file.
	Result<void> write_atomically(const fs::path &target,
								  const std::string &bytes) {
		const fs::path temp =
			target.parent_path() /
			fmt::format(".{}.{:02x}.tmp", target.filename().string(),
						fmt::join(crypto::random_bytes(6), ""));

		std::ofstream out(temp, std::ios::binary | std::ios::trunc);
		out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
		// Buffered data is only flushed here, so close() can still fail.
		out.close();
		if (out.fail()) {
			spdlog::error("Failed to write {}", temp.string());
			std::error_code ignored;
			fs::remove(temp, ignored);
			return outcome::failure(errc::file_write_failed);
		}

		std::error_code ec;
		fs::rename(temp, target, ec);
		if (ec) {
			spdlog::error("Failed to move {} to {}: {}", temp.string(),
						  target.string(), ec.message());
			std::error_code ignored;
			fs::remove(temp, ignored);
			return outcome::failure(errc::file_write_failed);
		}
		return outcome::success();
	}

	Result<std::optional<fs::path>> resolve(const VideoData &data) {
		auto dir = prepare_directory();
		if (dir.has_error()) return dir.error();

		const auto base = base_filename(
			data.id, data.is_recorded, data.thumbnail_reference_id);

		if (auto hit = lookup_index(base)) return hit;

		FileLock file_lock(*this, base);

		// Another thread may have finished the download while we waited.
		if (auto hit = lookup_index(base)) return hit;

		if (auto hit = scan(dir.value(), base)) {
			spdlog::debug("Found cached thumbnail {}", hit->string());
			remember(base, *hit);
			return hit;
		}

		auto uri = remote_thumbnail_uri(data);
		if (!uri) return std::optional<fs::path>{};

		auto response = http->get(*uri);
		if (response.has_error()) {
			spdlog::warn("Failed to download thumbnail {}: {}", *uri,
						 response.error().message());
			return std::optional<fs::path>{};
		}
		if (response.value().status_code != 200) {
			spdlog::warn("Thumbnail download {} returned status {}", *uri,
						 response.value().status_code);
			return std::optional<fs::path>{};
		}

		const auto extension = determine_extension(*uri);
		const fs::path target = dir.value() / (base + "." + extension);
		if (write_atomically(target, response.value().body).has_error()) {
			return std::optional<fs::path>{};
		}

		spdlog::info("Cached thumbnail {} as {}", *uri, target.string());
		remember(base, target);
		return std::optional<fs::path>{target};
	}
};

ThumbnailCache::ThumbnailCache(const CacheConfig &config,
							   std::shared_ptr<net::HttpClient> http,
							   std::shared_ptr<api::ApiClient> api)
	: m_impl(std::make_unique<Impl>(config, std::move(http), std::move(api))) {}

ThumbnailCache::~ThumbnailCache() = default;

std::string ThumbnailCache::base_filename(
	std::string_view id, bool is_recorded,
	std::string_view thumbnail_reference_id) {
	return fmt::format("{}{}{}{}{}{}{}", kFilenamePrefix, kSeparator,
					   crypto::sha1_hex(thumbnail_reference_id), kSeparator,
					   is_recorded ? kRecordedIdentifier : kStreamIdentifier,
					   kSeparator, crypto::sha1_hex(id));
}

Result<std::optional<fs::path>> ThumbnailCache::resolve(const VideoData &data) {
	return m_impl->resolve(data);
}

void ThumbnailCache::invalidate_index() {
	std::lock_guard<std::mutex> lock(m_impl->index_mutex);
	m_impl->index.clear();
}

CacheStats ThumbnailCache::stats() const {
	CacheStats stats;
	{
		std::lock_guard<std::mutex> lock(m_impl->index_mutex);
		stats.indexed_paths = m_impl->index.size();
	}
	{
		std::lock_guard<std::mutex> lock(m_impl->locks_mutex);
		stats.file_locks = m_impl->file_locks.size();
	}
	return stats;
}

const CacheConfig &ThumbnailCache::config() const { return m_impl->config; }

}  // namespace ibmvideo::cache
