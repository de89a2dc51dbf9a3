#include <algorithm>
#include <cctype>
#include <ibmvideo/thumbnail_cache.hpp>
#include <string>
#include <unordered_map>

namespace ibmvideo::cache {

namespace {

// Preferred extension per image type.
const std::unordered_map<std::string, std::string> &mime_table() {
	static const std::unordered_map<std::string, std::string> table = {
		{"image/jpeg", "jpg"},
		{"image/pjpeg", "jpg"},
		{"image/jpg", "jpg"},
		{"image/png", "png"},
		{"image/x-png", "png"},
		{"image/apng", "apng"},
		{"image/gif", "gif"},
		{"image/webp", "webp"},
		{"image/avif", "avif"},
		{"image/heic", "heic"},
		{"image/heif", "heif"},
		{"image/bmp", "bmp"},
		{"image/x-ms-bmp", "bmp"},
		{"image/tiff", "tif"},
		{"image/svg+xml", "svg"},
		{"image/x-icon", "ico"},
		{"image/vnd.microsoft.icon", "ico"},
		{"image/jxl", "jxl"},
	};
	return table;
}

}  // namespace

std::optional<std::string> extension_for_mime_type(std::string_view mime_type) {
	auto essence_view = mime_type.substr(0, mime_type.find(';'));
	const auto first = essence_view.find_first_not_of(" \t");
	if (first == std::string_view::npos) return std::nullopt;
	const auto last = essence_view.find_last_not_of(" \t");

	std::string essence(essence_view.substr(first, last - first + 1));
	std::transform(essence.begin(), essence.end(), essence.begin(),
				   [](unsigned char c) { return std::tolower(c); });

	const auto &table = mime_table();
	auto it = table.find(essence);
	if (it == table.end()) return std::nullopt;
	return it->second;
}

}  // namespace ibmvideo::cache
