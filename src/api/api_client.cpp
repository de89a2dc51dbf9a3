#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <ibmvideo/api_client.hpp>
#include <ibmvideo/embed_url.hpp>
#include <ibmvideo/http_client.hpp>
#include <limits>
#include <nlohmann/json.hpp>

#include "utils.hpp"

namespace ibmvideo::api {

namespace {

// Document order matters when choosing between equally sized pictures.
using json = nlohmann::ordered_json;

std::string endpoint(const ApiOptions &options, std::string_view collection,
					 std::string_view id) {
	std::string base = options.base_url;
	while (!base.empty() && base.back() == '/') base.pop_back();
	return fmt::format(
		"{}/{}/{}.json", base, collection, url::raw_encode(id));
}

// Fetches `<collection>/<id>.json` and returns its `envelope` object.
Result<json> fetch_envelope(net::HttpClient &http, const ApiOptions &options,
							std::string_view collection, std::string_view id,
							const char *envelope) {
	const auto uri = endpoint(options, collection, id);
	auto res = http.get(uri, {{"Accept", "application/json"}});
	if (res.has_error()) {
		spdlog::error("IBM Video API request {} failed: {}", uri,
					  res.error().message());
		return outcome::failure(errc::transport_error);
	}

	const auto &response = res.value();
	if (response.status_code != 200) {
		spdlog::error("IBM Video API returned status {} for {}, expected 200",
					  response.status_code, uri);
		return outcome::failure(errc::bad_upstream_response);
	}

	auto doc = json::parse(response.body, nullptr, false);
	if (doc.is_discarded() || !doc.is_object()) {
		spdlog::error("IBM Video API returned an invalid body for {}", uri);
		return outcome::failure(errc::bad_upstream_response);
	}

	auto it = doc.find(envelope);
	if (it == doc.end()) {
		spdlog::error("IBM Video API response for {} has no root \"{}\" key",
					  uri, envelope);
		return outcome::failure(errc::bad_upstream_response);
	}
	if (!it->is_object()) {
		spdlog::error(
			"IBM Video API response for {} has an invalid \"{}\" element type",
			uri, envelope);
		return outcome::failure(errc::bad_upstream_response);
	}
	return std::move(*it);
}

// Null, [] and {} all mean "no thumbnail defined".
bool is_absent(const json &node) {
	return node.is_null() ||
		   ((node.is_array() || node.is_object()) && node.empty());
}

// Pixel count of a "<width>x<height>" size key. Both sides must be positive
// and the product must fit in a long long.
std::optional<long long> pixel_count(std::string_view size) {
	auto pos = size.find('x');
	if (pos == std::string_view::npos) return std::nullopt;
	auto width = utils::to_long(size.substr(0, pos));
	auto height = utils::to_long(size.substr(pos + 1));
	if (width.has_error() || height.has_error()) return std::nullopt;
	if (width.value() <= 0 || height.value() <= 0) return std::nullopt;
	if (width.value() > std::numeric_limits<long long>::max() / height.value()) {
		return std::nullopt;
	}
	return width.value() * height.value();
}

}  // namespace

ApiClient::ApiClient(std::shared_ptr<net::HttpClient> http, ApiOptions options)
	: http_(std::move(http)), options_(std::move(options)) {}

ApiClient::~ApiClient() = default;

Result<std::optional<std::string>> ApiClient::get_channel_thumbnail_uri(
	std::string_view channel_id) {
	if (channel_id.empty()) return outcome::failure(errc::invalid_argument);

	auto channel =
		fetch_envelope(*http_, options_, "channels", channel_id, "channel");
	if (channel.has_error()) return channel.error();

	const auto *picture = utils::find_node(channel.value(), {"picture"});
	if (!picture || is_absent(*picture)) {
		spdlog::debug("Channel {} has no picture", channel_id);
		return std::optional<std::string>{};
	}
	if (!picture->is_object()) {
		spdlog::error("The \"picture\" element of channel {} is invalid",
					  channel_id);
		return outcome::failure(errc::bad_upstream_response);
	}

	// Largest picture wins; the first usable one is kept if no size key
	// parses.
	std::optional<std::string> chosen;
	long long max_pixels = 0;
	for (const auto &[size, uri] : picture->items()) {
		if (!uri.is_string()) continue;
		if (!chosen) chosen = uri.get<std::string>();

		auto pixels = pixel_count(size);
		if (!pixels) continue;
		if (*pixels > max_pixels) {
			max_pixels = *pixels;
			chosen = uri.get<std::string>();
		}
	}

	if (chosen && chosen->empty()) chosen.reset();
	return chosen;
}

Result<std::optional<std::string>> ApiClient::get_video_thumbnail_uri(
	std::string_view video_id) {
	if (video_id.empty()) return outcome::failure(errc::invalid_argument);

	auto video = fetch_envelope(*http_, options_, "videos", video_id, "video");
	if (video.has_error()) return video.error();

	const auto *thumbnail = utils::find_node(video.value(), {"thumbnail"});
	if (!thumbnail || is_absent(*thumbnail)) {
		spdlog::debug("Video {} has no thumbnail", video_id);
		return std::optional<std::string>{};
	}
	if (!thumbnail->is_object()) {
		spdlog::error("The \"thumbnail\" element of video {} is invalid",
					  video_id);
		return outcome::failure(errc::bad_upstream_response);
	}

	auto uri = utils::traverse_obj<std::string>(*thumbnail, {"default"});
	if (!uri || uri->empty()) return std::optional<std::string>{};
	return uri;
}

}  // namespace ibmvideo::api
