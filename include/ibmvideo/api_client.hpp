#pragma once

#include <ibmvideo/ibmvideo_export.h>

#include <ibmvideo/result.hpp>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

// Forward declarations
namespace ibmvideo::net {
class HttpClient;
}  // namespace ibmvideo::net

namespace ibmvideo::api {

struct IBMVIDEO_EXPORT ApiOptions {
	std::string base_url = "https://api.video.ibm.com";
};

// Thumbnail lookups against the public IBM Video REST API.
//
// Both lookups fail with errc::invalid_argument for an empty ID,
// errc::transport_error if the request could not be made, and
// errc::bad_upstream_response for a non-200 status or a malformed document.
// A document without a thumbnail is a success holding std::nullopt.
class IBMVIDEO_EXPORT ApiClient {
   public:
	ApiClient(std::shared_ptr<net::HttpClient> http, ApiOptions options = {});
	ApiClient(const ApiClient &) = delete;
	ApiClient &operator=(const ApiClient &) = delete;
	virtual ~ApiClient();

	/// URI of the largest picture of a channel.
	virtual Result<std::optional<std::string>> get_channel_thumbnail_uri(
		std::string_view channel_id);

	/// URI of the default thumbnail of a recorded video.
	virtual Result<std::optional<std::string>> get_video_thumbnail_uri(
		std::string_view video_id);

	[[nodiscard]] const ApiOptions &options() const { return options_; }

   private:
	std::shared_ptr<net::HttpClient> http_;
	ApiOptions options_;
};

}  // namespace ibmvideo::api
