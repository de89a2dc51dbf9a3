#pragma once

#include <ibmvideo/ibmvideo_export.h>

#include <chrono>
#include <ibmvideo/result.hpp>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace ibmvideo::net {

struct IBMVIDEO_EXPORT HttpResponse {
	int status_code = 0;
	std::string body;
	std::map<std::string, std::string> headers;
};

struct IBMVIDEO_EXPORT HttpOptions {
	// Deadline for connect, handshake, write and read of one request.
	std::chrono::seconds timeout{30};
	int max_redirects = 5;
	std::string user_agent = "ibmvideo/1.0";
};

using HttpHeaders = std::map<std::string, std::string>;

// Blocking HTTP client. Any received response is a success, whatever its
// status code; only transport failures (including timeouts) are errors,
// reported as errc::transport_error.
class IBMVIDEO_EXPORT HttpClient {
   public:
	HttpClient() = default;
	HttpClient(const HttpClient &) = delete;
	HttpClient &operator=(const HttpClient &) = delete;
	virtual ~HttpClient() = default;

	virtual Result<HttpResponse> get(const std::string &url,
									 const HttpHeaders &headers = {}) = 0;
	virtual Result<HttpResponse> head(const std::string &url,
									  const HttpHeaders &headers = {}) = 0;
};

// HttpClient over Boost.Beast, with TLS through OpenSSL.
class IBMVIDEO_EXPORT BeastHttpClient final : public HttpClient {
   public:
	explicit BeastHttpClient(HttpOptions options = {});
	~BeastHttpClient() override;

	Result<HttpResponse> get(const std::string &url,
							 const HttpHeaders &headers = {}) override;
	Result<HttpResponse> head(const std::string &url,
							  const HttpHeaders &headers = {}) override;

	[[nodiscard]] const HttpOptions &options() const;

   private:
	struct Impl;
	std::unique_ptr<Impl> m_impl;
};

/// Case-insensitive response header lookup.
IBMVIDEO_EXPORT std::optional<std::string> find_header(
	const HttpResponse &response, std::string_view name);

}  // namespace ibmvideo::net
