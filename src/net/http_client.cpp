#include <spdlog/spdlog.h>
#include <zlib.h>

#include <algorithm>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/url.hpp>
#include <functional>
#include <ibmvideo/http_client.hpp>
#include <type_traits>
#include <utility>

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

namespace ibmvideo::net {

namespace {

// Largest response body accepted (thumbnails and small JSON documents).
constexpr std::uint64_t kMaxBodySize = 16 * 1024 * 1024;

// Extra time given to name resolution, which the stream deadline does not
// cover.
constexpr auto kResolveAllowance = std::chrono::seconds(10);

// =============================================================================
// GZIP/DEFLATE DECOMPRESSION
// =============================================================================

// window_bits: 16 + MAX_WBITS for gzip, -MAX_WBITS for raw deflate.
// Fails with errc::invalid_format on corrupt input and errc::transport_error
// once the output would exceed kMaxBodySize.
Result<std::string> inflate_body(const std::string &compressed,
								 int window_bits) {
	if (compressed.empty()) return std::string{};

	z_stream zs{};
	if (inflateInit2(&zs, window_bits) != Z_OK) {
		spdlog::warn("Failed to init zlib (window bits {})", window_bits);
		return outcome::failure(errc::invalid_format);
	}

	zs.next_in =
		reinterpret_cast<Bytef *>(const_cast<char *>(compressed.data()));
	zs.avail_in = static_cast<uInt>(compressed.size());

	std::string decompressed;
	decompressed.reserve(std::min<size_t>(compressed.size() * 4, kMaxBodySize));

	constexpr size_t kChunkSize = 32768;
	char outbuffer[kChunkSize];

	int ret;
	do {
		zs.next_out = reinterpret_cast<Bytef *>(outbuffer);
		zs.avail_out = kChunkSize;

		ret = inflate(&zs, Z_NO_FLUSH);

		if (ret == Z_NEED_DICT || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR ||
			(ret == Z_BUF_ERROR && zs.avail_in == 0)) {
			inflateEnd(&zs);
			spdlog::debug("zlib inflate error: {}", ret);
			return outcome::failure(errc::invalid_format);
		}

		size_t have = kChunkSize - zs.avail_out;
		if (decompressed.size() + have > kMaxBodySize) {
			inflateEnd(&zs);
			spdlog::warn("Decompressed body exceeds {} bytes", kMaxBodySize);
			return outcome::failure(errc::transport_error);
		}
		decompressed.append(outbuffer, have);
	} while (ret != Z_STREAM_END);

	inflateEnd(&zs);
	return decompressed;
}

// Decompress based on Content-Encoding header. Undecodable bodies are
// returned raw; oversized ones fail with errc::transport_error.
Result<std::string> decompress_body(std::string body,
									const std::string &content_encoding) {
	if (content_encoding.empty() ||
		beast::iequals(content_encoding, "identity")) {
		return body;
	}

	if (beast::iequals(content_encoding, "gzip") ||
		beast::iequals(content_encoding, "x-gzip")) {
		auto result = inflate_body(body, 16 + MAX_WBITS);
		if (result || result.error() == errc::transport_error) return result;
		spdlog::warn("gzip decompression failed, returning raw body");
		return body;
	}

	if (beast::iequals(content_encoding, "deflate")) {
		// Some servers send zlib-wrapped data, others raw deflate.
		auto result = inflate_body(body, MAX_WBITS);
		if (result || result.error() == errc::transport_error) return result;
		result = inflate_body(body, -MAX_WBITS);
		if (result || result.error() == errc::transport_error) return result;
		spdlog::warn("deflate decompression failed, returning raw body");
		return body;
	}

	spdlog::debug(
		"Unknown Content-Encoding: {}, returning raw body", content_encoding);
	return body;
}

struct RequestTarget {
	std::string host;
	std::string port;
	std::string target;	 // origin-form: path + query
	bool tls = false;
};

Result<RequestTarget> parse_target(const std::string &url_str) {
	auto u_res = boost::urls::parse_uri(url_str);
	if (u_res.has_error()) return outcome::failure(errc::invalid_argument);
	boost::urls::url_view u = u_res.value();

	RequestTarget t;
	if (beast::iequals(u.scheme(), "https")) {
		t.tls = true;
	} else if (!beast::iequals(u.scheme(), "http")) {
		return outcome::failure(errc::invalid_argument);
	}

	t.host = u.host();
	if (t.host.empty()) return outcome::failure(errc::invalid_argument);
	t.port = std::string(u.port());
	if (t.port.empty()) t.port = t.tls ? "443" : "80";
	t.target = std::string(u.encoded_path());
	if (u.has_query()) {
		t.target += "?";
		t.target += std::string(u.encoded_query());
	}
	if (t.target.empty()) t.target = "/";
	return t;
}

bool is_redirect(int status) {
	return status == 301 || status == 302 || status == 303 || status == 307 ||
		   status == 308;
}

// Resolves a Location header value against the URL that produced it.
std::optional<std::string> resolve_location(const std::string &base,
											const std::string &location) {
	auto base_res = boost::urls::parse_uri(base);
	auto ref_res = boost::urls::parse_uri_reference(location);
	if (base_res.has_error() || ref_res.has_error()) return std::nullopt;

	boost::urls::url dest;
	auto rv = boost::urls::resolve(base_res.value(), ref_res.value(), dest);
	if (rv.has_error()) return std::nullopt;
	return std::string(dest.buffer());
}

using ResultHandler = std::function<void(Result<HttpResponse>)>;

// One request/response exchange over a fresh connection. Stream is either
// beast::tcp_stream or beast::ssl_stream<beast::tcp_stream>.
template <class Stream>
class RequestSession
	: public std::enable_shared_from_this<RequestSession<Stream>> {
	static constexpr bool kIsTls =
		!std::is_same_v<Stream, beast::tcp_stream>;

   public:
	template <class... StreamArgs>
	RequestSession(asio::io_context &ioc, const HttpOptions &options,
				   RequestTarget target, http::verb method,
				   const HttpHeaders &headers, ResultHandler cb,
				   StreamArgs &&...stream_args)
		: options_(options),
		  target_(std::move(target)),
		  resolver_(ioc),
		  stream_(ioc, std::forward<StreamArgs>(stream_args)...),
		  cb_(std::move(cb)) {
		req_.version(11);
		req_.method(method);
		req_.target(target_.target);
		req_.set(http::field::host, target_.host);
		req_.set(http::field::user_agent, options_.user_agent);
		req_.set(http::field::accept_encoding, "gzip, deflate");
		for (const auto &[key, value] : headers) { req_.set(key, value); }

		parser_.body_limit(kMaxBodySize);
		// Responses to HEAD carry headers only.
		parser_.skip(method == http::verb::head);
	}

	void run() {
		if constexpr (kIsTls) {
			// SNI and host name verification
			if (!SSL_set_tlsext_host_name(
					stream_.native_handle(), target_.host.c_str())) {
				return fail({}, "sni");
			}
			stream_.set_verify_callback(
				ssl::host_name_verification(target_.host));
		}

		resolver_.async_resolve(
			target_.host, target_.port,
			beast::bind_front_handler(
				&RequestSession::on_resolve, this->shared_from_this()));
	}

   private:
	const HttpOptions &options_;
	RequestTarget target_;
	tcp::resolver resolver_;
	Stream stream_;
	ResultHandler cb_;
	beast::flat_buffer buf_;
	http::request<http::empty_body> req_;
	http::response_parser<http::string_body> parser_;

	void on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
		if (ec) return fail(ec, "resolve");

		beast::get_lowest_layer(stream_).expires_after(options_.timeout);
		beast::get_lowest_layer(stream_).async_connect(
			results,
			beast::bind_front_handler(
				&RequestSession::on_connect, this->shared_from_this()));
	}

	void on_connect(beast::error_code ec, tcp::endpoint /*unused*/) {
		if (ec) return fail(ec, "connect");

		if constexpr (kIsTls) {
			stream_.async_handshake(
				ssl::stream_base::client,
				beast::bind_front_handler(
					&RequestSession::on_handshake, this->shared_from_this()));
		} else {
			do_write();
		}
	}

	void on_handshake(beast::error_code ec) {
		if (ec) return fail(ec, "handshake");
		do_write();
	}

	void do_write() {
		http::async_write(
			stream_, req_,
			beast::bind_front_handler(
				&RequestSession::on_write, this->shared_from_this()));
	}

	void on_write(beast::error_code ec, std::size_t) {
		if (ec) return fail(ec, "write");

		http::async_read(
			stream_, buf_, parser_,
			beast::bind_front_handler(
				&RequestSession::on_read, this->shared_from_this()));
	}

	void on_read(beast::error_code ec, std::size_t) {
		if (ec) return fail(ec, "read");

		if constexpr (kIsTls) {
			// Graceful close - short timeout
			beast::get_lowest_layer(stream_).expires_after(
				std::chrono::seconds(2));
			stream_.async_shutdown(beast::bind_front_handler(
				&RequestSession::on_shutdown, this->shared_from_this()));
		} else {
			stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
			finish();
		}
	}

	void on_shutdown(beast::error_code /*ec*/) {
		// Ignore shutdown errors (eof, timeout, etc) since we have the body
		finish();
	}

	void finish() {
		auto res = parser_.release();

		std::string content_encoding;
		auto encoding_it = res.find(http::field::content_encoding);
		if (encoding_it != res.end()) {
			content_encoding = std::string(encoding_it->value());
		}

		auto body = decompress_body(std::move(res.body()), content_encoding);
		if (body.has_error()) {
			spdlog::warn("HTTP {} {}{}: unusable response body",
						 std::string(req_.method_string()), target_.host,
						 target_.target);
			return cb_(body.error());
		}

		HttpResponse response;
		response.status_code = static_cast<int>(res.result_int());
		response.body = std::move(body).value();
		for (auto const &field : res) {
			response.headers[std::string(field.name_string())] =
				std::string(field.value());
		}
		cb_(std::move(response));
	}

	void fail(beast::error_code ec, const char *what) {
		spdlog::warn("HTTP {} {}{} failed in {}: {}",
					 std::string(req_.method_string()), target_.host,
					 target_.target, what, ec.message());
		cb_(outcome::failure(errc::transport_error));
	}
};

}  // namespace

struct BeastHttpClient::Impl {
	HttpOptions options;
	ssl::context ssl_ctx;

	explicit Impl(HttpOptions o)
		: options(std::move(o)), ssl_ctx(ssl::context::tls_client) {
		boost::system::error_code ec;
		ssl_ctx.set_verify_mode(ssl::verify_peer, ec);
		if (ec) {
			spdlog::error("Failed to set SSL verify mode: {}", ec.message());
		}

		ssl_ctx.set_default_verify_paths(ec);
		if (ec) {
			spdlog::error(
				"Failed to set default SSL verify paths: {}", ec.message());
		}
	}

	Result<HttpResponse> perform_once(http::verb method,
									  const std::string &url,
									  const HttpHeaders &headers) {
		auto target = parse_target(url);
		if (target.has_error()) {
			spdlog::warn("Refusing to request malformed URL: {}", url);
			return target.error();
		}

		std::optional<Result<HttpResponse>> result;
		asio::io_context ioc;
		auto on_done = [&result](Result<HttpResponse> r) {
			result.emplace(std::move(r));
		};

		if (target.value().tls) {
			using TlsStream = beast::ssl_stream<beast::tcp_stream>;
			std::make_shared<RequestSession<TlsStream>>(
				ioc, options, std::move(target).value(), method, headers,
				on_done, ssl_ctx)
				->run();
		} else {
			std::make_shared<RequestSession<beast::tcp_stream>>(
				ioc, options, std::move(target).value(), method, headers,
				on_done)
				->run();
		}

		ioc.run_for(options.timeout + kResolveAllowance);

		if (!result) {
			spdlog::warn("HTTP request to {} timed out", url);
			return outcome::failure(errc::transport_error);
		}
		return std::move(*result);
	}

	Result<HttpResponse> perform(http::verb method, const std::string &url,
								 const HttpHeaders &headers) {
		std::string current = url;
		for (int hop = 0;; ++hop) {
			auto res = perform_once(method, current, headers);
			if (res.has_error() || !is_redirect(res.value().status_code)) {
				return res;
			}

			auto location = find_header(res.value(), "Location");
			if (!location || hop >= options.max_redirects) return res;

			auto next = resolve_location(current, *location);
			if (!next) return res;
			spdlog::debug("Following redirect {} -> {}", current, *next);
			current = std::move(*next);
		}
	}
};

BeastHttpClient::BeastHttpClient(HttpOptions options)
	: m_impl(std::make_unique<Impl>(std::move(options))) {}

BeastHttpClient::~BeastHttpClient() = default;

Result<HttpResponse> BeastHttpClient::get(const std::string &url,
										  const HttpHeaders &headers) {
	return m_impl->perform(http::verb::get, url, headers);
}

Result<HttpResponse> BeastHttpClient::head(const std::string &url,
										   const HttpHeaders &headers) {
	return m_impl->perform(http::verb::head, url, headers);
}

const HttpOptions &BeastHttpClient::options() const { return m_impl->options; }

std::optional<std::string> find_header(const HttpResponse &response,
									   std::string_view name) {
	for (const auto &[key, value] : response.headers) {
		if (beast::iequals(key, name)) return value;
	}
	return std::nullopt;
}

}  // namespace ibmvideo::net
