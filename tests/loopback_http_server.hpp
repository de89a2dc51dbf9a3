#pragma once

#include <fmt/format.h>

#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace ibmvideo::test {

// Plain HTTP server on 127.0.0.1 with its own io_context thread. Every
// connection serves one request with the raw bytes the responder returns;
// std::nullopt keeps the connection open without answering.
class LoopbackHttpServer {
   public:
	using Request =
		boost::beast::http::request<boost::beast::http::string_body>;
	using Responder = std::function<std::optional<std::string>(const Request &)>;

	explicit LoopbackHttpServer(Responder responder)
		: acceptor_(ioc_, tcp::endpoint(boost::asio::ip::make_address(
											"127.0.0.1"),
										0)),
		  responder_(std::move(responder)) {
		do_accept();
		thread_ = std::thread([this] { ioc_.run(); });
	}

	LoopbackHttpServer(const LoopbackHttpServer &) = delete;
	LoopbackHttpServer &operator=(const LoopbackHttpServer &) = delete;

	~LoopbackHttpServer() {
		ioc_.stop();
		thread_.join();
	}

	std::string url(std::string_view path) const {
		return fmt::format("http://127.0.0.1:{}{}",
						   acceptor_.local_endpoint().port(), path);
	}

	int request_count() const { return requests_.load(); }

	std::vector<Request> received() const {
		std::lock_guard<std::mutex> lock(received_mutex_);
		return received_;
	}

   private:
	using tcp = boost::asio::ip::tcp;

	struct Connection {
		explicit Connection(tcp::socket s) : socket(std::move(s)) {}

		tcp::socket socket;
		boost::beast::flat_buffer buffer;
		Request request;
		std::string response;
	};

	void do_accept() {
		acceptor_.async_accept(
			[this](boost::beast::error_code ec, tcp::socket socket) {
				if (ec) return;
				serve(std::make_shared<Connection>(std::move(socket)));
				do_accept();
			});
	}

	void serve(std::shared_ptr<Connection> conn) {
		boost::beast::http::async_read(
			conn->socket, conn->buffer, conn->request,
			[this, conn](boost::beast::error_code ec, std::size_t) {
				if (ec) return;
				++requests_;
				{
					std::lock_guard<std::mutex> lock(received_mutex_);
					received_.push_back(conn->request);
				}

				auto response = responder_(conn->request);
				if (!response) {
					hanging_.push_back(conn);
					return;
				}
				conn->response = std::move(*response);
				boost::asio::async_write(
					conn->socket, boost::asio::buffer(conn->response),
					[conn](boost::beast::error_code write_ec, std::size_t) {
						if (write_ec) return;
						conn->socket.shutdown(tcp::socket::shutdown_send,
											  write_ec);
					});
			});
	}

	boost::asio::io_context ioc_;
	tcp::acceptor acceptor_;
	Responder responder_;
	std::thread thread_;
	std::atomic<int> requests_{0};
	mutable std::mutex received_mutex_;
	std::vector<Request> received_;
	// Only touched on the server thread.
	std::vector<std::shared_ptr<Connection>> hanging_;
};

// Serialized HTTP/1.1 response with Content-Length and Connection: close.
// A HEAD response announces the body length without sending the body.
inline std::string make_response(
	unsigned status, std::string body = {},
	const std::map<std::string, std::string> &headers = {},
	bool head = false) {
	namespace http = boost::beast::http;

	http::response<http::string_body> res;
	res.version(11);
	res.result(status);
	res.set(http::field::connection, "close");
	for (const auto &[name, value] : headers) res.set(name, value);
	if (head) {
		res.content_length(body.size());
	} else {
		res.body() = std::move(body);
		res.prepare_payload();
	}

	std::ostringstream out;
	out << res;
	return out.str();
}

}  // namespace ibmvideo::test
