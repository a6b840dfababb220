#pragma once
#include <fstream>
#include <memory>
#include <vector>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio.hpp>
#include "common/restful/rest_api_handler_base.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace common {

class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
  HttpSession(tcp::socket&& socket, std::shared_ptr<RestApiHandlerBase> api_handler);

  void run();

private:
  // Streams a FileSlice after the header, chunk by chunk
  struct FileTransfer {
    FileTransfer(http::response_header<>&& header, const FileSlice& slice);

    http::response<http::buffer_body> message;
    http::response_serializer<http::buffer_body> serializer;
    std::ifstream input;
    std::uint64_t remaining;
    std::vector<char> chunk;
  };

  void doRead();
  void onRead(beast::error_code ec, std::size_t bytes_transferred);
  void sendString(http::response<http::string_body>&& message);
  void sendFile(RestResponse&& response);
  void onWrite(bool close, beast::error_code ec, std::size_t bytes_transferred);
  void onWriteFileChunk(std::shared_ptr<FileTransfer> transfer, beast::error_code ec, std::size_t bytes_transferred);
  void doClose();

  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  http::request<http::string_body> req_;
  std::shared_ptr<void> res_;
  std::shared_ptr<RestApiHandlerBase> api_handler_;
};

class HttpServer {
public:
  HttpServer(net::io_context& ioc, tcp::endpoint endpoint,
             std::shared_ptr<RestApiHandlerBase> api_handler);

  void run();
  void stop();

  // Actual bound endpoint (useful when constructed with port 0)
  tcp::endpoint localEndpoint() const;

private:
  void doAccept();
  void onAccept(beast::error_code ec, tcp::socket socket);

  net::io_context& ioc_;
  tcp::acceptor acceptor_;
  std::shared_ptr<RestApiHandlerBase> api_handler_;
};

}
