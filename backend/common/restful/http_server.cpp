#include "http_server.hpp"
#include "common/logger.hpp"

#include <algorithm>
#include <stdexcept>

namespace common {

namespace {
constexpr std::size_t kFileChunkSize = 65'536;
}

// HttpServer implementation
HttpServer::HttpServer(net::io_context& ioc, tcp::endpoint endpoint,
                       std::shared_ptr<RestApiHandlerBase> api_handler)
  : ioc_(ioc), acceptor_(ioc), api_handler_(api_handler) {

  beast::error_code ec;

  acceptor_.open(endpoint.protocol(), ec);
  if (ec) {
    throw std::runtime_error("Failed to open acceptor: " + ec.message());
  }

  acceptor_.set_option(net::socket_base::reuse_address(true), ec);
  if (ec) {
    throw std::runtime_error("Failed to set reuse_address: " + ec.message());
  }

  acceptor_.bind(endpoint, ec);
  if (ec) {
    throw std::runtime_error("Failed to bind: " + ec.message());
  }

  acceptor_.listen(net::socket_base::max_listen_connections, ec);
  if (ec) {
    throw std::runtime_error("Failed to listen: " + ec.message());
  }
}

void HttpServer::run() {
  doAccept();
}

void HttpServer::stop() {
  net::post(ioc_, [this]() {
    beast::error_code ec;
    acceptor_.close(ec);
    if (ec) {
      LOG_WARN("http", "Closing acceptor failed: " << ec.message());
    }
  });
}

tcp::endpoint HttpServer::localEndpoint() const {
  return acceptor_.local_endpoint();
}

void HttpServer::doAccept() {
  acceptor_.async_accept(
    net::make_strand(ioc_),
    beast::bind_front_handler(&HttpServer::onAccept, this));
}

void HttpServer::onAccept(beast::error_code ec, tcp::socket socket) {
  if (ec == net::error::operation_aborted) {
    return;
  }

  if (ec) {
    LOG_ERROR("http", "Accept error: " << ec.message());
  } else {
    std::make_shared<HttpSession>(std::move(socket), api_handler_)->run();
  }

  doAccept();
}

// HttpSession implementation
HttpSession::FileTransfer::FileTransfer(http::response_header<>&& header, const FileSlice& slice)
  : message(std::move(header)),
    serializer(message),
    input(slice.path, std::ios::in | std::ios::binary),
    remaining(slice.length),
    chunk(static_cast<std::size_t>(std::min<std::uint64_t>(slice.length, kFileChunkSize))) {
  message.body().data = nullptr;
  message.body().more = true;
  if (input) {
    input.seekg(static_cast<std::streamoff>(slice.offset));
  }
}

HttpSession::HttpSession(tcp::socket&& socket, std::shared_ptr<RestApiHandlerBase> api_handler)
  : stream_(std::move(socket)), api_handler_(api_handler) {}

void HttpSession::run() {
  net::dispatch(stream_.get_executor(),
                beast::bind_front_handler(&HttpSession::doRead, shared_from_this()));
}

void HttpSession::doRead() {
  req_ = {};

  stream_.expires_after(std::chrono::seconds(30));

  http::async_read(stream_, buffer_, req_,
                   beast::bind_front_handler(&HttpSession::onRead, shared_from_this()));
}

void HttpSession::onRead(beast::error_code ec, std::size_t bytes_transferred) {
  boost::ignore_unused(bytes_transferred);

  if (ec == http::error::end_of_stream) {
    return doClose();
  }

  if (ec) {
    if (ec != beast::error::timeout) {
      LOG_WARN("http", "Read error: " << ec.message());
    }
    return;
  }

  LOG_DEBUG("http", req_.method_string() << " " << req_.target());

  auto response = api_handler_->handleRequest(std::move(req_));
  if (response.file) {
    return sendFile(std::move(response));
  }
  sendString(std::move(response.message));
}

void HttpSession::sendString(http::response<http::string_body>&& message) {
  auto response = std::make_shared<http::response<http::string_body>>(std::move(message));

  res_ = response;

  http::async_write(stream_, *response,
                    beast::bind_front_handler(&HttpSession::onWrite, shared_from_this(),
                                            response->need_eof()));
}

void HttpSession::sendFile(RestResponse&& response) {
  auto transfer = std::make_shared<FileTransfer>(std::move(response.message.base()), *response.file);
  if (!transfer->input) {
    LOG_ERROR("http", "Cannot open " << response.file->path << " for streaming");
    http::response<http::string_body> error{http::status::internal_server_error, transfer->message.version()};
    error.set(http::field::content_type, "text/plain");
    error.keep_alive(false);
    error.body() = "Cannot read file";
    error.prepare_payload();
    return sendString(std::move(error));
  }

  res_ = transfer;

  // no timeout for long downloads, the peer paces the transfer
  stream_.expires_never();
  http::async_write_header(stream_, transfer->serializer,
                           beast::bind_front_handler(&HttpSession::onWriteFileChunk,
                                                     shared_from_this(), transfer));
}

void HttpSession::onWriteFileChunk(std::shared_ptr<FileTransfer> transfer, beast::error_code ec,
                                   std::size_t bytes_transferred) {
  boost::ignore_unused(bytes_transferred);

  if (ec == http::error::need_buffer) {
    ec = {};
  }

  if (ec) {
    LOG_WARN("http", "File write error: " << ec.message());
    return;
  }

  if (transfer->serializer.is_done()) {
    const bool close = transfer->message.need_eof();
    res_ = nullptr;
    if (close) {
      return doClose();
    }
    return doRead();
  }

  auto& body = transfer->message.body();
  if (transfer->remaining == 0) {
    body.data = nullptr;
    body.size = 0;
    body.more = false;
  } else {
    const auto wanted = std::min<std::uint64_t>(transfer->remaining, transfer->chunk.size());
    transfer->input.read(transfer->chunk.data(), static_cast<std::streamsize>(wanted));
    const auto got = static_cast<std::uint64_t>(transfer->input.gcount());
    if (got == 0) {
      // Content-Length already promised, the stream cannot be completed
      LOG_ERROR("http", "File truncated while streaming, " << transfer->remaining << " bytes missing");
      return doClose();
    }
    transfer->remaining -= got;
    body.data = transfer->chunk.data();
    body.size = static_cast<std::size_t>(got);
    body.more = transfer->remaining > 0;
  }

  http::async_write(stream_, transfer->serializer,
                    beast::bind_front_handler(&HttpSession::onWriteFileChunk,
                                              shared_from_this(), transfer));
}

void HttpSession::onWrite(bool close, beast::error_code ec, std::size_t bytes_transferred) {
  boost::ignore_unused(bytes_transferred);

  if (ec) {
    LOG_WARN("http", "Write error: " << ec.message());
    return;
  }

  if (close) {
    return doClose();
  }

  res_ = nullptr;
  doRead();
}

void HttpSession::doClose() {
  beast::error_code ec;
  stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
}

}
