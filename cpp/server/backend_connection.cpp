#include "backend_connection.hpp"
#include "socket_endpoint.hpp"

#include <unistd.h>

namespace sockgate {

BackendConnection::BackendConnection(const std::string& socket_path)
    : fd_(connect_unix_socket(socket_path)), socket_path_(socket_path) {}

BackendConnection::~BackendConnection() {
    close();
}

BackendConnection::BackendConnection(BackendConnection&& other) noexcept
    : fd_(other.fd_), socket_path_(std::move(other.socket_path_)) {
    other.fd_ = -1;
}

BackendConnection& BackendConnection::operator=(BackendConnection&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        socket_path_ = std::move(other.socket_path_);
        other.fd_ = -1;
    }
    return *this;
}

void BackendConnection::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace sockgate
