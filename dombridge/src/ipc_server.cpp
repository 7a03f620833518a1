#include "ipc_server.hpp"

#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <sys/epoll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <arpa/inet.h>

#include <cerrno>
#include <cstdio>
#include <cstring>

namespace dombridge::ipc {

namespace {

std::string errno_text() {
    return std::strerror(errno);
}

bool write_all(int fd, const char* data, size_t size) {
    size_t offset = 0;
    while (offset < size) {
        ssize_t written = ::send(fd, data + offset, size - offset, MSG_NOSIGNAL);
        if (written < 0 && errno == EINTR) {
            continue;
        }
        if (written <= 0) {
            return false;
        }
        offset += static_cast<size_t>(written);
    }
    return true;
}

bool read_all(int fd, char* data, size_t size) {
    size_t offset = 0;
    while (offset < size) {
        ssize_t chunk = ::read(fd, data + offset, size - offset);
        if (chunk < 0 && errno == EINTR) {
            continue;
        }
        if (chunk <= 0) {
            return false;
        }
        offset += static_cast<size_t>(chunk);
    }
    return true;
}

} // namespace

IpcServer::IpcServer(std::string socket_path, RequestHandler handler, size_t thread_pool_size)
    : socket_path_(std::move(socket_path)),
      handler_(std::move(handler)),
      thread_pool_size_(thread_pool_size > 0 ? thread_pool_size : 4) {}

IpcServer::~IpcServer() {
    stop();
}

bool IpcServer::setup_socket() {
    server_fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        LOG4CPLUS_ERROR(control_logger(), "socket: " << errno_text());
        return false;
    }

    ::unlink(socket_path_.c_str());

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::snprintf(addr.sun_path, sizeof(addr.sun_path), "%s", socket_path_.c_str());

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        LOG4CPLUS_ERROR(control_logger(), "bind " << socket_path_ << ": " << errno_text());
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    if (::listen(server_fd_, 8) < 0) {
        LOG4CPLUS_ERROR(control_logger(), "listen: " << errno_text());
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    return true;
}

bool IpcServer::start() {
    if (running_) {
        return true;
    }

    if (!setup_socket()) {
        return false;
    }

    epoll_fd_ = ::epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        LOG4CPLUS_ERROR(control_logger(), "epoll_create1: " << errno_text());
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.fd = server_fd_;
    if (::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, server_fd_, &ev) < 0) {
        LOG4CPLUS_ERROR(control_logger(), "epoll_ctl ADD server_fd: " << errno_text());
        ::close(epoll_fd_);
        epoll_fd_ = -1;
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    running_ = true;

    pool_running_ = true;
    for (size_t i = 0; i < thread_pool_size_; ++i) {
        worker_threads_.emplace_back(&IpcServer::worker_thread_func, this);
    }

    accept_thread_ = std::thread(&IpcServer::accept_loop, this);

    LOG4CPLUS_INFO(control_logger(), "Control socket listening at " << socket_path_);
    return true;
}

void IpcServer::stop() {
    if (!running_) {
        return;
    }
    running_ = false;

    // epoll_wait wakes at least once a second and sees running_ == false
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }

    if (pool_running_) {
        pool_running_ = false;
        queue_cv_.notify_all();
        for (auto& t : worker_threads_) {
            if (t.joinable()) {
                t.join();
            }
        }
        worker_threads_.clear();
    }

    if (server_fd_ >= 0) {
        ::shutdown(server_fd_, SHUT_RDWR);
        ::close(server_fd_);
        server_fd_ = -1;
    }

    {
        std::lock_guard<std::mutex> lock(client_fds_mutex_);
        for (int fd : client_fds_) {
            ::close(fd);
        }
        client_fds_.clear();
    }

    if (epoll_fd_ >= 0) {
        ::close(epoll_fd_);
        epoll_fd_ = -1;
    }

    ::unlink(socket_path_.c_str());
    LOG4CPLUS_INFO(control_logger(), "Control socket closed");
}

bool IpcServer::read_request(int client_fd, std::string& request_data) {
    uint32_t length_be = 0;
    if (!read_all(client_fd, reinterpret_cast<char*>(&length_be), sizeof(length_be))) {
        return false;
    }

    uint32_t length = ntohl(length_be);
    if (length > kMaxFrameSize) {
        LOG4CPLUS_WARN(control_logger(), "Rejecting oversized frame of " << length << " bytes");
        return false;
    }

    request_data.resize(length);
    return length == 0 || read_all(client_fd, &request_data[0], length);
}

bool IpcServer::send_response(int client_fd, const std::string& response) {
    uint32_t resp_len_be = htonl(static_cast<uint32_t>(response.size()));
    std::string frame(reinterpret_cast<const char*>(&resp_len_be), sizeof(resp_len_be));
    frame += response;
    return write_all(client_fd, frame.data(), frame.size());
}

void IpcServer::handle_client(int client_fd, const std::string& request_data) {
    std::string response;

    try {
        response = handler_(request_data);
    } catch (const std::exception& e) {
        LOG4CPLUS_ERROR(control_logger(), "Handler error: " << e.what());
    }

    if (!send_response(client_fd, response)) {
        LOG4CPLUS_WARN(control_logger(), "Failed to send response on fd " << client_fd << ": " << errno_text());
    }
}

void IpcServer::worker_thread_func() {
    while (pool_running_) {
        ClientTask task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return !task_queue_.empty() || !pool_running_; });

            if (!pool_running_ && task_queue_.empty()) {
                return;
            }

            task = std::move(task_queue_.front());
            task_queue_.pop();
        }

        handle_client(task.client_fd, task.request_data);
    }
}

void IpcServer::close_client(int client_fd) {
    ::epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, client_fd, nullptr);
    ::close(client_fd);

    std::lock_guard<std::mutex> lock(client_fds_mutex_);
    client_fds_.erase(client_fd);
}

void IpcServer::accept_loop() {
    const int MAX_EVENTS = 32;
    epoll_event events[MAX_EVENTS];

    while (running_) {
        int nfds = ::epoll_wait(epoll_fd_, events, MAX_EVENTS, 1000);
        if (nfds < 0) {
            if (errno != EINTR && running_) {
                LOG4CPLUS_ERROR(control_logger(), "epoll_wait: " << errno_text());
            }
            continue;
        }

        for (int i = 0; i < nfds; ++i) {
            int fd = events[i].data.fd;

            if (fd == server_fd_) {
                int client_fd = ::accept4(server_fd_, nullptr, nullptr, SOCK_CLOEXEC);
                if (client_fd < 0) {
                    LOG4CPLUS_WARN(control_logger(), "accept: " << errno_text());
                    continue;
                }

                epoll_event cli_ev{};
                cli_ev.events = EPOLLIN | EPOLLRDHUP;
                cli_ev.data.fd = client_fd;
                if (::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &cli_ev) < 0) {
                    LOG4CPLUS_WARN(control_logger(), "epoll_ctl ADD client_fd: " << errno_text());
                    ::close(client_fd);
                    continue;
                }

                std::lock_guard<std::mutex> lock(client_fds_mutex_);
                client_fds_.insert(client_fd);
                LOG4CPLUS_DEBUG(control_logger(), "Control client connected (fd " << client_fd << ")");
                continue;
            }

            if (events[i].events & EPOLLIN) {
                std::string request_data;
                if (!read_request(fd, request_data)) {
                    close_client(fd);
                    continue;
                }

                {
                    std::lock_guard<std::mutex> lock(queue_mutex_);
                    task_queue_.push({fd, std::move(request_data)});
                }
                queue_cv_.notify_one();
                continue;
            }

            if (events[i].events & (EPOLLRDHUP | EPOLLERR | EPOLLHUP)) {
                close_client(fd);
            }
        }
    }
}

} // namespace dombridge::ipc
