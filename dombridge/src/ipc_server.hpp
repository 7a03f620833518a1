#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace dombridge::ipc {

/**
 * Unix-domain socket server for the operator control surface.
 *
 * Frames are a 4-byte big-endian length followed by the payload. One epoll
 * thread accepts and reads; a worker pool runs the handler and writes the
 * reply frame.
 */
class IpcServer {
public:
    /// Maps one request frame to one response frame.
    using RequestHandler = std::function<std::string(const std::string& request_bytes)>;

    /**
     * @param socket_path Path to the Unix domain socket
     * @param handler Request handler
     * @param thread_pool_size Number of worker threads (0 selects 4)
     */
    IpcServer(std::string socket_path, RequestHandler handler, size_t thread_pool_size = 4);
    ~IpcServer();

    IpcServer(const IpcServer&) = delete;
    IpcServer& operator=(const IpcServer&) = delete;

    bool start();
    void stop();
    bool is_running() const { return running_.load(); }
    const std::string& socket_path() const { return socket_path_; }

    static constexpr uint32_t kMaxFrameSize = 16 * 1024 * 1024;

private:
    struct ClientTask {
        int client_fd;
        std::string request_data;
    };

    std::string socket_path_;
    RequestHandler handler_;
    size_t thread_pool_size_;
    int server_fd_ = -1;
    int epoll_fd_ = -1;
    std::atomic<bool> running_{false};

    std::thread accept_thread_;

    std::vector<std::thread> worker_threads_;
    std::queue<ClientTask> task_queue_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::atomic<bool> pool_running_{false};

    std::unordered_set<int> client_fds_;
    std::mutex client_fds_mutex_;

    bool setup_socket();
    void accept_loop();
    void worker_thread_func();
    void close_client(int client_fd);
    bool read_request(int client_fd, std::string& request_data);
    bool send_response(int client_fd, const std::string& response);
    void handle_client(int client_fd, const std::string& request_data);
};

} // namespace dombridge::ipc
