#ifndef COMMAND_SERVER_HPP
#define COMMAND_SERVER_HPP

#include <functional>
#include <string>
#include <thread>
#include <atomic>
#include <cstdint>
#include <mutex>

#ifdef _WIN32
  #include <winsock2.h>
  using socket_t = SOCKET;
  static constexpr socket_t kInvalidSocket = INVALID_SOCKET;
#else
  using socket_t = int;
  static constexpr socket_t kInvalidSocket = -1;
#endif

// UDP endpoint for the host application. Each datagram is one command; the
// handler's return value is sent back to the sender, who also becomes the
// active client that receives session events.
class CommandServer {
public:
    using Handler = std::function<std::string(const std::string& payload)>;

    CommandServer(std::string bind_ip, int port, Handler handler);
    ~CommandServer();

    bool start();
    void stop();

    bool isRunning() const { return running_.load(); }

    // Port actually bound (useful when constructed with port 0).
    int boundPort() const { return bound_port_.load(); }

    bool sendTo(const std::string& ip, uint16_t port, const std::string& payload);
    bool sendToActive(const std::string& payload);

private:
    void run();
    bool openSocket();
    void closeSocket();

    void setActiveClient(const std::string& ip, uint16_t port);

    std::string bind_ip_;
    int port_;
    Handler handler_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<socket_t> sock_{kInvalidSocket};
    std::atomic<int> bound_port_{0};

    std::mutex client_mutex_;
    std::string active_ip_{"127.0.0.1"};
    uint16_t active_port_{0};
    bool has_active_client_{false};
};

#endif
