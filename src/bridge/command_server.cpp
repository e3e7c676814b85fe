#include "bridge/command_server.hpp"
#include "core/log.hpp"

#include <cstring>
#include <exception>
#include <utility>

#ifdef _WIN32
  #include <ws2tcpip.h>
#else
  #include <cerrno>
  #include <arpa/inet.h>
  #include <sys/socket.h>
  #include <netinet/in.h>
  #include <unistd.h>
#endif

namespace {

const char* kTag = "Command Server";

#ifdef _WIN32
void closesock(socket_t s) { ::closesocket(s); }
std::string lastSocketError() { return std::to_string(WSAGetLastError()); }
#else
void closesock(socket_t s) { ::close(s); }
std::string lastSocketError() { return std::strerror(errno); }
#endif

}

// Constructor
CommandServer::CommandServer(std::string bind_ip, int port, Handler handler)
    : bind_ip_(std::move(bind_ip)), port_(port), handler_(std::move(handler)) {}

// Destructor
CommandServer::~CommandServer() { stop(); }

// Binds the socket, then starts the receive thread
bool CommandServer::start() {
    if (running_.load()) return true;

#ifdef _WIN32
    WSADATA wsa{};
    if (WSAStartup(MAKEWORD(2, 2), &wsa) != 0) {
        logError(kTag, "WSAStartup failed");
        return false;
    }
#endif

    if (!openSocket()) {
#ifdef _WIN32
        WSACleanup();
#endif
        return false;
    }

    running_ = true;
    thread_ = std::thread(&CommandServer::run, this);
    logInfo(kTag, "listening on " + bind_ip_ + ":" + std::to_string(bound_port_.load()));
    return true;
}

// Stops the receive thread
void CommandServer::stop() {
    if (!running_.exchange(false)) return;

    const socket_t s = sock_.load();
    if (s != kInvalidSocket) {
#ifdef _WIN32
        ::shutdown(s, SD_BOTH);
#else
        ::shutdown(s, SHUT_RDWR);
#endif
    }

    if (thread_.joinable()) thread_.join();
    closeSocket();

#ifdef _WIN32
    WSACleanup();
#endif
}

bool CommandServer::openSocket() {
    const socket_t s = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (s == kInvalidSocket) {
        logError(kTag, "socket() failed: " + lastSocketError());
        return false;
    }

    int reuse = 1;
#ifdef _WIN32
    ::setsockopt(s, SOL_SOCKET, SO_REUSEADDR, (const char*)&reuse, sizeof(reuse));
#else
    ::setsockopt(s, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));
#endif

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port_));

    if (::inet_pton(AF_INET, bind_ip_.c_str(), &addr.sin_addr) != 1) {
        logError(kTag, "invalid bind ip: " + bind_ip_);
        closesock(s);
        return false;
    }

    if (::bind(s, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        logError(kTag, "bind() failed: " + lastSocketError());
        closesock(s);
        return false;
    }

    sockaddr_in bound{};
#ifdef _WIN32
    int blen = sizeof(bound);
#else
    socklen_t blen = sizeof(bound);
#endif
    if (::getsockname(s, reinterpret_cast<sockaddr*>(&bound), &blen) == 0) {
        bound_port_ = ntohs(bound.sin_port);
    } else {
        bound_port_ = port_;
    }

    sock_ = s;
    return true;
}

void CommandServer::closeSocket() {
    const socket_t s = sock_.exchange(kInvalidSocket);
    if (s != kInvalidSocket) closesock(s);
}

// Sets current active client, the receiver of session events
void CommandServer::setActiveClient(const std::string& ip, uint16_t port) {
    std::lock_guard<std::mutex> lock(client_mutex_);
    active_ip_ = ip;
    active_port_ = port;
    has_active_client_ = true;
}

// Sends a payload to an ip and port
bool CommandServer::sendTo(const std::string& ip, uint16_t port, const std::string& payload) {
    const socket_t s = sock_.load();
    if (s == kInvalidSocket) return false;

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);

    if (::inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
        return false;
    }

#ifdef _WIN32
    int n = ::sendto(s, payload.data(), (int)payload.size(), 0,
                     reinterpret_cast<sockaddr*>(&addr), (int)sizeof(addr));
    return n == (int)payload.size();
#else
    ssize_t n = ::sendto(s, payload.data(), payload.size(), 0,
                         reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    return n == (ssize_t)payload.size();
#endif
}

// Sends a payload to the active client
bool CommandServer::sendToActive(const std::string& payload) {
    std::string ip;
    uint16_t port = 0;
    {
        std::lock_guard<std::mutex> lock(client_mutex_);
        if (!has_active_client_) return false;
        ip = active_ip_;
        port = active_port_;
    }
    return sendTo(ip, port, payload);
}

// Receive loop; one command per datagram
void CommandServer::run() {
    while (running_.load()) {
        char buff[8192];
        sockaddr_in src{};
#ifdef _WIN32
        int slen = sizeof(src);
        const int n = ::recvfrom(sock_.load(), buff, (int)sizeof(buff) - 1, 0,
                                reinterpret_cast<sockaddr*>(&src), &slen);
#else
        socklen_t slen = sizeof(src);
        const ssize_t n = ::recvfrom(sock_.load(), buff, sizeof(buff) - 1, 0,
                                     reinterpret_cast<sockaddr*>(&src), &slen);
#endif

        // A zero-length read is an empty datagram, or the shutdown from stop()
        if (!running_.load()) break;
        if (n < 0) {
#ifdef _WIN32
            const int err = WSAGetLastError();
            if (err == WSAEINTR || err == WSAECONNRESET) continue;
#else
            if (errno == EINTR) continue;
#endif
            logError(kTag, "recvfrom() failed: " + lastSocketError());
            break;
        }
        buff[n] = '\0';

        char ipstr[INET_ADDRSTRLEN]{};
        const char* ok = ::inet_ntop(AF_INET, &src.sin_addr, ipstr, sizeof(ipstr));
        std::string senderIp = ok ? std::string(ipstr) : std::string("127.0.0.1");
        uint16_t senderPort = ntohs(src.sin_port);

        setActiveClient(senderIp, senderPort);

        std::string reply;
        try {
            if (handler_) reply = handler_(std::string(buff, (size_t)n));
        } catch (const std::exception& e) {
            logError(kTag, std::string("handler threw: ") + e.what());
            continue;
        }

        if (!reply.empty() && !sendTo(senderIp, senderPort, reply)) {
            logWarn(kTag, "failed to send reply to " + senderIp + ":" + std::to_string(senderPort));
        }
    }
}
