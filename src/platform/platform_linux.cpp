#include "../platform.hpp"
#include <iostream>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <poll.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <atomic>

namespace incidex::platform {

    namespace {
        bool write_all(int fd, const std::string& data) {
            size_t sent = 0;
            while (sent < data.size()) {
                ssize_t n = ::write(fd, data.data() + sent, data.size() - sent);
                if (n < 0) {
                    if (errno == EINTR) continue;
                    return false;
                }
                sent += static_cast<size_t>(n);
            }
            return true;
        }

        bool read_all(int fd, std::string& out) {
            char buffer[4096];
            while (true) {
                ssize_t n = ::read(fd, buffer, sizeof(buffer));
                if (n == 0) return true;
                if (n < 0) {
                    if (errno == EINTR) continue;
                    return false;
                }
                out.append(buffer, static_cast<size_t>(n));
            }
        }

        sockaddr_un make_address(const std::string& path) {
            sockaddr_un addr;
            memset(&addr, 0, sizeof(addr));
            addr.sun_family = AF_UNIX;
            strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
            return addr;
        }
    }

    class LinuxBridge : public Bridge {
    public:
        LinuxBridge() = default;
        ~LinuxBridge() {
            stop();
            close_socket();
        }

        bool listen(const std::string& name) override {
            m_socket_path = system::socket_path(name).string();
            unlink(m_socket_path.c_str());

            m_server_fd = socket(AF_UNIX, SOCK_STREAM, 0);
            if (m_server_fd < 0) {
                std::cerr << "[LinuxBridge] Failed to create socket.\n";
                return false;
            }

            sockaddr_un addr = make_address(m_socket_path);
            if (bind(m_server_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
                std::cerr << "[LinuxBridge] Failed to bind socket: " << strerror(errno) << "\n";
                close(m_server_fd);
                m_server_fd = -1;
                return false;
            }

            if (::listen(m_server_fd, 5) < 0) {
                std::cerr << "[LinuxBridge] Failed to listen on socket.\n";
                close(m_server_fd);
                m_server_fd = -1;
                return false;
            }

            std::cout << "[LinuxBridge] Listening on " << m_socket_path << "\n";
            m_running = true;
            return true;
        }

        void set_handler(MessageCallback handler) override {
            m_handler = std::move(handler);
        }

        void run() override {
            if (m_server_fd < 0) return;

            pollfd pfd = { m_server_fd, POLLIN, 0 };

            while (m_running) {
                int poll_num = poll(&pfd, 1, 500);
                if (poll_num > 0 && (pfd.revents & POLLIN)) {
                    int client_fd = accept(m_server_fd, nullptr, nullptr);
                    if (client_fd >= 0) {
                        handle_client(client_fd);
                    }
                }
            }
            close_socket();
        }

        void stop() override {
            m_running = false;
        }

    private:
        int m_server_fd = -1;
        std::string m_socket_path;
        MessageCallback m_handler;
        std::atomic<bool> m_running{false};

        void close_socket() {
            if (m_server_fd >= 0) {
                close(m_server_fd);
                unlink(m_socket_path.c_str());
                m_server_fd = -1;
            }
        }

        void handle_client(int client_fd) {
            std::string request;
            if (!read_all(client_fd, request)) {
                std::cerr << "[LinuxBridge] Read failed: " << strerror(errno) << "\n";
            } else if (!request.empty()) {
                std::string response = m_handler ? m_handler(request) : "{}";
                if (!write_all(client_fd, response)) {
                    std::cerr << "[LinuxBridge] Write failed: " << strerror(errno) << "\n";
                }
            }
            close(client_fd);
        }
    };

    class LinuxClient : public Client {
    public:
        ~LinuxClient() {
            if (m_fd >= 0) close(m_fd);
        }

        bool connect(const std::string& name) override {
            m_fd = socket(AF_UNIX, SOCK_STREAM, 0);
            if (m_fd < 0) return false;

            sockaddr_un addr = make_address(system::socket_path(name).string());
            if (::connect(m_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
                close(m_fd);
                m_fd = -1;
                return false;
            }
            return true;
        }

        std::string send(const std::string& message) override {
            if (m_fd < 0) return "";
            if (!write_all(m_fd, message)) return "";
            shutdown(m_fd, SHUT_WR);

            std::string response;
            if (!read_all(m_fd, response)) return "";
            return response;
        }

    private:
        int m_fd = -1;
    };

    std::unique_ptr<Bridge> Bridge::create() {
        return std::make_unique<LinuxBridge>();
    }

    std::unique_ptr<Client> Client::create() {
        return std::make_unique<LinuxClient>();
    }

    namespace system {
        std::filesystem::path get_config_dir() {
            const char* home = std::getenv("HOME");
            return home ? std::filesystem::path(home) / ".config/incidex" : "";
        }
        std::filesystem::path get_data_dir() {
            const char* home = std::getenv("HOME");
            return home ? std::filesystem::path(home) / ".local/share/incidex" : "";
        }
        std::filesystem::path socket_path(const std::string& name) {
            return std::filesystem::path("/tmp") / name;
        }
        bool is_daemon_running(const std::string& name) {
            LinuxClient probe;
            return probe.connect(name);
        }
    }

}
