#pragma once

#include <string>
#include <functional>
#include <memory>
#include <filesystem>

namespace incidex::platform {

    /**
     * @brief Abstract base class for the IPC server (the Bridge).
     * One request per connection: the peer writes a message and half-closes,
     * the bridge answers and closes.
     */
    class Bridge {
    public:
        using MessageCallback = std::function<std::string(const std::string&)>;

        virtual ~Bridge() = default;

        /**
         * @brief Initializes the IPC endpoint.
         * @param name The name of the socket (e.g., "incidex.sock").
         * @return false if the endpoint could not be created.
         */
        virtual bool listen(const std::string& name) = 0;

        virtual void set_handler(MessageCallback handler) = 0;

        /**
         * @brief Runs the accept loop until stop() is called.
         */
        virtual void run() = 0;

        virtual void stop() = 0;

        static std::unique_ptr<Bridge> create();
    };

    /**
     * @brief Abstract base class for the IPC client.
     */
    class Client {
    public:
        virtual ~Client() = default;

        /**
         * @return true if connected successfully.
         */
        virtual bool connect(const std::string& name) = 0;

        /**
         * @brief Sends a message and waits for the full response.
         * @return The response, or an empty string on I/O failure.
         */
        virtual std::string send(const std::string& message) = 0;

        static std::unique_ptr<Client> create();
    };

    namespace system {
        std::filesystem::path get_config_dir();
        std::filesystem::path get_data_dir();
        std::filesystem::path socket_path(const std::string& name);
        bool is_daemon_running(const std::string& name);
    }

}
