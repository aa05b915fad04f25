#pragma once
// =============================================================================
// Tether - Command Channel (tray -> app)
// =============================================================================
// Unix stream socket, one command per connection:
//   show | pair_new | quit | connect:<addr> | disconnect:<addr>
//   | mirror:<addr> | unpair:<addr>
// The accept loop wakes at least every accept_timeout to check the stop
// flag. Unknown or malformed commands are logged and ignored.
// =============================================================================

#include <atomic>
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <thread>

#include "ipc/unix_socket.hpp"
#include "result.hpp"

namespace tether::ipc {

struct Command {
    std::string name;
    std::string argument;   // empty for bare tokens
};

// One read's worth of bytes -> command. nullopt for empty or unknown input.
std::optional<Command> parseCommand(const std::string& raw);

bool isKnownCommand(const std::string& name);

class CommandServer {
public:
    using Handler = std::function<void(const Command&)>;

    static constexpr size_t MAX_MESSAGE = 1024;

    CommandServer(std::string socket_path, Handler handler,
                  std::chrono::milliseconds accept_timeout = std::chrono::milliseconds(1000));
    ~CommandServer();

    CommandServer(const CommandServer&) = delete;
    CommandServer& operator=(const CommandServer&) = delete;

    Result<void, IoError> start();
    void stop();
    bool is_running() const { return running_.load(); }
    const std::string& path() const { return path_; }

private:
    void server_loop();
    void handle_client(UniqueFd client);

    const std::string path_;
    Handler handler_;
    const std::chrono::milliseconds accept_timeout_;

    UniqueFd listen_fd_;
    std::atomic<bool> running_{false};
    std::thread server_thread_;
};

} // namespace tether::ipc
