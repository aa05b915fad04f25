#include "ipc/command_server.hpp"
#include "adb_client.hpp"
#include "tether_log.hpp"

#include <unistd.h>

namespace tether::ipc {

namespace {

// Read timeout for a connected peer; peers write immediately after connect
constexpr auto kClientReadTimeout = std::chrono::milliseconds(1000);

const char* const kBareCommands[] = {"show", "pair_new", "quit"};
const char* const kAddressCommands[] = {"connect", "disconnect", "mirror", "unpair"};

template<size_t N>
bool inList(const char* const (&list)[N], const std::string& name) {
    for (const char* c : list) {
        if (name == c) return true;
    }
    return false;
}

} // anonymous namespace

bool isKnownCommand(const std::string& name) {
    return inList(kBareCommands, name) || inList(kAddressCommands, name);
}

std::optional<Command> parseCommand(const std::string& raw) {
    const std::string text = trimWhitespace(raw);
    if (text.empty()) return std::nullopt;

    Command cmd;
    auto colon = text.find(':');
    if (colon == std::string::npos) {
        cmd.name = text;
    } else {
        cmd.name = text.substr(0, colon);
        cmd.argument = trimWhitespace(text.substr(colon + 1));
    }

    if (inList(kBareCommands, cmd.name)) {
        return cmd;
    }
    if (inList(kAddressCommands, cmd.name)) {
        if (cmd.argument.empty()) return std::nullopt;
        return cmd;
    }
    return std::nullopt;
}

CommandServer::CommandServer(std::string socket_path, Handler handler,
                             std::chrono::milliseconds accept_timeout)
    : path_(std::move(socket_path)), handler_(std::move(handler)),
      accept_timeout_(accept_timeout.count() > 0 ? accept_timeout : std::chrono::milliseconds(1000)) {}

CommandServer::~CommandServer() {
    stop();
}

Result<void, IoError> CommandServer::start() {
    if (running_.load()) return Result<void, IoError>();

    auto listening = listenUnix(path_);
    if (listening.is_err()) {
        TLOG_ERROR("ipc", "Command channel unavailable: %s", listening.error().message.c_str());
        return listening.error();
    }
    listen_fd_ = std::move(listening).value();

    running_ = true;
    server_thread_ = std::thread(&CommandServer::server_loop, this);
    TLOG_INFO("ipc", "Command channel listening on %s", path_.c_str());
    return Result<void, IoError>();
}

void CommandServer::stop() {
    running_ = false;
    if (server_thread_.joinable()) {
        // From inside a handler: the loop exits after it returns, the owner joins later
        if (server_thread_.get_id() == std::this_thread::get_id()) return;
        server_thread_.join();
    }
    if (!listen_fd_.valid()) return;
    listen_fd_.reset();
    ::unlink(path_.c_str());
    TLOG_INFO("ipc", "Command channel closed");
}

// =============================================================================
// Server loop - accept with timeout so stop() is noticed promptly
// =============================================================================
void CommandServer::server_loop() {
    while (running_.load()) {
        auto accepted = acceptWithTimeout(listen_fd_.get(), accept_timeout_);
        if (accepted.is_err()) {
            TLOG_WARN("ipc", "accept failed: %s", accepted.error().message.c_str());
            // Avoid spinning on a persistent error
            std::this_thread::sleep_for(accept_timeout_);
            continue;
        }
        UniqueFd client = std::move(accepted).value();
        if (!client.valid()) continue;   // timeout
        handle_client(std::move(client));
    }
}

void CommandServer::handle_client(UniqueFd client) {
    auto data = recvOnce(client.get(), MAX_MESSAGE, kClientReadTimeout);
    if (data.is_err()) {
        TLOG_DEBUG("ipc", "Command read failed: %s", data.error().message.c_str());
        return;
    }

    auto cmd = parseCommand(data.value());
    if (!cmd) {
        TLOG_WARN("ipc", "Ignoring unknown command: '%s'", trimWhitespace(data.value()).c_str());
        return;
    }

    TLOG_INFO("ipc", "Command: %s%s%s", cmd->name.c_str(),
              cmd->argument.empty() ? "" : ":", cmd->argument.c_str());
    try {
        handler_(*cmd);
    } catch (const std::exception& e) {
        TLOG_ERROR("ipc", "Command '%s' failed: %s", cmd->name.c_str(), e.what());
    }
}

} // namespace tether::ipc
