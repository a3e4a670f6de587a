#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Newline-delimited JSON endpoint. Clients send commands and receive
// responses and events on the same connection.
class IpcServer {
public:
    virtual ~IpcServer() = default;
    virtual bool start(const std::string& endpoint) = 0;
    virtual void stop() = 0;
    virtual int server_fd() const = 0;
    virtual int accept_client() = 0;
    // Appends every complete message received so far. Returns false once
    // the peer has disconnected.
    virtual bool read_messages(int client_fd, std::vector<nlohmann::json>& out) = 0;
    virtual bool send(int client_fd, const nlohmann::json& msg) = 0;
    virtual void close_client(int client_fd) = 0;
};
