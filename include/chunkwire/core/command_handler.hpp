#pragma once

#include <string>
#include <vector>

namespace chunkwire::core {

struct CommandResult {
    bool success;
    std::string message;
    int exit_code;

    static CommandResult ok(const std::string& msg = "") {
        return {true, msg, 0};
    }

    static CommandResult error(const std::string& msg, int code = 1) {
        return {false, msg, code};
    }
};

class CommandHandler {
public:
    virtual ~CommandHandler() = default;

    // args[0] is the command name itself.
    virtual CommandResult execute(const std::vector<std::string>& args) = 0;
    virtual std::string get_description() const = 0;
    virtual std::string get_usage() const = 0;
};

// Offers a file to every peer that connects until interrupted.
class SendCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Share a file with connecting peers"; }
    std::string get_usage() const override { return "chunkwire send <file>"; }
};

// Downloads the file offered by a sending peer, reconnecting and resuming on loss.
class ReceiveCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Download the file a peer is sending"; }
    std::string get_usage() const override { return "chunkwire receive <host>"; }
};

class StatusCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "List stored transfers and their progress"; }
    std::string get_usage() const override { return "chunkwire status"; }
};

class PurgeCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Delete a stored transfer and its chunks"; }
    std::string get_usage() const override { return "chunkwire purge <file_id>"; }
};

class GcCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Remove transfers idle longer than storage.gc_after_hours"; }
    std::string get_usage() const override { return "chunkwire gc [hours]"; }
};

}
