#pragma once

#include <string>
#include <vector>

namespace chunkrelay::core {

struct CommandResult {
    bool success;
    std::string message;
    int exit_code;

    static CommandResult ok(const std::string& msg = "") { return {true, msg, 0}; }
    static CommandResult error(const std::string& msg, int code = 1) { return {false, msg, code}; }
};

class CommandHandler {
public:
    virtual ~CommandHandler() = default;

    // args[0] is the command name itself
    virtual CommandResult execute(const std::vector<std::string>& args) = 0;
    virtual std::string get_description() const = 0;
    virtual std::string get_usage() const = 0;
};

class BudgetCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Show the chunk plan for a payload size"; }
    std::string get_usage() const override { return "chunkrelay budget <bytes>"; }
};

class DigestCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Print the SHA-256 integrity digest of a file"; }
    std::string get_usage() const override { return "chunkrelay digest <file>"; }
};

// Runs a full transfer between two in-process endpoints over a local relay,
// optionally dropping chunk envelopes to exercise recovery.
class SendCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Relay a file through a loopback transfer"; }
    std::string get_usage() const override { return "chunkrelay send <file> [output]"; }
};

class CheckpointsCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "List resumable sender checkpoints"; }
    std::string get_usage() const override { return "chunkrelay checkpoints"; }
};

}
