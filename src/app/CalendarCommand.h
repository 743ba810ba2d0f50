/*
 * CalendarCommand.h
 *
 * Purpose:
 *   Declares CalendarCommand, the operator command surface of the calendar.
 *
 * Grammar:
 *   help
 *   reload
 *   set <day|month|year> <value>
 *   event start <id> | event end | event status
 *
 * Permissions:
 *   - help and event status are open to everyone; everything else requires an operator.
 *
 * Notes:
 *   - Sub-commands and set fields are case-insensitive.
 *   - execute() never throws; every outcome is reported through CommandResult.
 */

#pragma once

#include <string>
#include <vector>

class CalendarSystem;

struct CommandSender {
    std::string name;
    bool isOperator = false;
};

enum class CommandStatus {
    Success,
    Usage,
    NoPermission,
    InvalidValue,
    NotFound,
    NoActiveEvent,
    UnknownSubcommand
};

struct CommandResult {
    CommandStatus status = CommandStatus::Success;

    // Reply lines shown to the sender.
    std::vector<std::string> lines;

    bool ok() const { return status == CommandStatus::Success; }
};

const char* CommandStatusName(CommandStatus status);

class CalendarCommand {
public:
    explicit CalendarCommand(CalendarSystem& system) : m_system(system) {}

    CommandResult execute(const CommandSender& sender, const std::vector<std::string>& args);

    // Splits line on whitespace and executes it.
    CommandResult execute(const CommandSender& sender, const std::string& line);

    /*
     * Tab-completion candidates for the last (partial) argument.
     *
     * Returns:
     *   Candidates starting with the partial argument; empty for non-operators.
     */
    std::vector<std::string> complete(const CommandSender& sender, const std::vector<std::string>& args) const;

    static std::vector<std::string> splitArgs(const std::string& line);

private:
    CommandResult help() const;
    CommandResult reload();
    CommandResult set(const std::vector<std::string>& args);
    CommandResult event(const CommandSender& sender, const std::vector<std::string>& args);

    CalendarSystem& m_system;
};
