/*
 * CalendarCommand.cpp
 *
 * Purpose:
 *   Implements parsing, permission checks and dispatch of calendar commands.
 */

#include "app/CalendarCommand.h"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "app/CalendarSystem.h"

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool parseInt(const std::string& text, int& out) {
    if (text.empty()) return false;
    std::size_t pos = 0;
    try {
        long v = std::stol(text, &pos);
        if (pos != text.size() || v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) return false;
        out = static_cast<int>(v);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

CommandResult reply(CommandStatus status, std::string line) {
    CommandResult r;
    r.status = status;
    r.lines.push_back(std::move(line));
    return r;
}

void filterPrefix(std::vector<std::string>& candidates, const std::string& partial) {
    const std::string p = lower(partial);
    candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
                                    [&](const std::string& c) { return c.compare(0, p.size(), p) != 0; }),
                     candidates.end());
}

} // namespace

const char* CommandStatusName(CommandStatus status) {
    switch (status) {
        case CommandStatus::Success:           return "success";
        case CommandStatus::Usage:             return "usage";
        case CommandStatus::NoPermission:      return "no-permission";
        case CommandStatus::InvalidValue:      return "invalid-value";
        case CommandStatus::NotFound:          return "not-found";
        case CommandStatus::NoActiveEvent:     return "no-active-event";
        case CommandStatus::UnknownSubcommand: return "unknown-subcommand";
    }
    return "unknown";
}

std::vector<std::string> CalendarCommand::splitArgs(const std::string& line) {
    std::vector<std::string> out;
    std::istringstream in(line);
    std::string word;
    while (in >> word) out.push_back(word);
    return out;
}

CommandResult CalendarCommand::execute(const CommandSender& sender, const std::string& line) {
    return execute(sender, splitArgs(line));
}

CommandResult CalendarCommand::execute(const CommandSender& sender, const std::vector<std::string>& args) {
    if (args.empty()) return help();

    const std::string sub = lower(args[0]);
    CommandResult result;

    if (sub == "help") {
        result = help();
    } else if (sub == "event") {
        result = event(sender, args);
    } else if (sub == "reload" || sub == "set") {
        if (!sender.isOperator) {
            result = reply(CommandStatus::NoPermission, "You do not have permission to use this command.");
        } else if (!m_system.isRunning()) {
            result = reply(CommandStatus::Usage, "The calendar is not running.");
        } else {
            result = sub == "reload" ? reload() : set(args);
        }
    } else {
        result = reply(CommandStatus::UnknownSubcommand,
                       "Unknown sub-command '" + args[0] + "'. Use 'calendar help'.");
    }

    if (result.ok() && sub != "help") {
        std::cout << "[Command] " << sender.name << ": " << sub << " -> " << CommandStatusName(result.status) << "\n";
    }
    return result;
}

CommandResult CalendarCommand::help() const {
    CommandResult r;
    r.lines = {
        "--- Calendar ---",
        "calendar set <day|month|year> <value> : change the current date",
        "calendar reload : reload configuration and events",
        "calendar event <start <id>|end|status> : manage the active event",
    };
    return r;
}

CommandResult CalendarCommand::reload() {
    m_system.reload();
    return reply(CommandStatus::Success, "Calendar reloaded.");
}

CommandResult CalendarCommand::set(const std::vector<std::string>& args) {
    if (args.size() < 3) {
        return reply(CommandStatus::Usage, "Usage: calendar set <day|month|year> <value>");
    }

    const std::string field = lower(args[1]);
    if (field != "day" && field != "month" && field != "year") {
        return reply(CommandStatus::Usage, "Usage: calendar set <day|month|year> <value>");
    }

    int value = 0;
    if (!parseInt(args[2], value)) {
        return reply(CommandStatus::InvalidValue, "'" + args[2] + "' is not a number.");
    }

    CalendarDate& date = m_system.date();
    if (field == "day") {
        if (!date.setDay(value)) {
            return reply(CommandStatus::InvalidValue,
                         "Day must be between 1 and " + std::to_string(date.daysInCurrentMonth()) + ".");
        }
    } else if (field == "month") {
        if (!date.setMonth(value)) {
            return reply(CommandStatus::InvalidValue, "Month must be between 1 and 12.");
        }
    } else {
        if (!date.setYear(value)) {
            return reply(CommandStatus::InvalidValue, "Year must be 1 or greater.");
        }
    }

    // A shorter month (or a non-leap February) pulls the day back to its last valid value.
    if (date.day() > date.daysInCurrentMonth()) {
        date.setDay(date.daysInCurrentMonth());
    }

    m_system.applyDateChange();
    return reply(CommandStatus::Success, "Date updated to " + date.toString() + ".");
}

CommandResult CalendarCommand::event(const CommandSender& sender, const std::vector<std::string>& args) {
    const std::string action = args.size() >= 2 ? lower(args[1]) : std::string();

    if (action != "status" && !sender.isOperator) {
        return reply(CommandStatus::NoPermission, "You do not have permission to use this command.");
    }
    if (!m_system.isRunning()) {
        return reply(CommandStatus::Usage, "The calendar is not running.");
    }

    EventScheduler& scheduler = m_system.scheduler();

    if (action == "status") {
        const EventDefinition* active = scheduler.activeEvent();
        if (!active) return reply(CommandStatus::Success, "No event is active.");

        std::string line = "Active event: " + active->displayName;
        if (active->isIndefinite()) {
            line += " (until ended)";
        } else {
            line += " (" + std::to_string(scheduler.daysRemaining()) + " days remaining)";
        }
        return reply(CommandStatus::Success, line);
    }

    if (action == "start") {
        if (args.size() < 3) return reply(CommandStatus::Usage, "Usage: calendar event start <id>");

        const EventDefinition* def = m_system.catalog().find(args[2]);
        if (!def) {
            return reply(CommandStatus::NotFound, "Event '" + lower(args[2]) + "' not found.");
        }
        const std::string name = def->displayName;
        scheduler.forceStartEvent(def->id);
        return reply(CommandStatus::Success, "Event started: " + name);
    }

    if (action == "end") {
        if (!scheduler.endActiveEvent()) {
            return reply(CommandStatus::NoActiveEvent, "No event is active.");
        }
        return reply(CommandStatus::Success, "Active event ended.");
    }

    return reply(CommandStatus::Usage, "Usage: calendar event <start <id>|end|status>");
}

std::vector<std::string> CalendarCommand::complete(const CommandSender& sender,
                                                   const std::vector<std::string>& args) const {
    std::vector<std::string> out;
    if (!sender.isOperator || args.empty()) return out;

    const std::string first = lower(args[0]);
    if (args.size() == 1) {
        out = {"event", "help", "reload", "set"};
    } else if (args.size() == 2 && first == "set") {
        out = {"day", "month", "year"};
    } else if (args.size() == 2 && first == "event") {
        out = {"end", "start", "status"};
    } else if (args.size() == 3 && first == "event" && lower(args[1]) == "start" && m_system.isRunning()) {
        for (const auto& entry : m_system.catalog().events()) out.push_back(entry.first);
    }

    filterPrefix(out, args.back());
    return out;
}
