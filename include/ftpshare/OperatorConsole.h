/**
 * @file OperatorConsole.h
 * @brief Interactive text menu driving the service supervisor
 */

#pragma once

#include "ftpshare/ServiceSupervisor.h"

#include <iosfwd>
#include <string>

namespace FtpShare {

/**
 * @brief Print the copy/paste connection block used in non-interactive mode
 *
 * Lines: "ip:", "port:", "username:", "password:", "all_ips:".
 */
void printConnectionInfo(std::ostream& out, const SupervisorSnapshot& snapshot);

/**
 * @brief Ask for a value, returning @p defaultValue on empty input or EOF
 */
std::string promptWithDefault(std::istream& in, std::ostream& out,
                              const std::string& prompt, const std::string& defaultValue);

/**
 * @class OperatorConsole
 * @brief Numbered menu over a pair of streams
 *
 * Every mutating choice goes through ServiceSupervisor::applyField() or
 * restartCurrent(); the console itself holds no configuration. End of input
 * is treated like "Stop server and exit".
 *
 * Usage:
 * @code
 * OperatorConsole console(supervisor, std::cin, std::cout);
 * console.reportStartup(supervisor.start(config));
 * console.run();
 * @endcode
 */
class OperatorConsole {
public:
    OperatorConsole(ServiceSupervisor& supervisor, std::istream& in, std::ostream& out);

    /**
     * @brief Print the outcome of the initial start
     */
    void reportStartup(const TransitionResult& result);

    /**
     * @brief Print "Failed to start..." after a startup validation error
     */
    void reportStartupError(const std::string& message);

    /**
     * @brief Show the menu until option 7 or end of input, then stop the server
     */
    void run();

    /**
     * @brief Handle one menu selection
     * @return false when the console should exit
     */
    bool handleChoice(const std::string& choice);

private:
    bool readLine(std::string& line);
    void printMenu();
    void printCredentials();
    void printRestarted(const SupervisorSnapshot& snapshot);

    /// @return false on end of input
    bool changeField(ConfigField field, const std::string& prompt);
    void restartWithCurrentSettings();

    ServiceSupervisor& m_supervisor;
    std::istream& m_in;
    std::ostream& m_out;
};

}  // namespace FtpShare
