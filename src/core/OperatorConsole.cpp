/**
 * @file OperatorConsole.cpp
 * @brief Interactive text menu driving the service supervisor
 */

#include "ftpshare/OperatorConsole.h"

#include <istream>
#include <ostream>

namespace FtpShare {

namespace {

std::string joinAddresses(const std::vector<std::string>& addresses) {
    std::string out;
    for (size_t i = 0; i < addresses.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += addresses[i];
    }
    return out;
}

}  // namespace

void printConnectionInfo(std::ostream& out, const SupervisorSnapshot& snapshot) {
    out << "ip: " << snapshot.primaryAddress << "\n"
        << "port: " << snapshot.config.port << "\n"
        << "username: " << snapshot.config.username << "\n"
        << "password: " << snapshot.config.password << "\n"
        << "all_ips: " << joinAddresses(snapshot.reachableAddresses) << std::endl;
}

std::string promptWithDefault(std::istream& in, std::ostream& out,
                              const std::string& prompt, const std::string& defaultValue) {
    out << prompt << " [" << defaultValue << "]: " << std::flush;
    std::string line;
    if (!std::getline(in, line)) {
        return defaultValue;
    }
    line = ConfigValidation::trim(line);
    return line.empty() ? defaultValue : line;
}

//=============================================================================
// OperatorConsole
//=============================================================================

OperatorConsole::OperatorConsole(ServiceSupervisor& supervisor, std::istream& in, std::ostream& out)
    : m_supervisor(supervisor)
    , m_in(in)
    , m_out(out)
{
}

bool OperatorConsole::readLine(std::string& line) {
    if (!std::getline(m_in, line)) {
        return false;
    }
    line = ConfigValidation::trim(line);
    return true;
}

void OperatorConsole::reportStartup(const TransitionResult& result) {
    if (!result.ok) {
        if (result.bindError) {
            m_out << result.bindError->what() << "\n";
        }
        m_out << "Failed to start server on default settings. Use menu to reconfigure." << std::endl;
        return;
    }

    const SupervisorSnapshot& s = result.snapshot;
    m_out << "Server started on " << s.config.host << ":" << s.config.port
          << " (user: " << s.config.username << ") -- no logging by default\n"
          << "Detected local IPs: " << joinAddresses(s.reachableAddresses) << "\n"
          << " \n"
          << "ip: " << s.primaryAddress << "\n"
          << "port: " << s.config.port << "\n"
          << "username: " << s.config.username << "\n"
          << "password: " << s.config.password << "\n"
          << " \n"
          << "Listening on " << s.config.host << ":" << s.config.port
          << " (bind address). Primary outbound IP: " << s.primaryAddress << std::endl;
}

void OperatorConsole::reportStartupError(const std::string& message) {
    m_out << message << "\n"
          << "Failed to start server on default settings. Use menu to reconfigure." << std::endl;
}

void OperatorConsole::run() {
    for (;;) {
        printMenu();
        std::string choice;
        if (!readLine(choice)) {
            // EOF: same as option 7
            handleChoice("7");
            return;
        }
        if (!handleChoice(choice)) {
            return;
        }
    }
}

void OperatorConsole::printMenu() {
    m_out << "\nOptions:\n"
          << "1) Change username\n"
          << "2) Change password\n"
          << "3) Change port\n"
          << "4) Change folder\n"
          << "5) Restart server\n"
          << "6) Show credentials\n"
          << "7) Stop server and exit\n"
          << "Select option (1-7): " << std::flush;
}

bool OperatorConsole::handleChoice(const std::string& choice) {
    if (choice == "1") {
        return changeField(ConfigField::Username, "\nNew username: ");
    }
    if (choice == "2") {
        return changeField(ConfigField::Password, "\nNew password: ");
    }
    if (choice == "3") {
        return changeField(ConfigField::Port,
                           "\nNew port (current " + std::to_string(m_supervisor.currentConfig().port) + "): ");
    }
    if (choice == "4") {
        return changeField(ConfigField::SharedRoot,
                           "\nNew folder (current " + m_supervisor.currentConfig().sharedRoot.string() + "): ");
    }
    if (choice == "5") {
        restartWithCurrentSettings();
        return true;
    }
    if (choice == "6") {
        printCredentials();
        return true;
    }
    if (choice == "7") {
        m_out << "\nStopping server and exiting..." << std::endl;
        m_supervisor.stop();
        return false;
    }

    m_out << "Unknown selection" << std::endl;
    return true;
}

bool OperatorConsole::changeField(ConfigField field, const std::string& prompt) {
    m_out << prompt << std::flush;
    std::string value;
    if (!readLine(value)) {
        handleChoice("7");
        return false;
    }

    const FieldUpdateResult result = m_supervisor.applyField(field, value);

    switch (result.outcome) {
    case FieldUpdateOutcome::ValidationFailed:
        m_out << result.message << std::endl;
        return true;

    case FieldUpdateOutcome::BindFailed:
        m_out << result.message << "\n";
        if (field == ConfigField::Port) {
            m_out << "Failed to restart server on the new port. Check for port conflicts and try again.";
        } else {
            m_out << "Failed to restart server after " << configFieldName(field) << " change.";
        }
        m_out << std::endl;
        return true;

    case FieldUpdateOutcome::Applied:
        switch (field) {
        case ConfigField::Username:
            m_out << "Username changed to: " << result.snapshot.config.username << "\n";
            break;
        case ConfigField::Password:
            m_out << "Password updated\n";
            break;
        case ConfigField::Port:
            m_out << "Port set to " << result.snapshot.config.port << "\n";
            break;
        case ConfigField::SharedRoot:
            m_out << "Folder set to " << result.snapshot.config.sharedRoot.string() << "\n";
            break;
        }
        printRestarted(result.snapshot);
        if (!result.persistenceWarning.empty()) {
            m_out << "Warning: " << result.persistenceWarning << std::endl;
        }
        return true;
    }
    return true;
}

void OperatorConsole::restartWithCurrentSettings() {
    m_out << "\nRestarting server with current settings..." << std::endl;

    TransitionResult result;
    try {
        result = m_supervisor.restartCurrent();
    } catch (const ValidationError& e) {
        m_out << e.what() << "\nFailed to restart server. Check settings and try again." << std::endl;
        return;
    }

    if (!result.ok) {
        if (result.bindError) {
            m_out << result.bindError->what() << "\n";
        }
        m_out << "Failed to restart server. Check settings and try again." << std::endl;
        return;
    }

    printRestarted(result.snapshot);
    if (!result.persistenceWarning.empty()) {
        m_out << "Warning: " << result.persistenceWarning << std::endl;
    }
}

void OperatorConsole::printRestarted(const SupervisorSnapshot& snapshot) {
    m_out << "Server restarted on " << snapshot.config.host << ":" << snapshot.config.port
          << " (user: " << snapshot.config.username << ")" << std::endl;
}

void OperatorConsole::printCredentials() {
    const SupervisorSnapshot s = m_supervisor.status();
    m_out << "\nip: " << (s.primaryAddress.empty() ? std::string("(unknown)") : s.primaryAddress) << "\n"
          << "port: " << s.config.port << "\n"
          << "username: " << s.config.username << "\n"
          << "password: " << s.config.password << "\n"
          << "running: " << (s.running ? "yes" : "no") << std::endl;
}

}  // namespace FtpShare
