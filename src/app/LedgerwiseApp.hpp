/**
 * @file LedgerwiseApp.hpp
 * @brief Command-line front end for Ledgerwise.
 */

#pragma once

#include <map>
#include <string>
#include <vector>
#include "application/AppServices.hpp"

namespace ledgerwise::app {

/**
 * @class LedgerwiseApp
 * @brief Parses the command line, wires the services for one data directory and
 * runs a single command.
 *
 * Commands: classify, override, train, retrain, learn-rules, reconcile, stats.
 * Results are written as JSON to stdout (or --out); logs go to stdout/stderr.
 */
class LedgerwiseApp {
public:
    /**
     * @brief Runs one command.
     * @return Exit code (0 for success).
     */
    int Run(int argc, char** argv);

private:
    bool Init(const std::string& dataDir);

    int Classify(const std::vector<std::string>& args);
    int Override(const std::vector<std::string>& args);
    int Train();
    int Retrain();
    int LearnRules();
    int Reconcile(const std::vector<std::string>& args);
    int Stats();

    /** @brief Prints to stdout, or writes to --out when given. */
    int Emit(const std::string& document);

    void PrintUsage() const;

    application::AppServices m_services;
    std::string m_command;
    std::map<std::string, std::string> m_options; ///< "--key value" pairs; flags map to "".
    std::string m_dataDir;
    std::string m_outPath;
};

} // namespace ledgerwise::app
