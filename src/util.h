// Copyright (c) 2026 The TeamBalance developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Server/client environment: argument handling, config file parsing,
 * logging helpers.
 */
#ifndef TEAMBALANCE_UTIL_H
#define TEAMBALANCE_UTIL_H

#include <logging.h>
#include <sync.h>

#include <cstdint>
#include <istream>
#include <map>
#include <string>
#include <vector>

extern const char * const TEAMBALANCE_CONF_FILENAME;

class ArgsManager
{
protected:
    mutable CCriticalSection cs_args;
    std::map<std::string, std::string> mapArgs;
    std::map<std::string, std::vector<std::string>> mapMultiArgs;

public:
    /**
     * Parse "-name=value" style arguments. Parsing stops at the first
     * argument that does not start with '-'.
     */
    void ParseParameters(int argc, const char* const argv[]);

    /**
     * Read "name=value" lines from a config stream. Settings already given
     * on the command line are not overwritten.
     * @return false with error set on a malformed stream
     */
    bool ReadConfigStream(std::istream& stream, std::string& error);

    /**
     * Read the config file at confPath. A missing file is not an error.
     */
    bool ReadConfigFile(const std::string& confPath, std::string& error);

    /**
     * Return a vector of strings of the given argument
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @return command-line arguments
     */
    std::vector<std::string> GetArgs(const std::string& strArg) const;

    /**
     * Return true if the given argument has been manually set
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @return true if the argument has been set
     */
    bool IsArgSet(const std::string& strArg) const;

    /**
     * Return string argument or default value
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @param strDefault (e.g. "1")
     * @return command-line argument or default value
     */
    std::string GetArg(const std::string& strArg, const std::string& strDefault) const;

    /**
     * Return integer argument or default value
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @param nDefault (e.g. 1)
     * @return command-line argument (0 if invalid number) or default value
     */
    int64_t GetArg(const std::string& strArg, int64_t nDefault) const;

    /**
     * Return boolean argument or default value
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @param fDefault (true or false)
     * @return command-line argument or default value
     */
    bool GetBoolArg(const std::string& strArg, bool fDefault) const;

    // Forces an arg setting, replacing any earlier value. Used in testing.
    void ForceSetArg(const std::string& strArg, const std::string& strValue);

    /** Forget every argument (for testing) */
    void ClearArgs();
};

extern ArgsManager gArgs;

/**
 * Format a string to be used as group of options in help messages
 *
 * @param message Group name (e.g. "Ledger options:")
 * @return the formatted string
 */
std::string HelpMessageGroup(const std::string& message);

/**
 * Format a string to be used as option description in help messages
 *
 * @param option Option message (e.g. "-member=<address>:<share>")
 * @param message Option description (e.g. "Add a team member")
 * @return the formatted string
 */
std::string HelpMessageOpt(const std::string& option, const std::string& message);

/**
 * Configure g_logger from -printtoconsole, -logtimestamps, -debuglogfile
 * and -debug. Unknown categories are reported as a warning.
 */
bool InitLogging(std::string& error);

#endif // TEAMBALANCE_UTIL_H
