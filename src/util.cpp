// Copyright (c) 2026 The TeamBalance developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <util.h>

#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/program_options/detail/config_file.hpp>
#include <boost/program_options/errors.hpp>

#include <cstdlib>
#include <set>

const char * const TEAMBALANCE_CONF_FILENAME = "teambalance.conf";

ArgsManager gArgs;

/** Interpret string as boolean, for argument parsing */
static bool InterpretBool(const std::string& strValue)
{
    if (strValue.empty())
        return true;
    return (atoi(strValue.c_str()) != 0);
}

/** Turn -noX into -X=0 */
static void InterpretNegativeSetting(std::string& strKey, std::string& strValue)
{
    if (strKey.length()>3 && strKey[0]=='-' && strKey[1]=='n' && strKey[2]=='o')
    {
        strKey = "-" + strKey.substr(3);
        strValue = InterpretBool(strValue) ? "0" : "1";
    }
}

void ArgsManager::ParseParameters(int argc, const char* const argv[])
{
    LOCK(cs_args);
    mapArgs.clear();
    mapMultiArgs.clear();

    for (int i = 1; i < argc; i++)
    {
        std::string str(argv[i]);
        std::string strValue;
        size_t is_index = str.find('=');
        if (is_index != std::string::npos)
        {
            strValue = str.substr(is_index+1);
            str = str.substr(0, is_index);
        }

        if (str.empty() || str[0] != '-')
            break;

        // Interpret --foo as -foo.
        // If both --foo and -foo are set, the last takes effect.
        if (str.length() > 1 && str[1] == '-')
            str = str.substr(1);
        InterpretNegativeSetting(str, strValue);

        mapArgs[str] = strValue;
        mapMultiArgs[str].push_back(strValue);
    }
}

bool ArgsManager::ReadConfigStream(std::istream& stream, std::string& error)
{
    LOCK(cs_args);
    std::set<std::string> setOptions;
    setOptions.insert("*");

    try {
        for (boost::program_options::detail::config_file_iterator it(stream, setOptions), end; it != end; ++it)
        {
            // Don't overwrite existing settings so command line settings override the config file
            std::string strKey = std::string("-") + it->string_key;
            std::string strValue = it->value[0];
            InterpretNegativeSetting(strKey, strValue);
            if (mapArgs.count(strKey) == 0)
                mapArgs[strKey] = strValue;
            mapMultiArgs[strKey].push_back(strValue);
        }
    } catch (const boost::program_options::error& e) {
        error = strprintf("Error parsing configuration: %s", e.what());
        return false;
    }
    return true;
}

bool ArgsManager::ReadConfigFile(const std::string& confPath, std::string& error)
{
    boost::filesystem::path path(confPath);
    boost::filesystem::ifstream streamConfig(path);
    if (!streamConfig.good())
        return true; // No config file is OK

    if (!ReadConfigStream(streamConfig, error)) {
        error = strprintf("%s (%s)", error, path.string());
        return false;
    }
    return true;
}

std::vector<std::string> ArgsManager::GetArgs(const std::string& strArg) const
{
    LOCK(cs_args);
    auto it = mapMultiArgs.find(strArg);
    if (it != mapMultiArgs.end()) return it->second;
    return {};
}

bool ArgsManager::IsArgSet(const std::string& strArg) const
{
    LOCK(cs_args);
    return mapArgs.count(strArg);
}

std::string ArgsManager::GetArg(const std::string& strArg, const std::string& strDefault) const
{
    LOCK(cs_args);
    auto it = mapArgs.find(strArg);
    if (it != mapArgs.end()) return it->second;
    return strDefault;
}

int64_t ArgsManager::GetArg(const std::string& strArg, int64_t nDefault) const
{
    LOCK(cs_args);
    auto it = mapArgs.find(strArg);
    if (it != mapArgs.end()) return strtoll(it->second.c_str(), nullptr, 10);
    return nDefault;
}

bool ArgsManager::GetBoolArg(const std::string& strArg, bool fDefault) const
{
    LOCK(cs_args);
    auto it = mapArgs.find(strArg);
    if (it != mapArgs.end()) return InterpretBool(it->second);
    return fDefault;
}

void ArgsManager::ForceSetArg(const std::string& strArg, const std::string& strValue)
{
    LOCK(cs_args);
    mapArgs[strArg] = strValue;
    mapMultiArgs[strArg] = {strValue};
}

void ArgsManager::ClearArgs()
{
    LOCK(cs_args);
    mapArgs.clear();
    mapMultiArgs.clear();
}

static const int screenWidth = 79;
static const int optIndent = 2;
static const int msgIndent = 7;

std::string HelpMessageGroup(const std::string &message) {
    return std::string(message) + std::string("\n\n");
}

std::string HelpMessageOpt(const std::string &option, const std::string &message) {
    return std::string(optIndent,' ') + std::string(option) +
           std::string("\n") + std::string(msgIndent,' ') +
           message.substr(0, screenWidth - msgIndent) +
           std::string("\n\n");
}

bool InitLogging(std::string& error)
{
    g_logger->m_print_to_console = gArgs.GetBoolArg("-printtoconsole", false);
    g_logger->m_log_timestamps = gArgs.GetBoolArg("-logtimestamps", DEFAULT_LOGTIMESTAMPS);

    if (gArgs.IsArgSet("-debuglogfile")) {
        std::string path = gArgs.GetArg("-debuglogfile", DEFAULT_DEBUGLOGFILE);
        if (!path.empty() && path != "0") {
            g_logger->m_file_path = path;
            g_logger->m_print_to_file = true;
            if (!g_logger->OpenDebugLog()) {
                error = strprintf("Could not open debug log file %s", path);
                return false;
            }
        }
    }

    for (const std::string& cat : gArgs.GetArgs("-debug")) {
        if (!g_logger->EnableCategory(cat)) {
            LogPrintf("Unsupported logging category -debug=%s (available: %s)\n", cat, ListLogCategories());
        }
    }
    return true;
}
