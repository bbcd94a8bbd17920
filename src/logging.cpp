// Copyright (c) 2026 The TeamBalance developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <logging.h>

#include <boost/date_time/posix_time/posix_time.hpp>

const char * const DEFAULT_DEBUGLOGFILE = "debug.log";

/**
 * NOTE: the logger instance is leaked on exit. This is ugly, but will be
 * cleaned up by the OS/libc. Defining a logger as a global object doesn't work
 * since the order of destruction of static/global objects is undefined.
 * Consider if the logger gets destroyed, and then some later destructor calls
 * LogPrintf, maybe indirectly, and you get a core dump at shutdown trying to
 * access the logger. When the shutdown sequence is fully audited and tested,
 * explicit destruction of these objects can be implemented by changing this
 * from a raw pointer to a std::unique_ptr.
 */
TBLog::Logger* const g_logger = new TBLog::Logger();

TBLog::Logger::~Logger()
{
    CloseDebugLog();
}

bool TBLog::Logger::OpenDebugLog()
{
    std::lock_guard<std::mutex> scoped_lock(m_file_mutex);

    if (m_fileout != nullptr || m_file_path.empty()) {
        return false;
    }

    m_fileout = fopen(m_file_path.c_str(), "a");
    if (!m_fileout) {
        return false;
    }

    setbuf(m_fileout, nullptr); // unbuffered
    // dump buffered messages from before we opened the log
    while (!m_msgs_before_open.empty()) {
        fwrite(m_msgs_before_open.front().data(), 1, m_msgs_before_open.front().size(), m_fileout);
        m_msgs_before_open.pop_front();
    }

    return true;
}

void TBLog::Logger::CloseDebugLog()
{
    std::lock_guard<std::mutex> scoped_lock(m_file_mutex);
    if (m_fileout) {
        fclose(m_fileout);
        m_fileout = nullptr;
    }
}

void TBLog::Logger::EnableCategory(TBLog::LogFlags flag)
{
    m_categories |= flag;
}

bool TBLog::Logger::EnableCategory(const std::string& str)
{
    TBLog::LogFlags flag;
    if (!GetLogCategory(flag, str)) return false;
    EnableCategory(flag);
    return true;
}

void TBLog::Logger::DisableCategory(TBLog::LogFlags flag)
{
    m_categories &= ~flag;
}

bool TBLog::Logger::DisableCategory(const std::string& str)
{
    TBLog::LogFlags flag;
    if (!GetLogCategory(flag, str)) return false;
    DisableCategory(flag);
    return true;
}

bool TBLog::Logger::WillLogCategory(TBLog::LogFlags category) const
{
    return (m_categories.load(std::memory_order_relaxed) & category) != 0;
}

struct CLogCategoryDesc
{
    TBLog::LogFlags flag;
    std::string category;
};

const CLogCategoryDesc LogCategories[] =
{
    {TBLog::NONE, "0"},
    {TBLog::NONE, "none"},
    {TBLog::LEDGER, "ledger"},
    {TBLog::TRANSFER, "transfer"},
    {TBLog::CONFIG, "config"},
    {TBLog::ALL, "1"},
    {TBLog::ALL, "all"},
};

bool GetLogCategory(TBLog::LogFlags& flag, const std::string& str)
{
    if (str == "") {
        flag = TBLog::ALL;
        return true;
    }
    for (const CLogCategoryDesc& category_desc : LogCategories) {
        if (category_desc.category == str) {
            flag = category_desc.flag;
            return true;
        }
    }
    return false;
}

std::string ListLogCategories()
{
    std::string ret;
    int outcount = 0;
    for (const CLogCategoryDesc& category_desc : LogCategories) {
        // Omit the special cases.
        if (category_desc.flag != TBLog::NONE && category_desc.flag != TBLog::ALL) {
            if (outcount != 0) ret += ", ";
            ret += category_desc.category;
            outcount++;
        }
    }
    return ret;
}

std::string TBLog::Logger::LogTimestampStr(const std::string& str)
{
    std::string strStamped;

    if (!m_log_timestamps)
        return str;

    if (m_started_new_line) {
        strStamped = boost::posix_time::to_iso_extended_string(boost::posix_time::second_clock::universal_time());
        strStamped += "Z " + str;
    } else
        strStamped = str;

    if (!str.empty() && str[str.size()-1] == '\n')
        m_started_new_line = true;
    else
        m_started_new_line = false;

    return strStamped;
}

int TBLog::Logger::LogPrintStr(const std::string& str)
{
    int ret = 0; // Returns total number of characters written
    std::string strTimestamped = LogTimestampStr(str);

    if (m_print_to_console) {
        // print to console
        ret = fwrite(strTimestamped.data(), 1, strTimestamped.size(), stdout);
        fflush(stdout);
    }
    if (m_print_to_file) {
        std::lock_guard<std::mutex> scoped_lock(m_file_mutex);

        // buffer if we haven't opened the log yet
        if (m_fileout == nullptr) {
            ret = strTimestamped.length();
            m_msgs_before_open.push_back(strTimestamped);
        }
        else
        {
            ret = fwrite(strTimestamped.data(), 1, strTimestamped.size(), m_fileout);
        }
    }
    return ret;
}
