/*
 * Copyright (c) 2025-present
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 *
 * The NDTwin Authors and Contributors:
 *     Prof. Shie-Yuan Wang <National Yang Ming Chiao Tung University; CITI, Academia Sinica>
 *     Ms. Xiang-Ling Lin <CITI, Academia Sinica>
 *     Mr. Po-Yu Juan <CITI, Academia Sinica>
 */

// utils/Utils.hpp
#pragma once

#include "utils/Logger.hpp"
#include <array>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <sstream>
#include <stdexcept>
#include <string>

/**
 * @brief Common utility helpers used across the orchestrator.
 *
 * This header provides small, header-only helpers for:
 *  - shell command execution (popen) and shell quoting,
 *  - datapath-id recognition and parsing,
 *  - timestamp helpers and formatting.
 *
 * @warning execCommand performs I/O and may throw.
 */
namespace utils
{

using SystemTimePoint = std::chrono::system_clock::time_point;

/**
 * @brief Execute a shell command and capture its stdout.
 *
 * @param cmd Shell command string passed to popen().
 * @return Captured stdout output.
 * @throws std::runtime_error if popen() fails.
 *
 * @warning This function executes via the shell. Do not pass untrusted input
 *          into @p cmd unless it went through shellQuote().
 */
inline std::string
execCommand(const std::string& cmd)
{
    std::array<char, 256> buffer;
    std::string result;
    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe)
    {
        throw std::runtime_error("popen() failed!");
    }
    while (fgets(buffer.data(), buffer.size(), pipe))
    {
        result += buffer.data();
    }
    int rc = pclose(pipe);
    if (rc != 0)
    {
        SPDLOG_LOGGER_DEBUG(Logger::instance(), "Command exited with code {}", rc);
    }
    return result;
}

/**
 * @brief Wrap a string in single quotes so the shell passes it through verbatim.
 */
inline std::string
shellQuote(const std::string& raw)
{
    std::string quoted = "'";
    for (char c : raw)
    {
        if (c == '\'')
        {
            quoted += "'\\''";
        }
        else
        {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

inline std::string
trimCopy(const std::string& s)
{
    return boost::algorithm::trim_copy(s);
}

/**
 * @brief Whether an identifier has the shape of an OpenFlow datapath id.
 *
 * All-decimal ids and "0x"-prefixed ids of at most 18 characters qualify.
 */
inline bool
isDpidLike(const std::string& id)
{
    if (id.empty())
    {
        return false;
    }
    if (boost::algorithm::all(id, boost::algorithm::is_digit()))
    {
        return true;
    }
    return boost::algorithm::starts_with(id, "0x") && id.size() <= 18;
}

/**
 * @brief Parse a datapath id.
 *
 * Accepts "0x1a2b", plain decimal "26", or Ryu's 16-digit zero-padded hex form
 * ("000000000000001a").
 *
 * @throws std::invalid_argument on parse failure.
 */
inline uint64_t
parseDpid(const std::string& dpidStr)
{
    const std::string s = trimCopy(dpidStr);
    if (s.empty())
    {
        throw std::invalid_argument("Empty datapath id");
    }

    std::string digits = s;
    bool hex = false;
    if (boost::algorithm::istarts_with(s, "0x"))
    {
        digits = s.substr(2);
        hex = true;
    }
    else if (s.size() == 16 && boost::algorithm::all(s, boost::algorithm::is_xdigit()))
    {
        hex = true;
    }

    if (digits.empty() ||
        !boost::algorithm::all(digits,
                               hex ? boost::algorithm::is_xdigit() : boost::algorithm::is_digit()))
    {
        throw std::invalid_argument("Invalid datapath id: " + dpidStr);
    }

    try
    {
        return std::stoull(digits, nullptr, hex ? 16 : 10);
    }
    catch (const std::out_of_range&)
    {
        throw std::invalid_argument("Datapath id out of range: " + dpidStr);
    }
}

/**
 * @brief Format a datapath id the way Ryu prints it (16 zero-padded hex digits).
 */
inline std::string
formatDpid(uint64_t dpid)
{
    char buffer[17];
    std::snprintf(buffer, sizeof(buffer), "%016llx", static_cast<unsigned long long>(dpid));
    return std::string(buffer);
}

/**
 * @brief Current time in milliseconds since epoch (system_clock).
 *
 * Suitable for wall-clock timestamps and logging.
 */
inline int64_t
getCurrentTimeMillisSystemClock()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

/**
 * @brief Format a wall-clock time point as ISO-8601 UTC with millisecond precision.
 *
 * Example: "2025-03-01T12:00:00.123Z". Uses gmtime_r, so it is safe across threads.
 */
inline std::string
toIsoUtc(SystemTimePoint tp)
{
    const auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    time_t seconds = static_cast<time_t>(ms / 1000);
    struct tm utcTime;
    gmtime_r(&seconds, &utcTime);

    char buffer[32];
    strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &utcTime);

    char out[40];
    std::snprintf(out, sizeof(out), "%s.%03dZ", buffer, static_cast<int>(ms % 1000));
    return std::string(out);
}

/**
 * @brief Seconds elapsed between two steady_clock points, as a double.
 */
inline double
secondsBetween(std::chrono::steady_clock::time_point from, std::chrono::steady_clock::time_point to)
{
    return std::chrono::duration<double>(to - from).count();
}
} // namespace utils
