/*
 * Multimethod - Pattern-driven multiple dispatch for dynamic values
 * Copyright (C) 2025  Ivan Pidhurskyi
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */


#pragma once

#include "multimethod/format.hpp" // IWYU pragma: export

#include <cstddef>
#include <format>
#include <iostream>
#include <regex>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>


namespace mm {

/**
 * Named switches that alter library defaults
 *
 * \see configure_from_environment()
 */
extern
std::set<std::string> global_flags;


enum class loglevel: int {
  silent,
  error,
  warning,
  info,
  debug,
};

inline std::string_view
loglevel_name(loglevel lvl)
{
  switch (lvl)
  {
    case loglevel::silent: return "silent";
    case loglevel::error: return "error";
    case loglevel::warning: return "warning";
    case loglevel::info: return "info";
    case loglevel::debug: return "debug";
  }
  std::terminate();
}

inline loglevel
parse_loglevel(std::string_view name)
{
  if (name == "silent")
    return loglevel::silent;
  if (name == "error")
    return loglevel::error;
  if (name == "warning")
    return loglevel::warning;
  if (name == "info")
    return loglevel::info;
  if (name == "debug")
    return loglevel::debug;
  throw std::runtime_error {std::format("Invalid loglevel name ({})", name)};
}


inline bool
operator >= (loglevel a, loglevel b)
{ return static_cast<int>(a) >= static_cast<int>(b); }


extern thread_local size_t logging_indent;

extern loglevel loglevel;


struct add_indent {
  add_indent(size_t indent): m_indent {indent} { }

  inline friend std::ostream&
  operator << (std::ostream &os, const add_indent &self) noexcept
  {
    for (size_t i = 1; i < self.m_indent; ++i)
      os << "\e[2m¦\e[0m ";
    if (self.m_indent > 0)
      os << "| ";
    return os;
  }

  private:
  size_t m_indent;
};


/**
 * Strip ANSI escape sequences from a string
 *
 * \param input The input string containing escape sequences
 * \return The string with escape sequences removed
 */
inline std::string
strip_escape_sequences(const std::string &input)
{
  static const std::regex escape_seq_regex("\\\e\\[[^m]*m");
  return std::regex_replace(input, escape_seq_regex, "");
}


namespace detail {
/**
 * Write a log record: the label and the first line of the message, then the
 * remaining lines indented under it
 */
inline void
log_record(std::string_view label, const std::string &message,
           size_t max_length = 150)
{
  std::istringstream input {message};
  std::ostringstream output;
  std::string line;
  bool first = true;
  while (std::getline(input, line))
  {
#ifndef MULTIMETHOD_RELEASE_BUILD
    const std::string strippedline = strip_escape_sequences(line);
    if (strippedline.length() > max_length)
      line = strippedline.substr(0, max_length - 1) + "…";
#endif
    if (first)
      output << "multimethod " << label << ' ' << add_indent(logging_indent)
             << line << "\n";
    else
      output << add_indent(logging_indent + 1) << line << "\n";
    first = false;
  }
  std::cerr << output.str();
}
} // namespace mm::detail


template <typename... Args> void
debug([[maybe_unused]] std::format_string<Args...> fmt, [[maybe_unused]] Args &&...args)
{
#ifndef MULTIMETHOD_RELEASE_BUILD
  if (loglevel >= loglevel::debug)
    detail::log_record("\e[7;1mdebug\e[0m",
                       std::format(fmt, std::forward<Args>(args)...));
#endif
}


template <typename... Args> void
info(std::format_string<Args...> fmt, Args &&...args)
{
  if (loglevel >= loglevel::info)
    detail::log_record("info", std::format(fmt, std::forward<Args>(args)...));
}


template <typename... Args> void
warning(std::format_string<Args...> fmt, Args &&...args)
{
  if (loglevel >= loglevel::warning)
    detail::log_record("\e[38;5;3;1mwarning\e[0m",
                       std::format(fmt, std::forward<Args>(args)...));
}


template <typename... Args> void
error(std::format_string<Args...> fmt, Args &&...args)
{
  if (loglevel >= loglevel::error)
    detail::log_record("\e[38;5;1;1merror\e[0m",
                       std::format(fmt, std::forward<Args>(args)...));
}


struct indent {
  indent(std::ptrdiff_t inc = 1)
  : m_inc {inc}
  { logging_indent += m_inc; }

  ~indent()
  { logging_indent -= m_inc; }

  indent(const indent&) = delete;
  void operator = (const indent&) = delete;

  private:
  std::ptrdiff_t m_inc;
}; // struct mm::indent

} // namespace mm
