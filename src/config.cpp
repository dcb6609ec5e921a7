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


#include "multimethod/config.hpp"

#include <cstdlib>
#include <string_view>


void
mm::configure_from_environment()
{
  if (const char *level = std::getenv("MULTIMETHOD_LOGLEVEL"))
  {
    loglevel = parse_loglevel(level);
    debug("loglevel set to {}", loglevel_name(loglevel));
  }

  if (const char *flags = std::getenv("MULTIMETHOD_FLAGS"))
  {
    std::string_view rest {flags};
    while (not rest.empty())
    {
      const size_t comma = rest.find(',');
      std::string_view flag = rest.substr(0, comma);
      while (not flag.empty() and flag.front() == ' ')
        flag.remove_prefix(1);
      while (not flag.empty() and flag.back() == ' ')
        flag.remove_suffix(1);
      if (not flag.empty())
      {
        global_flags.emplace(flag);
        debug("enabled flag {}", flag);
      }
      rest = comma == std::string_view::npos ? "" : rest.substr(comma + 1);
    }
  }
}
