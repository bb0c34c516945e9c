// ==========================================================================
//                 _   _             _____
//                | | | | ___  _ __ |_   _| __ __ _  ___ ___ _ __
//                | |_| |/ _ \| '_ \  | || '__/ _` |/ __/ _ \ '__|
//                |  _  | (_) | |_) | | || | | (_| | (_|  __/ |
//                |_| |_|\___/| .__/  |_||_|  \__,_|\___\___|_|
//                            |_|
//              ---  ICMP Hop Tracer (HopTracer)  ---
// ==========================================================================
//
// HopTracer - ICMP Hop Tracer
// Copyright (C) 2015-2025 by Thomas Dreibholz
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.
//
// Contact: dreibh@simula.no

#include "assure.h"
#include "logger.h"

#include <stdio.h>
#include <stdlib.h>

#include <boost/log/core.hpp>


// ###### Report violated invariant and terminate ###########################
void assureFailed(const char*        expression,
                  const char*        file,
                  const unsigned int line,
                  const char*        function)
{
   HT_LOG(fatal) << file << ":" << line << ": " << function
                 << ": Invariant \"" << expression << "\" violated!";
   boost::log::core::get()->flush();

   // The log may not be visible (e.g. written to a file)
   fprintf(stderr, "%s:%u: %s: Invariant \"%s\" violated!\n",
           file, line, function, expression);
   fflush(stderr);
   abort();
}
