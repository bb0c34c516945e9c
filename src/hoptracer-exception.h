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

#ifndef HOPTRACER_EXCEPTION_H
#define HOPTRACER_EXCEPTION_H

#include <stdexcept>
#include <string>


// Base class for all HopTracer problems
class HopTracerException : public std::runtime_error
{
   public:
   HopTracerException(const std::string& error) : std::runtime_error(error) { }
};


// Outgoing probe cannot be serialised => fatal for the run
class PacketEncodeException : public HopTracerException
{
   public:
   PacketEncodeException(const std::string& error) : HopTracerException(error) { }
};


// Incoming data is not even an ICMP header => discard it
class PacketDecodeException : public HopTracerException
{
   public:
   PacketDecodeException(const std::string& error) : HopTracerException(error) { }
};

#endif
