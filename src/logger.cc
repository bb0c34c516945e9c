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

#include "logger.h"

#include <functional>
#include <iostream>
#include <string>

#include <boost/shared_ptr.hpp>
#include <boost/make_shared.hpp>
#include <boost/core/null_deleter.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/attributes/clock.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/formatting_ostream.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>


BOOST_LOG_GLOBAL_LOGGER_INIT(HopTracerLogger, boost::log::sources::severity_logger_mt) {
   boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level> logger;

   // Each log line gets a UTC timestamp
   logger.add_attribute("TimeStamp", boost::log::attributes::utc_clock());
   return logger;
}


// ANSI colors, indexed by severity level (trace ... fatal)
static const char* const SeverityColor[] = {
   "\x1b[37m",        // trace
   "\x1b[36m",        // debug
   "\x1b[34m",        // info
   "\x1b[33m",        // warning
   "\x1b[31;1m",      // error
   "\x1b[37;41;1m"    // fatal
};


// ###### Format one log record #############################################
// Output: [<UTC time>][<severity>]: <message>
static void formatRecord(const boost::log::record_view&  record,
                         boost::log::formatting_ostream& os,
                         const bool                      logColor)
{
   const boost::log::value_ref<boost::log::trivial::severity_level> severity =
      boost::log::extract<boost::log::trivial::severity_level>("Severity", record);
   const boost::log::value_ref<boost::posix_time::ptime> timeStamp =
      boost::log::extract<boost::posix_time::ptime>("TimeStamp", record);

   if( (logColor) && (severity) && ((unsigned int)severity.get() <= boost::log::trivial::fatal) ) {
      os << SeverityColor[severity.get()];
   }
   os << "[";
   if(timeStamp) {
      os << boost::posix_time::to_iso_extended_string(timeStamp.get());
   }
   os << "][" << severity << "]: "
      << record[boost::log::expressions::smessage];
   if(logColor) {
      os << "\x1b[0m";
   }
}


// ###### Initialise logger #################################################
void initialiseLogger(const unsigned int logLevel,
                      const bool         logColor,
                      const char*        logFile)
{
   boost::shared_ptr<boost::log::core> core = boost::log::core::get();
   const boost::log::formatter formatter =
      std::bind(&formatRecord, std::placeholders::_1, std::placeholders::_2, logColor);

   // ====== Log file output ================================================
   if(logFile != nullptr) {
      boost::shared_ptr<boost::log::sinks::text_file_backend> backend =
         boost::make_shared<boost::log::sinks::text_file_backend>(
            boost::log::keywords::file_name  = logFile,
            boost::log::keywords::open_mode  = std::ios_base::out | std::ios_base::app,
            boost::log::keywords::auto_flush = true
         );
      boost::shared_ptr<boost::log::sinks::synchronous_sink<boost::log::sinks::text_file_backend>> fileSink(new boost::log::sinks::synchronous_sink<boost::log::sinks::text_file_backend>(backend));

      fileSink->set_formatter(formatter);
      fileSink->set_filter(boost::log::trivial::severity >= logLevel);
      core->add_sink(fileSink);
   }

   // ====== Console output =================================================
   // Standard output carries the hop list, log lines go to standard error.
   else {
      boost::shared_ptr<boost::log::sinks::synchronous_sink<boost::log::sinks::text_ostream_backend>>
         consoleSink(new boost::log::sinks::synchronous_sink<boost::log::sinks::text_ostream_backend>());
      consoleSink->locked_backend()->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
      consoleSink->locked_backend()->auto_flush(true);
      consoleSink->set_formatter(formatter);
      consoleSink->set_filter(boost::log::trivial::severity >= logLevel);
      core->add_sink(consoleSink);
   }

   HT_LOG(trace) << "Initialised logger: level " << logLevel
                 << ((logFile != nullptr) ? (std::string(", file ") + logFile) : std::string());
}
