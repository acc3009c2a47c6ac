//    --------------------------------------------------------------------
//
//    This file is part of Sepia.
//
//    SEPIA is free software: you can redistribute it and/or modify
//    it under the terms of the GNU General Public License as published by
//    the Free Software Foundation, either version 3 of the License, or
//    (at your option) any later version.
//
//    Sepia is distributed in the hope that it will be useful,
//    but WITHOUT ANY WARRANTY; without even the implied warranty of
//    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//    GNU General Public License for more details.
//
//    You should have received a copy of the GNU General Public License
//    along with Sepia. If not, see <http://www.gnu.org/licenses/>.
//
//    Please see LICENSE.txt for more details.
//
//    --------------------------------------------------------------------

// log utility initially based on: https://github.com/Manu343726/Cpp11CustomLogClass

#ifndef __SEPIA_LOGGER_H__
#define	__SEPIA_LOGGER_H__

#include <iostream>
#include <sstream>
#include <ctime>
#include <string>
#include <iomanip>
#include <fstream>
#include <mutex>

#include "defs/defs.h"

class logger_t
{

 private:

  const std::string _log_header;

  std::ostream & _out_stream;

  bool           save_log;

  std::ofstream  _log_file;

  std::stringstream ss;

  bool         is_off;

  // guards the streams, the cache and the flags above; concurrent
  // runs share the one global logger
  std::mutex   _mutex;

  // callers hold _mutex
  void close_log()
  {
    if ( save_log )
      {
	_log_file.close();
	save_log = false;
      }
  }

 public:

 logger_t( const std::string & log_header  ,
	  std::ostream& out_stream = std::cerr)
   : _log_header( log_header ) , _out_stream( out_stream )
  {
    is_off = false;
    save_log = false;
  }

  void write_log( const std::string & log_file )
  {

    std::lock_guard<std::mutex> lock( _mutex );

    // do not allow this in non-standard logging modes
    if ( is_off || globals::silent || globals::api_mode ) return;

    // close any existing stream?
    close_log();

    _log_file.open( log_file.c_str() );
    save_log = true;
  }

  void stop_writing_log()
  {
    std::lock_guard<std::mutex> lock( _mutex );
    close_log();
  }

  void flush()
  {
    std::lock_guard<std::mutex> lock( _mutex );
    _out_stream.flush();
  }

  void flush_cache()
  {
    std::lock_guard<std::mutex> lock( _mutex );
    ss.str(std::string());
  }

  void off()
  {
    std::lock_guard<std::mutex> lock( _mutex );
    _out_stream.flush();
    ss.str(std::string());
    close_log();
    is_off = true;
  }

  void on()
  {
    std::lock_guard<std::mutex> lock( _mutex );
    is_off = false;
  }

  void banner( const std::string & v , const std::string & bd )
  {

    std::lock_guard<std::mutex> lock( _mutex );

    if ( is_off || globals::silent ) return;

    time_t rawtime;
    time (&rawtime);
    struct tm * timeinfo = localtime (&rawtime);

    char BUFFER[50];
    strftime(BUFFER, sizeof(BUFFER), "%d-%b-%Y %H:%M:%S", timeinfo);

    _out_stream << "===================================================================" << "\n"
		<< _log_header
		<< " | " << v << ", " << bd << " | starting " << BUFFER  << " +++\n"
		<< "===================================================================" << std::endl;

    if ( save_log )
      _log_file << "===================================================================" << "\n"
		<< _log_header
		<< " | " << v << ", " << bd << " | starting " << BUFFER  << " +++\n"
		<< "===================================================================" << std::endl;

  }


  ~logger_t()
    {

      std::lock_guard<std::mutex> lock( _mutex );

      if ( is_off || globals::silent || globals::api_mode ) return;

      time_t rawtime;
      time (&rawtime);
      struct tm * timeinfo = localtime (&rawtime);

      char BUFFER[50];
      strftime(BUFFER, sizeof(BUFFER), "%d-%b-%Y %H:%M:%S", timeinfo);

      _out_stream << "-------------------------------------------------------------------"
		  << "\n"
		  << "+++ sepia | finishing "
		  << BUFFER
		  << "                      +++\n"
		  << "==================================================================="
		  << std::endl;

      if ( save_log )
	{
	  _log_file << "-------------------------------------------------------------------"
		    << "\n"
		    << "+++ sepia | finishing "
		    << BUFFER
		    << "                      +++\n"
		    << "==================================================================="
		    << std::endl;

	  close_log();
	}

    }


  void warning( const std::string & msg )
  {
    std::unique_lock<std::mutex> lock( _mutex );

    if ( is_off ) return ;

    if ( globals::logger_function )
      {
	// the callback may itself log
	lock.unlock();
	(*globals::logger_function)( " ** warning: " + msg + " **" );
      }
    else if ( globals::cache_log )
      ss << " ** warning: " << msg << " ** " << std::endl;
    else if ( ! globals::silent )
      {
	_out_stream << " ** warning: " << msg << " ** " << std::endl;
	if ( save_log )
	  _log_file << " ** warning: " << msg << " ** " << std::endl;
      }
  }


  template<typename T>
    logger_t& operator<< (const T& data)
    {
      std::unique_lock<std::mutex> lock( _mutex );

      if ( is_off ) return *this;

      if ( ! globals::silent )
	{
	  _out_stream << data;
	  if ( save_log )
	    _log_file << data;
	}

      if ( globals::cache_log )
	ss << data;

      if ( globals::logger_function )
	{
	  lock.unlock();
	  std::stringstream ss1;
	  ss1 << data;
	  (*globals::logger_function)( ss1.str() );
	}

      return *this;

    }


  std::string print_buffer()
    {
      std::lock_guard<std::mutex> lock( _mutex );
      std::string retval = ss.str();
      ss.str(std::string());
      return retval;
    }


};


#endif
