
//    --------------------------------------------------------------------
//
//    This file is part of ophys.
//
//    ophys is free software: you can redistribute it and/or modify
//    it under the terms of the GNU General Public License as published by
//    the Free Software Foundation, either version 3 of the License, or
//    (at your option) any later version.
//
//    ophys is distributed in the hope that it will be useful,
//    but WITHOUT ANY WARRANTY; without even the implied warranty of
//    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//    GNU General Public License for more details.
//
//    You should have received a copy of the GNU General Public License
//    along with ophys. If not, see <http://www.gnu.org/licenses/>.
//
//    Please see LICENSE.txt for more details.
//
//    --------------------------------------------------------------------


#ifndef __OPHYS_MAIN_H__
#define __OPHYS_MAIN_H__

#include <string>
#include <new>

struct param_t;

// misc helper: manage memory resource issues
void NoMem();

// misc helper: build global params from cmdline
void build_param( param_t * , int argc , char** argv , int );

// misc helper: return ophys version
std::string ophys_version();

// commands
void proc_extract( const std::string & traces , const std::string & timing , const std::string & out , const param_t & param );

void proc_summary( const std::string & db );

void proc_tuning( const std::string & db , const param_t & param );

#endif
