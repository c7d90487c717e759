
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


#ifndef __OPHYS_H__
#define __OPHYS_H__

#include <iostream>
#include <string>
#include <vector>
#include <map>
#include <set>

#include "defs/defs.h"
#include "param.h"

#include "helper/helper.h"
#include "helper/logger.h"

#include "miscmath/miscmath.h"
#include "stats/statistics.h"
#include "stats/eigen_ops.h"

#include "db/sqlwrap.h"
#include "hstore/hstore.h"
#include "hstore/xstore.h"

#include "extraction/fov.h"
#include "extraction/cell.h"
#include "extraction/extraction.h"

#include "trials/align.h"
#include "trials/responsive.h"

#include "tuning/tuning.h"

#endif
