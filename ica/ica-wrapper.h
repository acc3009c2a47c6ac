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

#ifndef __SEPIA_ICA_WRAPPER_H__
#define __SEPIA_ICA_WRAPPER_H__

#include <string>

struct param_t;

namespace ica {

  // text-file driven ICA: reads 'data' (samples x channels), runs FastICA
  // and writes W, A, S, K and any cleaned data, as requested in 'param'
  void wrapper( param_t & param );

}

#endif
