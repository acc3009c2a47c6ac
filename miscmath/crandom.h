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

#ifndef __SEPIA_CRANDOM_H__
#define __SEPIA_CRANDOM_H__

#include <vector>

// Minimal standard (Park-Miller) generator with a Bays-Durham shuffle;
// each instance carries its own state, so a seeded generator can be
// handed to whichever routine needs random draws

class CRandom
{
 public:

  static const int IA;
  static const int IM;
  static const int IQ;
  static const int IR;
  static const int NTAB;
  static const int NDIV;

  static const double EPS;
  static const double AM;
  static const double RNMX;

  // seeded from the clock
  CRandom();

  explicit CRandom( long unsigned iseed );

  void srand(long unsigned iseed = 0);

  // uniform on (0,1), end-points excluded
  double rand();

  // standard normal deviate
  double rnorm();

 private:

  // current seed
  int idum;

  int iy;

  std::vector<int> iv;

};

#endif
