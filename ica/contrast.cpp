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

#include "ica/ica.h"

#include "helper/helper.h"

#include <cmath>

//
// Approximations to negentropy
//
//   pow3   g = u^3                   g' = 3u^2
//   tanh   g = tanh(au)              g' = a(1 - tanh^2(au))
//   gauss  g = u exp(-u^2/2)         g' = (1-u^2) exp(-u^2/2)
//
// Any unknown contrast is treated as tanh
//

ica_contrast_t ica::contrast_type( const std::string & s )
{
  if ( Helper::iequals( s , "pow3" ) || Helper::iequals( s , "cubic" ) ) return ICA_CUBIC;
  if ( Helper::iequals( s , "gauss" ) || Helper::iequals( s , "gaussian" ) ) return ICA_GAUSS;
  if ( Helper::iequals( s , "tanh" ) || Helper::iequals( s , "logcosh" ) ) return ICA_TANH;
  // default
  return ICA_TANH;
}

std::string ica::contrast_label( ica_contrast_t t )
{
  switch ( t )
    {
    case ICA_CUBIC : return "pow3";
    case ICA_GAUSS : return "gauss";
    case ICA_TANH  : return "tanh";
    default        : return "tanh";
    }
}


ica_nonlinearity_t::ica_nonlinearity_t( ica_contrast_t t , double a )
  : alpha( a )
{
  switch ( t )
    {
    case ICA_CUBIC :
    case ICA_GAUSS :
    case ICA_TANH :
      type = t;
      break;
    default :
      type = ICA_TANH;
    }
}


Eigen::ArrayXXd ica_nonlinearity_t::g( const Eigen::ArrayXXd & u ) const
{
  switch ( type )
    {
    case ICA_CUBIC :
      return u.cube();
    case ICA_GAUSS :
      return u * ( -0.5 * u.square() ).exp();
    case ICA_TANH :
    default :
      return ( alpha * u ).tanh();
    }
}


Eigen::ArrayXXd ica_nonlinearity_t::dg( const Eigen::ArrayXXd & u ) const
{
  switch ( type )
    {
    case ICA_CUBIC :
      return 3.0 * u.square();
    case ICA_GAUSS :
      {
	Eigen::ArrayXXd u2 = u.square();
	return ( 1.0 - u2 ) * ( -0.5 * u2 ).exp();
      }
    case ICA_TANH :
    default :
      return alpha * ( 1.0 - ( alpha * u ).tanh().square() );
    }
}


double ica_nonlinearity_t::g( const double u ) const
{
  switch ( type )
    {
    case ICA_CUBIC :
      return u * u * u;
    case ICA_GAUSS :
      return u * exp( -0.5 * u * u );
    case ICA_TANH :
    default :
      return tanh( alpha * u );
    }
}


double ica_nonlinearity_t::dg( const double u ) const
{
  switch ( type )
    {
    case ICA_CUBIC :
      return 3.0 * u * u;
    case ICA_GAUSS :
      return ( 1.0 - u * u ) * exp( -0.5 * u * u );
    case ICA_TANH :
    default :
      {
	const double t = tanh( alpha * u );
	return alpha * ( 1.0 - t * t );
      }
    }
}
