
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


#include "extraction/fov.h"
#include "helper/helper.h"

bool fov_t::empty() const
{
  return animal_name == "" && recording_date == "" && stim_type == ""
    && brain_region == "" && layer == "" && factor == 1
    && imaging_files.size() == 0 && spk2_files.size() == 0;
}

std::vector<std::pair<std::string,hstore_attr_t> > fov_t::export_attributes() const
{
  std::vector<std::pair<std::string,hstore_attr_t> > a;

  if ( animal_name != "" )    a.push_back( std::make_pair( "animal_name" , hstore_attr_t( animal_name ) ) );
  if ( recording_date != "" ) a.push_back( std::make_pair( "recording_date" , hstore_attr_t( recording_date ) ) );
  if ( stim_type != "" )      a.push_back( std::make_pair( "stim_type" , hstore_attr_t( stim_type ) ) );
  if ( brain_region != "" )   a.push_back( std::make_pair( "brain_region" , hstore_attr_t( brain_region ) ) );
  if ( layer != "" )          a.push_back( std::make_pair( "layer" , hstore_attr_t( layer ) ) );

  a.push_back( std::make_pair( "factor" , hstore_attr_t( factor ) ) );

  // non-scalar values are stringified
  if ( imaging_files.size() ) a.push_back( std::make_pair( "imaging_files" , hstore_attr_t( Helper::stringize( imaging_files ) ) ) );
  if ( spk2_files.size() )    a.push_back( std::make_pair( "spk2_files" , hstore_attr_t( Helper::stringize( spk2_files ) ) ) );
  
  return a;
}

static std::vector<int> int_list( const hstore_attr_t & a , const std::string & key )
{
  std::vector<int> r;
  if ( a.type == ATTR_INT )
    {
      r.push_back( a.int_value );
      return r;
    }
  std::vector<std::string> tok = Helper::parse( a.as_string() , "," );
  for (int i=0; i<tok.size(); i++)
    {
      int x = 0;
      if ( ! Helper::str2int( Helper::lrtrim( tok[i] ) , &x ) )
	Helper::halt( "bad value in fov_metadata " + key + ": " + tok[i] );
      r.push_back( x );
    }
  return r;
}

void fov_t::import_attributes( const std::map<std::string,hstore_attr_t> & attr )
{
  std::map<std::string,hstore_attr_t>::const_iterator aa = attr.begin();
  while ( aa != attr.end() )
    {
      const std::string & k = aa->first;
      if ( k == "animal_name" ) animal_name = aa->second.as_string();
      else if ( k == "recording_date" ) recording_date = aa->second.as_string();
      else if ( k == "stim_type" ) stim_type = aa->second.as_string();
      else if ( k == "brain_region" ) brain_region = aa->second.as_string();
      else if ( k == "layer" ) layer = aa->second.as_string();
      else if ( k == "factor" ) factor = aa->second.as_double();
      else if ( k == "imaging_files" ) imaging_files = int_list( aa->second , k );
      else if ( k == "spk2_files" ) spk2_files = int_list( aa->second , k );
      ++aa;
    }
}

std::string fov_t::label() const
{
  std::string s = animal_name == "" ? "." : animal_name;
  if ( recording_date != "" ) s += " " + recording_date;
  if ( stim_type != "" ) s += " " + stim_type;
  if ( brain_region != "" ) s += " " + brain_region;
  if ( layer != "" ) s += " " + layer;
  return s;
}
