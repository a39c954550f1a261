#include <iomanip>
#include <limits>
#include <boost/core/demangle.hpp>
#include "seisconv/utility/Metadata.h"
#include "seisconv/utility/SeisconvError.h"
namespace seisconv::utility
{
using namespace std;

Metadata::Metadata(const Metadata& parent)
  : md(parent.md),changed_or_set(parent.changed_or_set)
{
}
bool Metadata::is_defined(const string key) const noexcept
{
  map<string,boost::any>::const_iterator mptr;
  mptr=md.find(key);
  if(mptr!=md.end())
    return true;
  else
    return false;
}
Metadata& Metadata::operator=(const Metadata& parent)
{
  if(this!=(&parent))
  {
    md=parent.md;
    changed_or_set=parent.changed_or_set;
  }
  return *this;
}

Metadata& Metadata::operator+=(const Metadata& rhs) noexcept
{
  if(this!=(&rhs))
  {
    /* map replaces values of existing keys.  Everything on the rhs is
    marked changed. */
    map<string,boost::any>::const_iterator rhsptr;
    for(rhsptr=rhs.md.begin();rhsptr!=rhs.md.end();++rhsptr)
    {
      md[rhsptr->first]=rhsptr->second;
      changed_or_set.insert(rhsptr->first);
    }
  }
  return *this;
}
set<string> Metadata::keys() const noexcept
{
  set<string> result;
  map<string,boost::any>::const_iterator mptr;
  for(mptr=md.begin();mptr!=md.end();++mptr)
    result.insert(mptr->first);
  return result;
}
void Metadata::erase(const std::string key)
{
  map<string,boost::any>::iterator iptr;
  iptr=md.find(key);
  if(iptr!=md.end())
    md.erase(iptr);
  set<std::string>::iterator sptr;
  sptr=changed_or_set.find(key);
  if(sptr!=changed_or_set.end())
	  changed_or_set.erase(sptr);
}
std::size_t Metadata::size() const noexcept
{
  return md.size();
}
std::map<string,boost::any>::const_iterator  Metadata::begin() const noexcept
{
  return md.begin();
}
std::map<string,boost::any>::const_iterator  Metadata::end() const noexcept
{
  return md.end();
}
void Metadata::change_key(const string oldkey, const string newkey)
{
  map<string,boost::any>::iterator mdptr;
  mdptr=md.find(oldkey);
  if(mdptr!=md.end())
  {
    md.insert_or_assign(newkey, mdptr->second);
    md.erase(mdptr);
    changed_or_set.erase(oldkey);
    changed_or_set.insert(newkey);
  }
}

string demangled_name(const boost::any a)
{
    const std::type_info &ti = a.type();
    return string(boost::core::demangle(ti.name()));
}
std::string Metadata::type(const string key) const
{
    boost::any a=this->get_any(key);
    return demangled_name(a);
}
/* The demangled name of std::string is not pretty and not standardized.
We test for the basic_string keyword embedded in the long name.  */
namespace {
string simple_type_name(const boost::any& a)
{
  string pretty_name=demangled_name(a);
  if(pretty_name.find("basic_string")!=std::string::npos)
    return string("string");
  return pretty_name;
}
}
ostream& operator<<(ostream& os, const Metadata& m)
{
  map<string,boost::any>::const_iterator mdptr;
  for(mdptr=m.md.begin();mdptr!=m.md.end();++mdptr)
  {
    const boost::any& a=mdptr->second;
    string sname=simple_type_name(a);
    os<<mdptr->first<<" "<<sname<<" ";
    try{
      if(sname=="int")
        os<<boost::any_cast<int>(a)<<endl;
      else if(sname=="long")
        os<<boost::any_cast<long>(a)<<endl;
      else if(sname=="double")
        os<<setprecision(numeric_limits<double>::max_digits10)
          <<boost::any_cast<double>(a)<<endl;
      else if(sname=="float")
        os<<boost::any_cast<float>(a)<<endl;
      else if(sname=="bool")
        os<<boost::any_cast<bool>(a)<<endl;
      else if(sname=="string")
        os<<boost::any_cast<string>(a)<<endl;
      else
        os <<"NONPRINTABLE"<<endl;
    }catch(boost::bad_any_cast &e)
    {
      os<<"BAD_ANY_CAST_ERROR"<<endl;
    }
  }
  return os;
}
string serialize_metadata(const Metadata &md)
{
  ostringstream ss;
  for(auto mdptr=md.begin();mdptr!=md.end();++mdptr)
  {
    string sname=simple_type_name(mdptr->second);
    if( (sname=="int") || (sname=="long") || (sname=="double")
        || (sname=="float") || (sname=="bool") || (sname=="string") )
    {
      Metadata one;
      one.put(mdptr->first,mdptr->second);
      ss << one;
    }
    else
    {
      cerr << "serialize_metadata (WARNING):  key="<<mdptr->first
        << " has type "<<sname<<" which cannot be serialized - skipped"<<endl;
    }
  }
  return ss.str();
}
Metadata restore_serialized_metadata(const string sd)
{
  Metadata result;
  istringstream ss(sd);
  string line;
  while(getline(ss,line))
  {
    if(line.size()==0) continue;
    istringstream ls(line);
    string key,typ;
    ls >> key;
    ls >> typ;
    /* Strings can have embedded white space so take the remainder of
    the line after the single separator blank */
    string val;
    getline(ls,val);
    if(val.size()>0 && val[0]==' ') val.erase(0,1);
    if(typ=="int")
      result.put<int>(key,stoi(val));
    else if(typ=="long")
      result.put<long>(key,stol(val));
    else if(typ=="double")
      result.put<double>(key,stod(val));
    else if(typ=="float")
      result.put<float>(key,stof(val));
    else if(typ=="bool")
      result.put<bool>(key,(val=="1"));
    else if(typ=="string")
      result.put<string>(key,val);
    else
      throw SeisconvError("restore_serialized_metadata:  illegal type="
        + typ + " for key=" + key,ErrorSeverity::Invalid);
  }
  result.clear_modified();
  return result;
}
} // End seisconv::utility Namespace block
