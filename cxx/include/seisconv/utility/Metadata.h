#ifndef _SEISCONV_METADATA_H_
#define _SEISCONV_METADATA_H_
#include <typeinfo>
#include <map>
#include <set>
#include <iostream>
#include <sstream>
#include <boost/any.hpp>
#include <boost/core/demangle.hpp>
#include "seisconv/utility/SeisconvError.h"
#include "seisconv/utility/BasicMetadata.h"

namespace seisconv::utility{
/*! \brief Error thrown when get operators fail.
 *
 * Builds a more informative message than a bare bad_any_cast when
 * a header lookup fails.  */
class MetadataGetError : public SeisconvError
{
public:
  MetadataGetError():SeisconvError(){};
  /*! Constructor called when a key is not found.
   * \param Texpected is the type name (return of typeid name method) trying to extract. */
  MetadataGetError(const std::string key,const char *Texpected)
  {
    std::stringstream ss;
    std::string pretty_name(boost::core::demangle(Texpected));
    ss<<"Error trying to extract Metadata with key="<<key<<std::endl
      << "No value associated with this key is set in Metadata object"<<std::endl
      << "Expected an entry of type="<<pretty_name<<std::endl;
    badness=ErrorSeverity::Suspect;
    set_message(ss.str());
  };
  /*! \brief Constructor called when type requested does not match contents. */
  MetadataGetError(const char *boostmessage,const std::string key,
      const char *Texpected, const char *Tactual)
  {
    std::stringstream ss;
    ss << "Error in Metadata get method.   Type mismatch in attempt to get "
	    << "data with key="<<key<<std::endl
      << "boost::any bad_any_cast wrote this message:  "<<std::endl
      << boostmessage<<std::endl;
    std::string name_e(boost::core::demangle(Texpected));
    ss << "Trying to convert to data of type="<<name_e<<std::endl;
    std::string name_a(boost::core::demangle(Tactual));
    ss << "Actual entry has type="<<name_a<<std::endl;
    badness=ErrorSeverity::Suspect;
    set_message(ss.str());
  };
};

/*! \brief Generic header of a record or an ensemble.

Attributes are stored in a map keyed by name with values held in a
boost::any.  Typed getters fail with MetadataGetError if the key is absent
or the stored type does not match.  */
class Metadata : public BasicMetadata
{
public:
  Metadata(){};
  Metadata(const Metadata& mdold);
  virtual ~Metadata(){};
  Metadata& operator=(const Metadata& mdold);
  /*! Append additional metadata with replacement.

Each attribute on the right is inserted or replaces the same key on the
left.  Attributes only present on the left are left alone.

\param rhs is the new metadata to be insert/replace on the lhs.
*/
  Metadata& operator+=(const Metadata& rhs) noexcept;
  /*!
  Get a real number.  A float entry is promoted.

  \exception MetadataGetError if requested parameter is not found or there is a type mismatch.
  **/
  double get_double(const std::string key) const override{
    try{
      return get<double>(key);
    }catch(MetadataGetError& merr)
    {
      try{
        float fval;
        fval=get<float>(key);
        return fval;
      }catch(MetadataGetError&)
      {
	throw merr;
      }
    }
  };
  /*!
  Get an integer.  A long entry is narrowed.

  \exception MetadataGetError if requested parameter is not found or there is a type mismatch.
  **/
  int get_int(const std::string key) const override
  {
      try{
        return get<int>(key);
      }
      catch(MetadataGetError& merr)
      {
	try{
          long lval;
  	  lval=get<long>(key);
  	  return static_cast<int>(lval);
	}catch(MetadataGetError&)
	{
	  throw merr;
	}
      }
  };
  /*!
  Get a long integer.  An int entry is promoted.

  \exception MetadataGetError if requested parameter is not found or there is a type mismatch.
  **/
  long get_long(const std::string key) const
  {
      try{
        return get<long>(key);
      }
      catch(MetadataGetError& merr)
      {
	try{
          int ival;
  	  ival=get<int>(key);
  	  return static_cast<long>(ival);
	}catch(MetadataGetError&)
	{
	  throw merr;
	}
      }
  };
  std::string get_string(const std::string key) const override{
    return get<std::string>(key);
  };
  bool get_bool(const std::string key) const override{
    return get<bool>(key);
  };
  /*! Generic get interface.

  \param key is the name tag of desired component.

  \exception - will throw a MetadataGetError for a missing key or
       a type mismatch.
  */
  template <typename T> T get(const std::string key) const;
  template <typename T> T get(const char *key) const
  {
    return get<T>(std::string(key));
  }
  /*! Get the boost::any container for key.

  \exception - MetadataGetError if requested parameter is not found.
  */
  boost::any get_any(const std::string key) const {
    std::map<std::string,boost::any>::const_iterator iptr;
    iptr=md.find(key);
    if(iptr==md.end())
    {
      throw MetadataGetError(key,typeid(boost::any).name());
    }
    return iptr->second;
  };
  /*! Return demangled type name of the value stored for key. */
  std::string type(const std::string key) const;
  template <typename T> void put(const std::string key, T val) noexcept
  {
    boost::any aval=val;
    md[key]=aval;
    changed_or_set.insert(key);
  }
  template <typename T> void put (const char *key, T val) noexcept
  {
    boost::any aval=val;
    md[std::string(key)]=aval;
    changed_or_set.insert(std::string(key));
  }
  void put(const std::string key, const double val) override
  {
      this->put<double>(key,val);
  };
  void put(const std::string key, const int val) override
  {
      this->put<int>(key,val);
  };
  void put(const std::string key, const bool val) override
  {
      this->put<bool>(key,val);
  };
  void put(const std::string key, const std::string val) override
  {
      this->put<std::string>(key,val);
  };
  void put_long(const std::string key,const long val)
  {
    this->put<long>(key,val);
  };
  /*! Return the keys of all altered Metadata values. */
  std::set<std::string> modified() const
  {
      return changed_or_set;
  };
  /*! \brief Mark all data as unmodified. */
  void clear_modified()
  {
	  changed_or_set.clear();
  };
  /*! Return all keys without any type information. */
  std::set<std::string> keys() const noexcept;
  /*! Test if a key has an associated value. */
  bool is_defined(const std::string key) const noexcept;
  /*! Clear data associated with a particular key. */
  void erase(const std::string key);
  std::size_t size() const noexcept;
  std::map<std::string,boost::any>::const_iterator  begin() const noexcept;
  std::map<std::string,boost::any>::const_iterator  end() const noexcept;
  /*! \brief Change the keyword to access an attribute.

  Silently does nothing if oldkey is not defined.  If newkey is already
  defined its content is replaced.
  */
  void change_key(const std::string oldkey, const std::string newkey);
  friend std::ostream& operator<<(std::ostream&, const Metadata&);
protected:
  std::map<std::string,boost::any> md;
  /* The keys of any entry changed will be contained here.   */
  std::set<std::string> changed_or_set;
};
template <typename T> T Metadata::get(const std::string key) const
{
  T result;
  std::map<std::string,boost::any>::const_iterator iptr;
  iptr=md.find(key);
  if(iptr==md.end())
  {
    throw MetadataGetError(key,typeid(T).name());
  }
  boost::any aval=iptr->second;
  try{
    result=boost::any_cast<T>(aval);
  }catch(boost::bad_any_cast& err)
  {
    const std::type_info &ti = aval.type();
    throw MetadataGetError(err.what(),key,typeid(T).name(),ti.name());
  };
  return result;
}
/*! Return a pretty name from a boost any object. */
std::string demangled_name(const boost::any val);

/*! Serialize the simple (double, long, int, bool, string) entries to a string.

One line per entry in the form  key type value.  Entries of any other
type are skipped with a message to stderr.
*/
std::string serialize_metadata(const Metadata &md);
/*! Inverse of serialize_metadata. */
Metadata restore_serialized_metadata(const std::string sd);
} // end seisconv::utility namespace
#endif
