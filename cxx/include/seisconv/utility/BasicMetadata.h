#ifndef _SEISCONV_BASICMETADATA_H_
#define _SEISCONV_BASICMETADATA_H_
#include <string>

namespace seisconv::utility{
/*! \brief Abstract base class for the generic header concept.

Records carry a generic header that allows storage and retrieval of
arbitrary attributes.   This base class forces support for
the standard basic data types.
*/
class BasicMetadata
{
public:
  virtual ~BasicMetadata(){};
  virtual int get_int(const std::string key) const =0;
  virtual double get_double(const std::string key)const =0;
  virtual bool get_bool(const std::string key) const =0;
  virtual std::string get_string(const std::string key)const =0;
  virtual void put(const std::string key, const double val)=0;
  virtual void put(const std::string key, const int val)=0;
  virtual void put(const std::string key, const bool val)=0;
  virtual void put(const std::string key, const std::string val)=0;
};
} // end seisconv::utility namespace
#endif
