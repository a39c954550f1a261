#ifndef _SEISCONV_HEADER_H_
#define _SEISCONV_HEADER_H_
#include <string>
#include <vector>
#include "seisconv/seismic/Ensemble.h"
#include "seisconv/seismic/TimeSeries.h"
#include "seisconv/utility/SeisconvError.h"
namespace seisconv::seismic{
/*! \brief Base for errors that apply to a subset of the members of an ensemble.

Checks of an ensemble are exhaustive.  The thrown error carries the
(0 based) position of every offending member so a caller sees all the
problems at once.
*/
class RecordBatchError : public seisconv::utility::SeisconvError
{
public:
  RecordBatchError(const std::string kind, const std::vector<size_t>& badrecs,
      const std::string detail);
  /*! Return the positions of the offending ensemble members. */
  std::vector<size_t> indices() const {return bad;};
protected:
  std::vector<size_t> bad;
};
/*! Thrown when an ensemble fails structure or header consistency checks. */
class StructuralValidationError : public RecordBatchError
{
public:
  StructuralValidationError(const std::vector<size_t>& badrecs,
      const std::string detail)
    : RecordBatchError("StructuralValidationError",badrecs,detail){};
};

/*! \brief Verify ensemble members have the structure a procedure needs.

Every live member must have a positive, finite sample interval and every
key in required defined in its header.  The special key "dep" requires
the dependent data (sample vector) to exist with a size equal to npts.
Dead members are not checked.  Does nothing if the process wide
structure check switch is off (see state.h).

\param d is the ensemble to check.
\param required is the list of required header keys.
\exception StructuralValidationError listing every failing member.
*/
void check_structure(const TimeSeriesEnsemble& d,
    const std::vector<std::string>& required);
/*! \brief Verify header consistency of all live members.

Checks that b is finite, the header copies of delta, b and npts agree with
the object, iftype and leven are defined with the right types, e agrees
with b+(npts-1)*delta for evenly sampled records, and depmin does not
exceed depmax.  Read only.  Does nothing if the header check switch is off.

\exception StructuralValidationError listing every failing member.
*/
void check_header(const TimeSeriesEnsemble& d);

/*! \brief Fetch a real valued header field from every member.

\exception MetadataGetError if any member lacks the field.
*/
std::vector<double> get_header(const TimeSeriesEnsemble& d,
    const std::string key);
/*! Fetch several real valued fields.  The result has one vector per key
in the order of keys. */
std::vector<std::vector<double>> get_header(const TimeSeriesEnsemble& d,
    const std::vector<std::string>& keys);
/*! Generic form for a field of any type T stored in the header. */
template <typename T> std::vector<T> get_header(const TimeSeriesEnsemble& d,
    const std::string key)
{
  std::vector<T> result;
  result.reserve(d.member.size());
  for(size_t i=0;i<d.member.size();++i)
    result.push_back(d.member[i].get<T>(key));
  return result;
}
/*! Fetch an enumerated (string valued) field like iftype from every member. */
std::vector<std::string> get_enum_id(const TimeSeriesEnsemble& d,
    const std::string key);
/*! Fetch a logical field like leven from every member. */
std::vector<bool> get_logical(const TimeSeriesEnsemble& d,
    const std::string key);
}  // End seisconv::seismic namespace
#endif
