#ifndef _SEISCONV_SOURCETIMEFUNCTION_H_
#define _SEISCONV_SOURCETIMEFUNCTION_H_
#include <string>
#include <vector>
#include <sstream>
#include "seisconv/utility/SeisconvError.h"
namespace seisconv::algorithms{
/*! Shapes of source time function supported by make_source_timefunction. */
enum class SourceFunctionType
{
  Gaussian,
  Triangle
};

/*! \brief Error thrown for an unrecognized source time function name.

The name that could not be matched is retained and can be fetched with
the type_name method.
*/
class UnsupportedKernelType : public seisconv::utility::SeisconvError
{
public:
  UnsupportedKernelType(const std::string name)
    : seisconv::utility::SeisconvError(
        std::string("UnsupportedKernelType:  unknown source time function type=")
        + name + "  Must be one of:  gaussian or triangle",
        seisconv::utility::ErrorSeverity::Invalid), badname(name){};
  std::string type_name() const {return badname;};
private:
  std::string badname;
};

/*! \brief Convert a source time function name to the enum.

Matching is case insensitive.

\exception UnsupportedKernelType if the name is not recognized.
*/
SourceFunctionType string2stftype(const std::string name);
/*! Inverse of string2stftype.  Returns the lower case name.*/
std::string stftype2string(const SourceFunctionType stype);

/*! \brief Sampled source time function.

A source time function is a short, centered, unit area pulse that is
convolved with a record to mimic a finite duration source.  x holds the
samples and t the time of each sample relative to the center of the pulse.
The first sample is at t[0]=-m*delta for a kernel of 2m+1 samples.
*/
class SourceTimeFunction
{
public:
  /*! Sample values.  Normalized so sum(x)*delta is 1. */
  std::vector<double> x;
  /*! Time of each sample.  Same length as x. */
  std::vector<double> t;
  double delta;
  double halfwidth;
  SourceFunctionType type;
  /*! Default creates an empty kernel. */
  SourceTimeFunction() : delta(1.0),halfwidth(0.0),
      type(SourceFunctionType::Gaussian){};
  SourceTimeFunction(const SourceTimeFunction& parent)
    : x(parent.x),t(parent.t),delta(parent.delta),
      halfwidth(parent.halfwidth),type(parent.type){};
  SourceTimeFunction& operator=(const SourceTimeFunction& parent);
  size_t npts() const {return x.size();};
  bool empty() const {return x.empty();};
  /*! Return the integral of the kernel (sum(x)*delta). */
  double area() const;
};

/*! \brief Broadcast a per record argument to a fixed length.

Procedures that act on an ensemble take per record arguments either as a
single value applied to all members or as one value per member.  This
function returns a vector of length n in either case.

\param arg is the argument to expand.
\param n is the number of ensemble members.
\param name is the argument name used in the error message.

\exception InvalidArgument if arg has a length other than 1 or n.
*/
template <typename T> std::vector<T> expand_to_members(const std::vector<T>& arg,
    const size_t n, const std::string name)
{
  if(arg.size()==n) return arg;
  if(arg.size()==1) return std::vector<T>(n,arg[0]);
  std::stringstream ss;
  ss << "expand_to_members:  argument "<<name<<" has "<<arg.size()
    << " elements.  Must have 1 or "<<n<<" (one per record)";
  throw seisconv::utility::InvalidArgument(ss.str());
}

/*! \brief Build a single source time function.

\param delta is the sample interval (must be positive).
\param halfwidth is the half duration of the pulse in seconds (must be
  finite and nonnegative).  A zero halfwidth produces a one sample impulse.
\param type is the name of the pulse shape (gaussian or triangle, any case).

\exception InvalidArgument for an illegal delta or halfwidth.
\exception UnsupportedKernelType if type is not recognized.
*/
SourceTimeFunction make_source_timefunction(const double delta,
    const double halfwidth, const std::string type);
/*! \brief Build one source time function per record.

halfwidth and type are broadcast to the length of delta with
expand_to_members.  All arguments, including every type name, are
verified before any kernel is computed.

\param delta is the sample interval of each record.
\param halfwidth is a single value or one per record.
\param type is a single name or one per record.

\exception InvalidArgument for an illegal value or argument length.
\exception UnsupportedKernelType naming the first unrecognized type.
*/
std::vector<SourceTimeFunction> make_source_timefunction(
    const std::vector<double>& delta,
    const std::vector<double>& halfwidth,
    const std::vector<std::string>& type);
}  // End seisconv::algorithms namespace
#endif
