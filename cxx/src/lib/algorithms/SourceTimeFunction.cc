#include <math.h>
#include <ctype.h>
#include <algorithm>
#include <limits>
#include <numeric>
#include <sstream>
#include "misc/blas.h"
#include "seisconv/algorithms/SourceTimeFunction.h"
namespace seisconv::algorithms
{
using namespace std;
using namespace seisconv::utility;

/* Relative slop used when computing the number of samples in the half
width.  Avoids dropping the end sample when halfwidth/delta is an exact
integer that is not exactly representable. */
const double HALFWIDTH_TOLERANCE(1.0e-9);
/* Largest number of samples allowed on each side of 0.  Keeps 2*m+1 in
range of an int. */
const int MAX_HALF_LENGTH(numeric_limits<int>::max()/2);

SourceFunctionType string2stftype(const string name)
{
  string lname(name);
  transform(lname.begin(),lname.end(),lname.begin(),::tolower);
  if(lname=="gaussian")
    return SourceFunctionType::Gaussian;
  else if(lname=="triangle")
    return SourceFunctionType::Triangle;
  else
    throw UnsupportedKernelType(name);
}
string stftype2string(const SourceFunctionType stype)
{
  switch(stype)
  {
    case SourceFunctionType::Triangle:
      return string("triangle");
    case SourceFunctionType::Gaussian:
    default:
      return string("gaussian");
  };
}

SourceTimeFunction& SourceTimeFunction::operator=(const SourceTimeFunction& parent)
{
  if(this!=(&parent))
  {
    x=parent.x;
    t=parent.t;
    delta=parent.delta;
    halfwidth=parent.halfwidth;
    type=parent.type;
  }
  return *this;
}
double SourceTimeFunction::area() const
{
  return accumulate(x.begin(),x.end(),0.0)*delta;
}

namespace {
void check_delta(const double delta)
{
  if( !isfinite(delta) || (delta<=0.0) )
  {
    stringstream ss;
    ss << "make_source_timefunction:  sample interval must be positive.  Received delta="
      << delta;
    throw InvalidArgument(ss.str());
  }
}
void check_halfwidth(const double halfwidth)
{
  if( !isfinite(halfwidth) || (halfwidth<0.0) )
  {
    stringstream ss;
    ss << "make_source_timefunction:  halfwidth must be finite and nonnegative.  Received halfwidth="
      << halfwidth;
    throw InvalidArgument(ss.str());
  }
}
/* Time extent of the pulse on each side of 0 */
double pulse_extent(const double halfwidth, const SourceFunctionType stype)
{
  if(stype==SourceFunctionType::Gaussian)
    return 1.5*halfwidth;
  else
    return halfwidth;
}
/* Number of samples on each side of 0 for a pulse that extends to
+-extent seconds.  Caller must have run check_length. */
int half_length(const double extent, const double delta)
{
  double ratio=extent/delta;
  return static_cast<int>(floor(ratio*(1.0+HALFWIDTH_TOLERANCE)));
}
void check_length(const double delta, const double halfwidth,
    const SourceFunctionType stype)
{
  double ratio=pulse_extent(halfwidth,stype)/delta;
  if(floor(ratio*(1.0+HALFWIDTH_TOLERANCE))>static_cast<double>(MAX_HALF_LENGTH))
  {
    stringstream ss;
    ss << "make_source_timefunction:  halfwidth="<<halfwidth
      << " is too long for sample interval delta="<<delta<<endl
      << "Kernel would need more than "<<MAX_HALF_LENGTH
      << " samples on each side of time 0";
    throw InvalidArgument(ss.str());
  }
}
/* Builds the kernel after all arguments are verified */
SourceTimeFunction build_kernel(const double delta, const double halfwidth,
    const SourceFunctionType stype)
{
  SourceTimeFunction stf;
  stf.delta=delta;
  stf.halfwidth=halfwidth;
  stf.type=stype;
  int m;
  if(halfwidth==0.0)
    m=0;
  else
    m=half_length(pulse_extent(halfwidth,stype),delta);
  int n=2*m+1;
  stf.x.reserve(n);
  stf.t.reserve(n);
  for(int k=-m;k<=m;++k)
  {
    double tk=delta*static_cast<double>(k);
    stf.t.push_back(tk);
    if(m==0)
      stf.x.push_back(1.0);
    else if(stype==SourceFunctionType::Gaussian)
    {
      double arg=tk/halfwidth;
      stf.x.push_back(exp(-arg*arg));
    }
    else
      stf.x.push_back(1.0-fabs(tk)/halfwidth);
  }
  /* The center sample is always 1, so the sum is always positive */
  double sum=accumulate(stf.x.begin(),stf.x.end(),0.0);
  double scale=1.0/(sum*delta);
  dscal(n,scale,&(stf.x[0]),1);
  return stf;
}
}  // end anonymous namespace

SourceTimeFunction make_source_timefunction(const double delta,
    const double halfwidth, const string type)
{
  check_delta(delta);
  check_halfwidth(halfwidth);
  SourceFunctionType stype=string2stftype(type);
  check_length(delta,halfwidth,stype);
  return build_kernel(delta,halfwidth,stype);
}

vector<SourceTimeFunction> make_source_timefunction(const vector<double>& delta,
    const vector<double>& halfwidth, const vector<string>& type)
{
  size_t n=delta.size();
  vector<double> hw=expand_to_members(halfwidth,n,"halfwidth");
  vector<string> tnames=expand_to_members(type,n,"type");
  vector<SourceFunctionType> stypes;
  stypes.reserve(n);
  for(size_t i=0;i<n;++i)
  {
    check_delta(delta[i]);
    check_halfwidth(hw[i]);
    stypes.push_back(string2stftype(tnames[i]));
    check_length(delta[i],hw[i],stypes[i]);
  }
  vector<SourceTimeFunction> result;
  result.reserve(n);
  for(size_t i=0;i<n;++i)
    result.push_back(build_kernel(delta[i],hw[i],stypes[i]));
  return result;
}
}  // End seisconv::algorithms namespace
