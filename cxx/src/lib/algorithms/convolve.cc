#include <math.h>
#include <algorithm>
#include <sstream>
#include "misc/blas.h"
#include "seisconv/algorithms/convolution.h"
#include "seisconv/seismic/keywords.h"
#include "seisconv/utility/Metadata.h"
#include "seisconv/utility/SeisconvError.h"
namespace seisconv::algorithms
{
using namespace std;
using namespace seisconv::seismic;
using namespace seisconv::utility;

void validate_convolution_inputs(const TimeSeriesEnsemble& d)
{
  vector<size_t> badtype,uneven;
  for(size_t i=0;i<d.member.size();++i)
  {
    const TimeSeries& ts=d.member[i];
    if(ts.dead()) continue;
    /* A field stored with the wrong type marks the record bad */
    try{
      if(ts.is_defined(SEISMICMD_iftype))
      {
        string iftype=ts.get_string(SEISMICMD_iftype);
        if( (iftype!=IFTYPE_timeseries) && (iftype!=IFTYPE_xy) )
          badtype.push_back(i);
      }
      else
        badtype.push_back(i);
    }catch(MetadataGetError&)
    {
      badtype.push_back(i);
    }
    /* An undefined leven cannot be trusted to mean evenly sampled */
    try{
      if(ts.is_defined(SEISMICMD_leven))
      {
        if(!ts.get_bool(SEISMICMD_leven)) uneven.push_back(i);
      }
      else
        uneven.push_back(i);
    }catch(MetadataGetError&)
    {
      uneven.push_back(i);
    }
  }
  if(badtype.size()>0) throw IncompatibleRecordType(badtype);
  if(uneven.size()>0) throw UnevenSamplingError(uneven);
}

long resolve_delay(const vector<double>& t, const double delta)
{
  if(t.empty())
    throw InvalidArgument("resolve_delay:  kernel time axis is empty");
  if( !isfinite(delta) || (delta<=0.0) )
  {
    stringstream ss;
    ss << "resolve_delay:  sample interval must be positive.  Received delta="<<delta;
    throw InvalidArgument(ss.str());
  }
  return lround(t[0]/delta);
}
vector<long> resolve_delays(const vector<vector<double>>& t,
    const vector<double>& delta)
{
  if(t.size()!=delta.size())
  {
    stringstream ss;
    ss << "resolve_delays:  size mismatch.  Received "<<t.size()
      << " time vectors and "<<delta.size()<<" sample intervals";
    throw InvalidArgument(ss.str());
  }
  vector<long> result;
  result.reserve(t.size());
  for(size_t i=0;i<t.size();++i)
    result.push_back(resolve_delay(t[i],delta[i]));
  return result;
}
vector<long> resolve_delays(const vector<SourceTimeFunction>& kernels)
{
  vector<long> result;
  result.reserve(kernels.size());
  for(auto kptr=kernels.begin();kptr!=kernels.end();++kptr)
  {
    if(kptr->empty())
      result.push_back(0);
    else
      result.push_back(resolve_delay(kptr->t,kptr->delta));
  }
  return result;
}

/* Relative tolerance for matching kernel and record sample intervals */
const double DT_TOLERANCE(1.0e-6);

vector<FinalConditions> convolve(TimeSeriesEnsemble& d,
    const vector<SourceTimeFunction>& kernels, const vector<long>& delays)
{
  const string base_error("convolve:  ");
  size_t nmembers=d.member.size();
  if( (kernels.size()!=nmembers) || (delays.size()!=nmembers) )
  {
    stringstream ss;
    ss << base_error<<"ensemble has "<<nmembers<<" members but received "
      << kernels.size()<<" kernels and "<<delays.size()<<" delays";
    throw InvalidArgument(ss.str());
  }
  for(size_t i=0;i<nmembers;++i)
  {
    if(d.member[i].dead()) continue;
    if(kernels[i].empty())
    {
      stringstream ss;
      ss << base_error<<"kernel for record "<<i<<" is empty";
      throw InvalidArgument(ss.str());
    }
    double dt=d.member[i].dt();
    if(fabs(kernels[i].delta-dt)>DT_TOLERANCE*fabs(dt))
    {
      stringstream ss;
      ss << base_error<<"sample interval mismatch for record "<<i
        << ".  Record delta="<<dt<<" but kernel delta="<<kernels[i].delta;
      throw InvalidArgument(ss.str());
    }
  }
  vector<FinalConditions> result(nmembers);
  for(size_t i=0;i<nmembers;++i)
  {
    TimeSeries& ts=d.member[i];
    if(ts.dead()) continue;
    long n=static_cast<long>(ts.s.size());
    if(n==0) continue;
    int nk=static_cast<int>(kernels[i].npts());
    long delay=delays[i];
    /* Full convolution sample j lands at record sample j+delay.  The
    work buffer spans record samples ilo to ihi-1. */
    long ilo=min(0L,delay);
    long ihi=max(n,n+static_cast<long>(nk)-1+delay);
    vector<double> work(ihi-ilo,0.0);
    const double *wptr=&(kernels[i].x[0]);
    for(long k=0;k<n;++k)
    {
      if(ts.s[k]!=0.0)
        daxpy(nk,ts.s[k],wptr,1,&(work[k+delay-ilo]),1);
    }
    long nbegin=-ilo;
    result[i].beginning.assign(work.begin(),work.begin()+nbegin);
    copy(work.begin()+nbegin,work.begin()+nbegin+n,ts.s.begin());
    result[i].ending.assign(work.begin()+nbegin+n,work.end());
    ts.update_dependent_stats();
  }
  return result;
}
}  // End seisconv::algorithms namespace
