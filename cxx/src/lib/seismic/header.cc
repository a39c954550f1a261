#include <math.h>
#include <sstream>
#include "seisconv/seismic/header.h"
#include "seisconv/seismic/keywords.h"
#include "seisconv/utility/Metadata.h"
#include "seisconv/utility/state.h"
namespace seisconv::seismic {
using namespace std;
using namespace seisconv::utility;

RecordBatchError::RecordBatchError(const string kind,
    const vector<size_t>& badrecs, const string detail)
  : SeisconvError(), bad(badrecs)
{
  stringstream ss;
  ss << kind << ":  Record(s):"<<endl;
  for(size_t i=0;i<bad.size();++i) ss << bad[i] << " ";
  ss << endl << detail;
  badness=ErrorSeverity::Invalid;
  set_message(ss.str());
}

void check_structure(const TimeSeriesEnsemble& d, const vector<string>& required)
{
  if(!structure_check_state()) return;
  vector<size_t> bad;
  stringstream problems;
  for(size_t i=0;i<d.member.size();++i)
  {
    const TimeSeries& ts=d.member[i];
    if(ts.dead()) continue;
    bool ok(true);
    if( !isfinite(ts.dt()) || (ts.dt()<=0.0) )
    {
      problems << "Record "<<i<<":  sample interval must be positive, found "
        << ts.dt()<<endl;
      ok=false;
    }
    for(auto kptr=required.begin();kptr!=required.end();++kptr)
    {
      if((*kptr)=="dep")
      {
        if(ts.s.size()!=ts.npts())
        {
          problems << "Record "<<i<<":  dependent data has "<<ts.s.size()
            << " samples but npts="<<ts.npts()<<endl;
          ok=false;
        }
      }
      else if(!ts.is_defined(*kptr))
      {
        problems << "Record "<<i<<":  required field "<<*kptr
          <<" is not defined"<<endl;
        ok=false;
      }
    }
    if(!ok) bad.push_back(i);
  }
  if(bad.size()>0)
    throw StructuralValidationError(bad,
        string("Invalid record structure:\n")+problems.str());
}

void check_header(const TimeSeriesEnsemble& d)
{
  if(!header_check_state()) return;
  vector<size_t> bad;
  stringstream problems;
  for(size_t i=0;i<d.member.size();++i)
  {
    const TimeSeries& ts=d.member[i];
    if(ts.dead()) continue;
    bool ok(true);
    try{
      double b=ts.get_double(SEISMICMD_t0);
      double delta=ts.get_double(SEISMICMD_dt);
      long npts=ts.get_long(SEISMICMD_npts);
      if(!isfinite(b))
      {
        problems << "Record "<<i<<":  b is not finite"<<endl;
        ok=false;
      }
      if( (b!=ts.t0()) || (delta!=ts.dt())
          || (npts!=static_cast<long>(ts.npts())) )
      {
        problems << "Record "<<i<<":  header b, delta, or npts does not match the data"<<endl;
        ok=false;
      }
      ts.get_string(SEISMICMD_iftype);
      bool leven=ts.get_bool(SEISMICMD_leven);
      if(leven && ts.is_defined(SEISMICMD_endtime))
      {
        double e=ts.get_double(SEISMICMD_endtime);
        double etest=b+delta*static_cast<double>(npts-1);
        if(fabs(e-etest)>1.0e-6*fabs(delta))
        {
          problems << "Record "<<i<<":  e="<<e<<" does not match b+(npts-1)*delta="
            <<etest<<endl;
          ok=false;
        }
      }
      if(ts.is_defined(SEISMICMD_depmin) && ts.is_defined(SEISMICMD_depmax))
      {
        if(ts.get_double(SEISMICMD_depmin)>ts.get_double(SEISMICMD_depmax))
        {
          problems << "Record "<<i<<":  depmin exceeds depmax"<<endl;
          ok=false;
        }
      }
    }catch(MetadataGetError& merr)
    {
      problems << "Record "<<i<<":  "<<merr.core_message();
      ok=false;
    }
    if(!ok) bad.push_back(i);
  }
  if(bad.size()>0)
    throw StructuralValidationError(bad,
        string("Inconsistent header:\n")+problems.str());
}

vector<double> get_header(const TimeSeriesEnsemble& d, const string key)
{
  vector<double> result;
  result.reserve(d.member.size());
  for(size_t i=0;i<d.member.size();++i)
    result.push_back(d.member[i].get_double(key));
  return result;
}
vector<vector<double>> get_header(const TimeSeriesEnsemble& d,
    const vector<string>& keys)
{
  vector<vector<double>> result;
  result.reserve(keys.size());
  for(auto kptr=keys.begin();kptr!=keys.end();++kptr)
    result.push_back(get_header(d,*kptr));
  return result;
}
vector<string> get_enum_id(const TimeSeriesEnsemble& d, const string key)
{
  vector<string> result;
  result.reserve(d.member.size());
  for(size_t i=0;i<d.member.size();++i)
    result.push_back(d.member[i].get_string(key));
  return result;
}
vector<bool> get_logical(const TimeSeriesEnsemble& d, const string key)
{
  vector<bool> result;
  result.reserve(d.member.size());
  for(size_t i=0;i<d.member.size();++i)
    result.push_back(d.member[i].get_bool(key));
  return result;
}
}  // end seisconv::seismic namespace
