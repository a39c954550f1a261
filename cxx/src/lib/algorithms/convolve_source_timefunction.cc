#include <stdlib.h>
#include <iostream>
#include <list>
#include <sstream>
#include "seisconv/algorithms/source_convolution.h"
#include "seisconv/seismic/header.h"
#include "seisconv/utility/ErrorLogger.h"
#include "seisconv/utility/Metadata.h"
#include "seisconv/utility/SeisconvError.h"
#include "seisconv/utility/state.h"
namespace seisconv::algorithms
{
using namespace std;
using namespace seisconv::seismic;
using namespace seisconv::utility;

const string algorithm_name("convolve_source_timefunction");

ConvolutionParameters::ConvolutionParameters()
  : halfwidth(),type(1,"gaussian"),verbose(false)
{
}
ConvolutionParameters::ConvolutionParameters(const vector<double>& hw,
    const vector<string>& stype, const bool verbose_output)
  : halfwidth(hw),type(stype),verbose(verbose_output)
{
}
ConvolutionParameters::ConvolutionParameters(const AntelopePf& pf)
  : halfwidth(),type(1,"gaussian"),verbose(false)
{
  const string base_error("ConvolutionParameters pf constructor:  ");
  if(pf.tbl_is_defined("halfwidths"))
  {
    list<string> hwlist=pf.get_tbl("halfwidths");
    for(auto lptr=hwlist.begin();lptr!=hwlist.end();++lptr)
    {
      const char *token=lptr->c_str();
      char *endptr;
      double val=strtod(token,&endptr);
      if(endptr==token)
        throw InvalidArgument(base_error+"halfwidths Tbl entry="+(*lptr)
            +" is not a number");
      halfwidth.push_back(val);
    }
    if(halfwidth.empty())
      throw InvalidArgument(base_error+"halfwidths Tbl is empty");
  }
  else if(pf.is_defined("halfwidth"))
  {
    /* The pf parser stores a value like 10 as an int */
    try{
      halfwidth.push_back(pf.get_double("halfwidth"));
    }catch(MetadataGetError&)
    {
      halfwidth.push_back(static_cast<double>(pf.get_int("halfwidth")));
    }
  }
  else
    throw InvalidArgument(base_error+"required parameter halfwidth is not defined");
  if(pf.tbl_is_defined("source_function_types"))
  {
    list<string> tlist=pf.get_tbl("source_function_types");
    if(tlist.empty())
      throw InvalidArgument(base_error+"source_function_types Tbl is empty");
    type.assign(tlist.begin(),tlist.end());
  }
  else if(pf.is_defined("source_function_type"))
    type[0]=pf.get_string("source_function_type");
  if(pf.is_defined("verbose")) verbose=pf.get_bool("verbose");
}
ConvolutionParameters::ConvolutionParameters(const ConvolutionParameters& parent)
  : halfwidth(parent.halfwidth),type(parent.type),verbose(parent.verbose)
{
}
ConvolutionParameters& ConvolutionParameters::operator=(const ConvolutionParameters& parent)
{
  if(this!=(&parent))
  {
    halfwidth=parent.halfwidth;
    type=parent.type;
    verbose=parent.verbose;
  }
  return *this;
}

namespace {
/* Does all the work for the public functions.  elog is null except for
the LoggingEnsemble form. */
vector<SourceTimeFunction> run_convolution(TimeSeriesEnsemble& d,
    const vector<double>& halfwidth, const vector<string>& type,
    ErrorLogger *elog)
{
  check_structure(d,vector<string>(1,"dep"));
  check_header(d);
  ScopedCheckState checkstate;
  checkstate.disable_checks();
  validate_convolution_inputs(d);
  size_t n=d.member.size();
  vector<double> hwall=expand_to_members(halfwidth,n,"halfwidth");
  vector<string> typeall=expand_to_members(type,n,"type");
  /* Kernels are built only for live members */
  vector<size_t> live_index;
  vector<double> dtlive,hwlive;
  vector<string> typelive;
  for(size_t i=0;i<n;++i)
  {
    if(d.member[i].dead()) continue;
    live_index.push_back(i);
    dtlive.push_back(d.member[i].dt());
    hwlive.push_back(hwall[i]);
    typelive.push_back(typeall[i]);
  }
  vector<SourceTimeFunction> livekernels
    = make_source_timefunction(dtlive,hwlive,typelive);
  vector<SourceTimeFunction> kernels(n);
  for(size_t k=0;k<live_index.size();++k)
    kernels[live_index[k]]=livekernels[k];
  vector<long> delays=resolve_delays(kernels);
  vector<FinalConditions> fc=convolve(d,kernels,delays);
  if(seisconv_verbose())
  {
    const string mess("Attaching Convolution Final Conditions onto Record(s)");
    cout << mess << endl;
    if(elog!=NULL) elog->log_verbose(algorithm_name,mess);
  }
  attach(d,fc);
  return kernels;
}
}  // end anonymous namespace

vector<SourceTimeFunction> convolve_source_timefunction(TimeSeriesEnsemble& d,
    const vector<double>& halfwidth, const vector<string>& type)
{
  return run_convolution(d,halfwidth,type,NULL);
}
vector<SourceTimeFunction> convolve_source_timefunction(TimeSeriesEnsemble& d,
    const ConvolutionParameters& params)
{
  ScopedCheckState verbosity;
  if(params.verbose) verbosity.set_verbose(true);
  return run_convolution(d,params.halfwidth,params.type,NULL);
}
vector<SourceTimeFunction> convolve_source_timefunction(LoggingTimeSeriesEnsemble& d,
    const ConvolutionParameters& params)
{
  if(d.dead()) return vector<SourceTimeFunction>();
  ScopedCheckState verbosity;
  if(params.verbose) verbosity.set_verbose(true);
  return run_convolution(d,params.halfwidth,params.type,&(d.elog));
}
}  // End seisconv::algorithms namespace
