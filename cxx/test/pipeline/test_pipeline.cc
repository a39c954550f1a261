#include <assert.h>
#include <math.h>
#include <iostream>
#include <list>
#include <numeric>
#include <string>
#include <vector>
#include "seisconv/algorithms/source_convolution.h"
#include "seisconv/seismic/Ensemble.h"
#include "seisconv/seismic/TimeSeries.h"
#include "seisconv/seismic/header.h"
#include "seisconv/seismic/keywords.h"
#include "seisconv/utility/AntelopePf.h"
#include "seisconv/utility/ErrorLogger.h"
#include "seisconv/utility/SeisconvError.h"
#include "seisconv/utility/state.h"
using namespace std;
using namespace seisconv::utility;
using namespace seisconv::seismic;
using namespace seisconv::algorithms;
TimeSeries make_record(const size_t n, const double dt, const double t0)
{
  TimeSeries ts(n);
  ts.set_dt(dt);
  ts.set_t0(t0);
  for(size_t i=0;i<n;++i)
    ts.s[i]=cos(0.2*static_cast<double>(i))+0.5;
  ts.set_live();
  ts.sync_header();
  return ts;
}
TimeSeriesEnsemble make_ensemble(const size_t nmembers, const double dt)
{
  TimeSeriesEnsemble ens(nmembers);
  for(size_t i=0;i<nmembers;++i)
    ens.member.push_back(make_record(40+10*i,dt,5.0*static_cast<double>(i)));
  return ens;
}
double vsum(const vector<double>& x)
{
  return accumulate(x.begin(),x.end(),0.0);
}
/* True if sample data and the header values the pipeline alters match */
bool same_records(const TimeSeriesEnsemble& a, const TimeSeriesEnsemble& b)
{
  if(a.size()!=b.size()) return false;
  for(size_t i=0;i<a.size();++i)
  {
    if(a.member[i].s!=b.member[i].s) return false;
    if(a.member[i].t0()!=b.member[i].t0()) return false;
    if(a.member[i].npts()!=b.member[i].npts()) return false;
    if(a.member[i].get_double(SEISMICMD_endtime)
        !=b.member[i].get_double(SEISMICMD_endtime)) return false;
  }
  return true;
}
bool switches_are_default()
{
  return structure_check_state() && header_check_state() && !seisconv_verbose();
}
int main(int argc, char **argv)
{
  try{
    cout << "test_pipeline starting"<<endl
      << "Single record, delta 1, triangle with halfwidth 10"<<endl;
    TimeSeriesEnsemble ens1(1);
    ens1.member.push_back(make_record(50,1.0,0.0));
    double before=vsum(ens1.member[0].s);
    double e0=ens1.member[0].get_double(SEISMICMD_endtime);
    vector<double> hw(1,10.0);
    vector<string> tri(1,"triangle");
    vector<SourceTimeFunction> k1=convolve_source_timefunction(ens1,hw,tri);
    assert(k1.size()==1);
    assert(k1[0].npts()==21);
    assert(k1[0].t[0]==-10.0);
    assert(fabs(k1[0].area()-1.0)<1.0e-6);
    const TimeSeries& r1=ens1.member[0];
    assert(r1.npts()==70);
    assert(r1.get_long(SEISMICMD_npts)==70);
    assert(fabs(r1.t0()+10.0)<1.0e-12);
    assert(fabs(r1.get_double(SEISMICMD_t0)+10.0)<1.0e-12);
    assert(fabs(r1.get_double(SEISMICMD_endtime)-(e0+10.0))<1.0e-12);
    assert(fabs(vsum(r1.s)-before)<1.0e-9*fabs(before));
    assert(r1.get_double(SEISMICMD_depmin)<=r1.get_double(SEISMICMD_depmen));
    assert(r1.get_double(SEISMICMD_depmen)<=r1.get_double(SEISMICMD_depmax));
    assert(switches_are_default());

    cout << "Default type is gaussian and energy is conserved with delta 0.1"<<endl;
    TimeSeriesEnsemble ens2=make_ensemble(3,0.1);
    vector<double> sums;
    for(size_t i=0;i<3;++i) sums.push_back(vsum(ens2.member[i].s));
    vector<double> hw2(1,0.5);
    vector<SourceTimeFunction> k2=convolve_source_timefunction(ens2,hw2);
    for(size_t i=0;i<3;++i)
    {
      assert(k2[i].type==SourceFunctionType::Gaussian);
      assert(k2[i].npts()==15);
      /* The samples sum to 1/delta so the sum scales by the same factor */
      double expected=sums[i]*vsum(k2[i].x);
      assert(fabs(vsum(ens2.member[i].s)-expected)<1.0e-9*fabs(expected));
      assert(ens2.member[i].npts()==40+10*i+14);
    }

    cout << "Scalar arguments are equivalent to repeated per record values"<<endl;
    TimeSeriesEnsemble ens3a=make_ensemble(3,0.5);
    TimeSeriesEnsemble ens3b(ens3a);
    vector<double> hwscalar(1,2.0);
    vector<string> tscalar(1,"triangle");
    vector<double> hwfull(3,2.0);
    vector<string> tfull(3,"triangle");
    vector<SourceTimeFunction> k3a=convolve_source_timefunction(ens3a,hwscalar,tscalar);
    vector<SourceTimeFunction> k3b=convolve_source_timefunction(ens3b,hwfull,tfull);
    assert(same_records(ens3a,ens3b));
    for(size_t i=0;i<3;++i) assert(k3a[i].x==k3b[i].x);

    cout << "Per record halfwidths and types"<<endl;
    TimeSeriesEnsemble ens4=make_ensemble(2,1.0);
    vector<double> hw4;
    hw4.push_back(2.0);
    hw4.push_back(4.0);
    vector<string> t4;
    t4.push_back("Triangle");
    t4.push_back("GAUSSIAN");
    vector<SourceTimeFunction> k4=convolve_source_timefunction(ens4,hw4,t4);
    assert(k4[0].npts()==5);
    assert(k4[1].npts()==13);
    assert(ens4.member[0].npts()==44);
    assert(ens4.member[1].npts()==62);

    cout << "Unevenly sampled record is rejected and nothing changes"<<endl;
    TimeSeriesEnsemble ens5=make_ensemble(3,1.0);
    ens5.member[1].put<bool>(SEISMICMD_leven,false);
    TimeSeriesEnsemble ens5copy(ens5);
    try{
      convolve_source_timefunction(ens5,hw);
      cout << "FAILURE:  leven false was accepted"<<endl;
      return 1;
    }catch(UnevenSamplingError& err)
    {
      cout << "Properly handled.  Message="<<err.what()<<endl;
      vector<size_t> idx=err.indices();
      assert(idx.size()==1);
      assert(idx[0]==1);
      assert(same_records(ens5,ens5copy));
      assert(switches_are_default());
    }

    cout << "Unknown type on one of three records is rejected before convolution"<<endl;
    TimeSeriesEnsemble ens6=make_ensemble(3,1.0);
    TimeSeriesEnsemble ens6copy(ens6);
    vector<string> t6;
    t6.push_back("gaussian");
    t6.push_back("unknown");
    t6.push_back("triangle");
    try{
      convolve_source_timefunction(ens6,hw,t6);
      cout << "FAILURE:  unknown type was accepted"<<endl;
      return 1;
    }catch(UnsupportedKernelType& err)
    {
      cout << "Properly handled.  Message="<<err.what()<<endl;
      assert(err.type_name()=="unknown");
      assert(same_records(ens6,ens6copy));
      assert(switches_are_default());
    }

    cout << "Spectral records are rejected with all offending indices"<<endl;
    TimeSeriesEnsemble ens7=make_ensemble(4,1.0);
    ens7.member[0].put<string>(SEISMICMD_iftype,IFTYPE_ampphase);
    ens7.member[2].put<string>(SEISMICMD_iftype,IFTYPE_realimag);
    ens7.member[3].put<string>(SEISMICMD_iftype,IFTYPE_xy);
    ens7.member[3].put<bool>(SEISMICMD_leven,false);
    TimeSeriesEnsemble ens7copy(ens7);
    try{
      convolve_source_timefunction(ens7,hw);
      cout << "FAILURE:  spectral records accepted"<<endl;
      return 1;
    }catch(IncompatibleRecordType& err)
    {
      cout << "Properly handled.  Message="<<err.what()<<endl;
      vector<size_t> idx=err.indices();
      assert(idx.size()==2);
      assert(idx[0]==0);
      assert(idx[1]==2);
      assert(same_records(ens7,ens7copy));
    }

    cout << "Header fields of the wrong type are reported as bad records"<<endl;
    TimeSeriesEnsemble ens7b=make_ensemble(3,1.0);
    ens7b.member[1].put<int>(SEISMICMD_iftype,1);
    ens7b.member[2].put<string>(SEISMICMD_leven,"true");
    TimeSeriesEnsemble ens7bcopy(ens7b);
    header_check_state(false);
    try{
      convolve_source_timefunction(ens7b,hw);
      cout << "FAILURE:  integer iftype accepted"<<endl;
      return 1;
    }catch(IncompatibleRecordType& err)
    {
      cout << "Properly handled.  Message="<<err.what()<<endl;
      assert(err.indices().size()==1);
      assert(err.indices()[0]==1);
      assert(same_records(ens7b,ens7bcopy));
    }
    header_check_state(true);
    ens7b.member[1].put<string>(SEISMICMD_iftype,IFTYPE_timeseries);
    try{
      validate_convolution_inputs(ens7b);
      cout << "FAILURE:  string leven accepted"<<endl;
      return 1;
    }catch(UnevenSamplingError& err)
    {
      assert(err.indices().size()==1);
      assert(err.indices()[0]==2);
    }
    assert(switches_are_default());

    cout << "Structural problems are caught and the switches restored"<<endl;
    TimeSeriesEnsemble ens8=make_ensemble(2,1.0);
    ens8.member[1].s.push_back(1.0);
    TimeSeriesEnsemble ens8copy(ens8);
    try{
      convolve_source_timefunction(ens8,hw);
      cout << "FAILURE:  bad structure accepted"<<endl;
      return 1;
    }catch(StructuralValidationError& err)
    {
      assert(err.indices().size()==1);
      assert(err.indices()[0]==1);
      assert(same_records(ens8,ens8copy));
      assert(switches_are_default());
    }
    cout << "Header problems are caught"<<endl;
    TimeSeriesEnsemble ens9=make_ensemble(2,1.0);
    ens9.member[0].put<double>(SEISMICMD_endtime,-100.0);
    try{
      convolve_source_timefunction(ens9,hw);
      cout << "FAILURE:  bad header accepted"<<endl;
      return 1;
    }catch(StructuralValidationError& err)
    {
      assert(err.indices()[0]==0);
    }
    cout << "Switching the header check off skips that check and stays off"<<endl;
    header_check_state(false);
    convolve_source_timefunction(ens9,hw);
    assert(!header_check_state());
    assert(structure_check_state());
    header_check_state(true);

    cout << "Bad argument lengths and values"<<endl;
    TimeSeriesEnsemble ens10=make_ensemble(3,1.0);
    TimeSeriesEnsemble ens10copy(ens10);
    vector<double> hwbad(2,1.0);
    try{
      convolve_source_timefunction(ens10,hwbad);
      cout << "FAILURE:  halfwidth of length 2 accepted for 3 records"<<endl;
      return 1;
    }catch(InvalidArgument& err)
    {
      assert(same_records(ens10,ens10copy));
    }
    vector<double> hwneg(3,1.0);
    hwneg[2]=-1.0;
    try{
      convolve_source_timefunction(ens10,hwneg);
      cout << "FAILURE:  negative halfwidth accepted"<<endl;
      return 1;
    }catch(InvalidArgument& err)
    {
      assert(same_records(ens10,ens10copy));
    }

    cout << "Dead records are passed through"<<endl;
    TimeSeriesEnsemble ens11=make_ensemble(3,1.0);
    ens11.member[1].kill();
    ens11.member[1].put<bool>(SEISMICMD_leven,false);
    vector<double> saved=ens11.member[1].s;
    vector<SourceTimeFunction> k11=convolve_source_timefunction(ens11,hw,tri);
    assert(k11[1].empty());
    assert(ens11.member[1].s==saved);
    assert(ens11.member[0].npts()==60);

    cout << "Testing ConvolutionParameters built from a pf image"<<endl;
    list<string> pflines;
    pflines.push_back("# scalar form");
    pflines.push_back("halfwidth 10");
    pflines.push_back("source_function_type triangle");
    pflines.push_back("verbose true");
    AntelopePf pf(pflines);
    ConvolutionParameters cp(pf);
    assert(cp.halfwidth.size()==1);
    assert(cp.halfwidth[0]==10.0);
    assert(cp.type.size()==1);
    assert(cp.type[0]=="triangle");
    assert(cp.verbose);
    list<string> tbllines;
    tbllines.push_back("halfwidth 3.0");
    tbllines.push_back("halfwidths &Tbl{");
    tbllines.push_back("2.0");
    tbllines.push_back("4.0");
    tbllines.push_back("}");
    tbllines.push_back("source_function_types &Tbl{");
    tbllines.push_back("triangle");
    tbllines.push_back("gaussian");
    tbllines.push_back("}");
    AntelopePf pftbl(tbllines);
    ConvolutionParameters cptbl(pftbl);
    assert(cptbl.halfwidth.size()==2);
    assert(cptbl.halfwidth[1]==4.0);
    assert(cptbl.type[1]=="gaussian");
    assert(!cptbl.verbose);
    TimeSeriesEnsemble ens12=make_ensemble(2,1.0);
    vector<SourceTimeFunction> k12=convolve_source_timefunction(ens12,cptbl);
    assert(k12[0].npts()==5);
    assert(k12[1].npts()==13);
    list<string> nohw;
    nohw.push_back("source_function_type gaussian");
    AntelopePf pfnohw(nohw);
    try{
      ConvolutionParameters cpbad(pfnohw);
      cout << "FAILURE:  parameters without halfwidth accepted"<<endl;
      return 1;
    }catch(InvalidArgument& err)
    {
      cout << "Missing halfwidth properly handled"<<endl;
    }
    ConvolutionParameters cpdefault;
    assert(cpdefault.type.size()==1 && cpdefault.type[0]=="gaussian");
    assert(!cpdefault.verbose);

    cout << "Verbose output is posted to the ensemble log"<<endl;
    LoggingTimeSeriesEnsemble lens(make_ensemble(2,1.0));
    assert(lens.live());
    vector<SourceTimeFunction> klog=convolve_source_timefunction(lens,cp);
    assert(klog.size()==2);
    assert(klog[0].type==SourceFunctionType::Triangle);
    assert(lens.elog.size()==1);
    list<LogData> logs=lens.elog.get_error_log();
    assert(logs.front().badness==ErrorSeverity::Informational);
    assert(logs.front().message=="Attaching Convolution Final Conditions onto Record(s)");
    assert(switches_are_default());
    cout << "Without verbose nothing is logged"<<endl;
    LoggingTimeSeriesEnsemble lens2(make_ensemble(2,1.0));
    convolve_source_timefunction(lens2,cptbl);
    assert(lens2.elog.size()==0);
    cout << "A dead ensemble is returned untouched"<<endl;
    LoggingTimeSeriesEnsemble lens3(make_ensemble(2,1.0));
    lens3.kill();
    vector<double> s3=lens3.member[0].s;
    vector<SourceTimeFunction> kdead=convolve_source_timefunction(lens3,cp);
    assert(kdead.empty());
    assert(lens3.member[0].s==s3);
    cout << "test_pipeline completed successfully"<<endl;
  }catch(SeisconvError& serr)
  {
    cout << "Unexpected SeisconvError thrown"<<endl<<serr.what()<<endl;
    return 1;
  }
  return 0;
}
