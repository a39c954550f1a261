#include <assert.h>
#include <math.h>
#include <iostream>
#include <sstream>
#include <boost/archive/text_iarchive.hpp>
#include <boost/archive/text_oarchive.hpp>
#include "seisconv/utility/ErrorLogger.h"
#include "seisconv/utility/SeisconvError.h"
#include "seisconv/utility/Metadata.h"
#include "seisconv/utility/AntelopePf.h"
using namespace std;
using namespace seisconv::utility;
void print_metadata(Metadata& md)
{
  ostringstream ss;
  ss << md;
  cout << ss.str();
}
int main(int argc, char **argv)
{
  string pfname("test_md.pf");
  if(argc>1) pfname=string(argv[1]);
  try {
    cout << "Test program for Metadata object, AntelopePf, and ErrorLogger"
      <<endl
      << "First try creating an ErrorLogger object"<<endl;
    ErrorLogger elog;
    elog.set_job_id(10000);
    assert(elog.get_job_id()==10000);
    cout << "Trying to build Metadata objects" << endl;
    Metadata mdplain;
    cout << "Trying put methods for long, double, string, and bool"<<endl;
    long lval; double dval; string sval;  bool bval;
    lval=10;
    mdplain.put<long>("long_val",lval);
    dval=2.5;
    mdplain.put<double>("double_val",dval);
    sval=string("test_string");
    mdplain.put<string>("string_val",sval);
    bval=true;
    mdplain.put<bool>("bool_val",bval);
    cout << "Succeeded - trying matching get methods"<<endl;
    assert(mdplain.get<long>("long_val")==10);
    assert(mdplain.get_long("long_val")==10);
    assert(mdplain.get_double("double_val")==2.5);
    assert(mdplain.get_string("string_val")=="test_string");
    assert(mdplain.get_bool("bool_val"));
    assert(mdplain.size()==4);
    assert(mdplain.modified().size()==4);
    mdplain.clear_modified();
    assert(mdplain.modified().size()==0);
    cout << "Trying copy constructor followed by change of key string_val to sval"<<endl;
    Metadata mdctmp(mdplain);
    mdctmp.change_key("string_val","sval");
    assert(mdctmp.get_string("sval")=="test_string");
    assert(!mdctmp.is_defined("string_val"));
    cout << "Trying serialize_metadata and its inverse"<<endl;
    string sbuf=serialize_metadata(mdplain);
    cout <<sbuf;
    Metadata mrestored=restore_serialized_metadata(sbuf);
    cout<<"Result - should be the same"<<endl;
    print_metadata(mrestored);
    assert(mrestored.size()==mdplain.size());
    assert(mrestored.get_long("long_val")==10);
    assert(mrestored.get_double("double_val")==2.5);
    assert(mrestored.get_string("string_val")=="test_string");
    assert(mrestored.get_bool("bool_val"));
    cout << "Testing erase"<<endl;
    mdplain.erase("double_val");
    assert(!mdplain.is_defined("double_val"));
    assert(mdplain.is_defined("long_val"));

    cout << "Trying to read a pf file using AntelopePf object constructor"<<endl;
    AntelopePf pfsmd(pfname);
    cout << "Success - read the following:  "<<endl;
    print_metadata(pfsmd);
    assert(pfsmd.get<double>("simple_real_parameter")==2.5);
    assert(pfsmd.get<int>("simple_int_parameter")==10);
    assert(pfsmd.get_bool("simple_bool_parameter"));
    assert(pfsmd.get_string("simple_string_parameter")=="gaussian");
    cout << "Trying get_tbl method"<<endl;
    assert(pfsmd.tbl_is_defined("mdlist"));
    list<string> tsttbl=pfsmd.get_tbl("mdlist");
    assert(tsttbl.size()==3);
    assert(tsttbl.front()=="10.0");
    assert(tsttbl.back()=="15");
    cout << "Trying assignment operator for Metadata with RTTI"<<endl;
    Metadata mdsum;
    mdsum=dynamic_cast<Metadata&>(pfsmd);
    cout << "Trying += operator"<<endl;
    mdsum+=mdplain;
    assert(mdsum.is_defined("long_val"));
    assert(mdsum.is_defined("simple_real_parameter"));
    cout << "Trying pfwrite and reading the result back"<<endl;
    stringstream pfss;
    pfsmd.pfwrite(pfss);
    list<string> pflines;
    string line;
    while(getline(pfss,line)) pflines.push_back(line);
    AntelopePf pfcopy(pflines);
    assert(pfcopy.get_double("simple_real_parameter")==2.5);
    assert(pfcopy.get_int("simple_int_parameter")==10);
    assert(pfcopy.get_tbl("mdlist").size()==3);
    cout << "Testing exceptions.  First a get failure:"<<endl;
    try{
      double dbad=mdsum.get<double>("bad_key");
      cout << "PROBLEM:  get did not throw error and returned "<< dbad<<endl;
      return 1;
    }catch(MetadataGetError& mdge)
    {
      cout << "Properly handled.  Message posted follows:"<<endl
        << mdge.what()<<endl;
      assert(mdge.severity() == ErrorSeverity::Suspect);
      elog.log_error(mdge);
    }
    cout << "Trying intentional type mismatch."<<endl;
    try{
      int ibad=pfsmd.get<int>("simple_real_parameter");
      cout<<"FAILURE:  returned a double as int="<<ibad<<endl;
      return 1;
    }catch(MetadataGetError& mdge)
    {
      cout << "Properly handled trying to get a double as int"<<endl
        << mdge.what()<<endl;
      elog.log_error(mdge);
    }
    cout << "Testing that a missing pf file throws"<<endl;
    try{
      AntelopePf pfbad(string("no_such_file.pf"));
      cout << "FAILURE:  constructor did not throw"<<endl;
      return 1;
    }catch(AntelopePfError& pferr)
    {
      cout << "Properly handled.  Message="<<pferr.what()<<endl;
    }
    cout << "Testing that an Arr block is rejected"<<endl;
    list<string> arrlines;
    arrlines.push_back("branch &Arr{");
    arrlines.push_back("x 1");
    arrlines.push_back("}");
    try{
      AntelopePf pfarr(arrlines);
      cout << "FAILURE:  Arr was accepted"<<endl;
      return 1;
    }catch(AntelopePfError& pferr)
    {
      cout << "Properly handled"<<endl;
    }
    cout << "Posting a set of fake messages to log"<<endl;
    SeisconvError efatal(string("Fake fatal error"),"Fatal");
    elog.log_error(efatal);
    SeisconvError edebug(string("Fake debug error"),"Debug");
    elog.log_error(edebug);
    elog.log_verbose("test_md",string("verbose message"));
    assert(elog.size()==5);
    list<LogData> worst=elog.worst_errors();
    assert(worst.size()==1);
    assert(worst.front().badness==ErrorSeverity::Fatal);
    list<LogData> ldata=elog.get_error_log();
    assert(ldata.back().badness==ErrorSeverity::Informational);
    cout << "Dump of error log"<<endl;
    for(auto lptr=ldata.begin();lptr!=ldata.end();++lptr)
      cout << *lptr<<endl;
    cout << "Testing serialization of error log"<<endl;
    stringstream serial_ss;
    boost::archive::text_oarchive ar(serial_ss);
    ar << elog;
    string serialbuf=serial_ss.str();
    istringstream eloginstrm(serialbuf);
    ErrorLogger elog_restored;
    boost::archive::text_iarchive arin(eloginstrm);
    arin>>elog_restored;
    assert(elog_restored.size()==elog.size());
    assert(elog_restored.get_job_id()==10000);
    list<LogData> lrestored=elog_restored.get_error_log();
    assert(lrestored.front().message==ldata.front().message);
    assert(lrestored.back().badness==ErrorSeverity::Informational);
    cout << "test_md completed successfully"<<endl;
  }
  catch (SeisconvError& sess)
  {
    cout << "Something threw a SeisconvError exception - message posted follows"<<endl;
    cout << sess.what()<<endl;
    return 1;
  }
  catch(std::exception& stex)
  {
    cout << "Something threw a std::exception that was not a SeisconvError"<<endl
      << "Error message:  "<<stex.what()<<endl;
    return 1;
  }
  return 0;
}
