#include <sstream>
#include "seisconv/algorithms/convolution.h"
#include "seisconv/utility/SeisconvError.h"
namespace seisconv::algorithms
{
using namespace std;
using namespace seisconv::seismic;
using namespace seisconv::utility;

void attach(TimeSeries& d, const AttachPosition where, const vector<double>& samples)
{
  if(samples.empty()) return;
  double extension=d.dt()*static_cast<double>(samples.size());
  switch(where)
  {
    case AttachPosition::Beginning:
      d.s.insert(d.s.begin(),samples.begin(),samples.end());
      d.set_t0(d.t0()-extension);
      break;
    case AttachPosition::Ending:
      d.s.insert(d.s.end(),samples.begin(),samples.end());
  };
  d.sync_header();
}

void attach(TimeSeriesEnsemble& d, const vector<vector<double>>& ending,
    const vector<vector<double>>& beginning)
{
  size_t nmembers=d.member.size();
  if( (ending.size()!=nmembers) || (beginning.size()!=nmembers) )
  {
    stringstream ss;
    ss << "attach:  ensemble has "<<nmembers<<" members but received "
      << ending.size()<<" ending and "<<beginning.size()<<" beginning sample vectors";
    throw InvalidArgument(ss.str());
  }
  for(size_t i=0;i<nmembers;++i)
  {
    if(d.member[i].dead()) continue;
    attach(d.member[i],AttachPosition::Ending,ending[i]);
    attach(d.member[i],AttachPosition::Beginning,beginning[i]);
  }
}

void attach(TimeSeriesEnsemble& d, const vector<FinalConditions>& fc)
{
  vector<vector<double>> ending,beginning;
  ending.reserve(fc.size());
  beginning.reserve(fc.size());
  for(auto fptr=fc.begin();fptr!=fc.end();++fptr)
  {
    ending.push_back(fptr->ending);
    beginning.push_back(fptr->beginning);
  }
  attach(d,ending,beginning);
}
}  // End seisconv::algorithms namespace
