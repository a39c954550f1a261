#include "seisconv/seismic/BasicTimeSeries.h"
namespace seisconv::seismic {

BasicTimeSeries::BasicTimeSeries()
{
    mt0=0.0;
    mlive=false;
    mdt=1.0;
    nsamp=0;
}
BasicTimeSeries::BasicTimeSeries(const BasicTimeSeries& tsin)
{
    mt0=tsin.mt0;
    mlive=tsin.mlive;
    mdt=tsin.mdt;
    nsamp=tsin.nsamp;
}
BasicTimeSeries& BasicTimeSeries::operator=(const BasicTimeSeries& parent)
{
    if (this!=&parent)
    {
        mt0=parent.mt0;
        mlive=parent.mlive;
        mdt=parent.mdt;
        nsamp=parent.nsamp;
    }
    return *this;
}
}  // end seisconv::seismic namespace
