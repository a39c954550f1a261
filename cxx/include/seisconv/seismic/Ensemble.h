#ifndef _SEISCONV_ENSEMBLE_H_
#define _SEISCONV_ENSEMBLE_H_
#include <vector>
#include "seisconv/seismic/TimeSeries.h"
#include "seisconv/utility/ErrorLogger.h"
#include "seisconv/utility/Metadata.h"
namespace seisconv::seismic{
/*! \brief Collection of data objects processed together.

An ensemble is a set of records linked by some property (a common event,
a station gather, etc.).  The ensemble has its own header (Metadata) and
holds the records in a public vector because copying large members
through a getter would be a serious inefficiency.  Member order is
significant: procedures that take per-record arguments match them to
members by position.
*/
template <typename Tdata> class Ensemble : public seisconv::utility::Metadata
{
public:
  std::vector<Tdata> member;
  Ensemble(){};
  /*! Reserve space for n members but build an empty ensemble. */
  Ensemble(const size_t n){member.reserve(n);};
  /*! Clone metadata and set aside n slots but no data*/
  Ensemble(const seisconv::utility::Metadata& md,const size_t n)
     : seisconv::utility::Metadata(md)
  {
      member.reserve(n);
  };
  Ensemble(const Ensemble& parent)
    : seisconv::utility::Metadata(parent), member(parent.member){};
  virtual ~Ensemble(){};
  Ensemble& operator=(const Ensemble& parent)
  {
    if(this!=(&parent))
    {
      this->Metadata::operator=(parent);
      member=parent.member;
    }
    return *this;
  };
  Tdata& operator[](const size_t n)
  {
    return(this->member[n]);
  };
  const Tdata& operator[](const size_t n) const
  {
    return(this->member[n]);
  };
  /*! Number of members. */
  size_t size() const {return member.size();};
  /*! \brief copy ensemble metadata to all members.

    Overwrites member attributes that have the same key as an ensemble
    attribute.
    */
  void sync_metadata()
  {
      for(size_t i=0;i<this->member.size();++i)
      {
          seisconv::utility::Metadata *mdmember=&(this->member[i]);
          (*mdmember)+=dynamic_cast<seisconv::utility::Metadata&>(*this);
      }
  };
};

/*! \brief Ensemble with an error log and a live/dead state.

Procedures that work on a whole ensemble post messages that apply to the
ensemble as a whole (e.g. verbose progress messages) to elog.
*/
template <typename T> class LoggingEnsemble : public Ensemble<T>
{
public:
  seisconv::utility::ErrorLogger elog;
  /*! Default constructor.  Marks the ensemble dead.*/
  LoggingEnsemble(): Ensemble<T>(), elog()
  {
    ensemble_is_live=false;
  };
  /*! Reserve n slots.  The ensemble is marked dead until set_live is called. */
  LoggingEnsemble(const size_t n) : Ensemble<T>(n),elog()
  {
    ensemble_is_live=false;
  }
  LoggingEnsemble(const LoggingEnsemble<T>& parent)
          : Ensemble<T>(parent),elog(parent.elog)
  {
    ensemble_is_live=parent.ensemble_is_live;
  };
  /*! Clone from a base class Ensemble.  Initializes an empty log and sets live. */
  LoggingEnsemble(const Ensemble<T>& parent)
          : Ensemble<T>(parent),elog()
  {
    ensemble_is_live=true;
  };
  void kill(){ensemble_is_live=false;};
  bool live() const {return ensemble_is_live;};
  bool dead() const {return !ensemble_is_live;};
  /*! Mark the ensemble live if validate passes.  Returns the result of
  validate. */
  bool set_live(){
    if(this->validate())
    {
      ensemble_is_live=true;
      return true;
    }
    else
      return false;
  };
  /*! Return true if any member is live. */
  bool validate() const;
  LoggingEnsemble<T>& operator=(const LoggingEnsemble<T>& parent)
  {
    if(&parent != this)
    {
      this->Ensemble<T>::operator=(parent);
      elog=parent.elog;
      ensemble_is_live=parent.ensemble_is_live;
    }
    return *this;
  };
private:
  bool ensemble_is_live;
};

template <typename T> bool LoggingEnsemble<T>::validate() const
{
  for(auto dptr=this->member.begin();dptr!=this->member.end();++dptr)
  {
    if(dptr->live()) return true;
  }
  return false;
}

/*! Useful alias for Ensemble<TimeSeries> */
typedef Ensemble<TimeSeries> TimeSeriesEnsemble;
typedef LoggingEnsemble<TimeSeries> LoggingTimeSeriesEnsemble;
}  // End seisconv::seismic namespace encapsulation
#endif  //  End guard
