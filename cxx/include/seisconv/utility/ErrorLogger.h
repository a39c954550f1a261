#ifndef _SEISCONV_ERROR_LOGGER_H_
#define _SEISCONV_ERROR_LOGGER_H_
#include <unistd.h>
#include <list>
#include <string>
#include <boost/serialization/serialization.hpp>
#include <boost/serialization/library_version_type.hpp>
#include <boost/serialization/list.hpp>
#include <boost/serialization/string.hpp>
#include "seisconv/utility/SeisconvError.h"
namespace seisconv::utility{
class LogData
{
public:
  int job_id;
  int p_id;  // output of getpid()
  std::string algorithm;
  ErrorSeverity badness;
  std::string message;
  LogData(){};
  /*! Construct from a SeisconvError or child of same.

  \param jid is the value to assign to job_id.
  \param alg is assigned to algorithm attribute.
  \param merr is parsed to fill the message and severity fields.
  p_id is always fetched with getpid in the constructor.*/
  LogData(const int jid, const std::string alg,const SeisconvError& merr);
  /*! Construct from strings.

  \param jid is the value to assign to job_id.
  \param alg is assigned to algorithm attribute.
  \param msg is the error message.
  \param lvl is the error severity.*/
  LogData(const int jid, const std::string alg, const std::string msg, const ErrorSeverity lvl);
  friend std::ostream& operator<<(std::ostream&, const LogData&);
private:
  friend boost::serialization::access;
  template<class Archive>
     void serialize(Archive& ar,const unsigned int version)
  {
    ar & job_id;
    ar & p_id;
    ar & algorithm;
    ar & badness;
    ar & message;
  };
};
/*! \brief Container to hold error logs for a data object.

Records and ensembles carry one of these to post problems that do not
justify an exception and to hold verbose messages.  The log can explain
why data were killed, but can also contain informational messages enabled
by the verbose flag.  */
class ErrorLogger
{
public:
  ErrorLogger(){job_id=0;};
  ErrorLogger(int job)
  {
    job_id=job;
  };
  ErrorLogger(const ErrorLogger& parent);
  void set_job_id(int jid){job_id=jid;};
  int get_job_id() const {return job_id;};
  /*! Logs one error message.

  \param merr - the exception to be posted.

  \return size of error log after insertion.
  */
  int log_error(const SeisconvError& merr);
  /*! Log a message directly with a specified severity.

    \param alg is name of algorithm posting this message
    \param mess is the message to be posted.
    \param level is the badness level to be set with the message.

    \return size of error log after insertion.
    */
  int log_error(const std::string alg, const std::string mess,
		  const ErrorSeverity level=ErrorSeverity::Invalid);

  /*! \brief Log a verbose message marking it informational.

  Returns the size of the log after insertion.
  */
  int log_verbose(const std::string alg, const std::string mess);
  std::list<LogData> get_error_log()const{return allmessages;};
  int size()const{return allmessages.size();};
  ErrorLogger& operator=(const ErrorLogger& parent);
  /*! Return an std::list container with most serious error level marked. */
  std::list<LogData> worst_errors()const;
private:
  int job_id;
  std::list<LogData> allmessages;
  friend boost::serialization::access;
  template<class Archive>
     void serialize(Archive& ar,const unsigned int version)
  {
    ar & job_id;
    ar & allmessages;
  };
};

/*! \brief Full test of error log for data validity.

Works on any object with an elog attribute and a dead method.
Returns false if the data are dead or the worst entry in the log is
Fatal or Invalid.
*/
template <typename Tdata> bool data_are_valid(const Tdata& d)
{
  if(d.dead()) return false;
  std::list<LogData> welog;
  welog=d.elog.worst_errors();
  if(welog.size()<=0) return true;
  LogData ld;
  ld=*(welog.begin());
  if(ld.badness == ErrorSeverity::Fatal || ld.badness == ErrorSeverity::Invalid)
      return false;
  else
      return true;
}
} // End seisconv::utility namespace
#endif
