#include "seisconv/utility/ErrorLogger.h"
namespace seisconv::utility
{
using namespace std;

LogData::LogData(const int jid, const std::string alg,
  const SeisconvError& merr)
{
  job_id=jid;
  p_id=getpid();
  algorithm=alg;
  message=merr.what();
  badness=merr.severity();
}
LogData::LogData(const int jid, const std::string alg, const std::string msg, const ErrorSeverity lvl)
{
  job_id=jid;
  p_id=getpid();
  algorithm=alg;
  message=msg;
  badness=lvl;
}
ostream& operator<<(ostream& ofs, const LogData& ld)
{
  ofs<<severity2string(ld.badness)<<" "
     <<ld.job_id<<" "<<ld.p_id<<" "<<ld.algorithm
     <<" "<<ld.message<<endl;
  return ofs;
}
ErrorLogger::ErrorLogger(const ErrorLogger& parent)
{
  job_id=parent.job_id;
  allmessages=parent.allmessages;
}
ErrorLogger& ErrorLogger::operator=(const ErrorLogger& parent)
{
  if(this!=&parent)
  {
    job_id=parent.job_id;
    allmessages=parent.allmessages;
  }
  return *this;
}
int ErrorLogger::log_error(const SeisconvError& merr)
{
  LogData thislog(this->job_id,string("SeisconvError"),merr);
  allmessages.push_back(thislog);
  return allmessages.size();
}
int ErrorLogger::log_error(const std::string alg, const std::string mess,
  const ErrorSeverity level)
{
  LogData thislog(this->job_id,alg,mess,level);
  allmessages.push_back(thislog);
  return allmessages.size();
}
int ErrorLogger::log_verbose(const std::string alg,const std::string mess)
{
  return this->log_error(alg,mess,ErrorSeverity::Informational);
}
/* Severity is an enum class so we sort into one list per level rather
than depend on the integer order of the enum. */
list<LogData> ErrorLogger::worst_errors() const
{
  if(allmessages.size()<=0) return allmessages;
  list<LogData> flist,ivlist,slist,clist,dlist,ilist;
  list<LogData>::const_iterator aptr;
  for(aptr=allmessages.begin();aptr!=allmessages.end();++aptr)
  {
    switch(aptr->badness)
    {
      case ErrorSeverity::Fatal:
        flist.push_back(*aptr);
        break;
      case ErrorSeverity::Invalid:
        ivlist.push_back(*aptr);
        break;
      case ErrorSeverity::Suspect:
        slist.push_back(*aptr);
        break;
      case ErrorSeverity::Complaint:
        clist.push_back(*aptr);
        break;
      case ErrorSeverity::Debug:
        dlist.push_back(*aptr);
        break;
      case ErrorSeverity::Informational:
      default:
        ilist.push_back(*aptr);
    };
  }
  if(flist.size()>0) return flist;
  if(ivlist.size()>0) return ivlist;
  if(slist.size()>0) return slist;
  if(clist.size()>0) return clist;
  if(dlist.size()>0) return dlist;
  return ilist;
}
} // end seisconv::utility namespace
