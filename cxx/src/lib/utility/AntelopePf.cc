#include <ctype.h>
#include <stdlib.h>
#include <sys/stat.h>
#include <string>
#include <list>
#include <iostream>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <limits>
#include <set>
#include "seisconv/utility/SeisconvError.h"
#include "seisconv/utility/AntelopePf.h"
namespace seisconv::utility {
using namespace std;
namespace {
enum PfStyleInputType {PFMDSTRING, PFMDREAL, PFMDINT, PFMDBOOL, PFMDARR, PFMDTBL};
/* Similar to the antelope yesno function.  Return code is the same:
   0 is false, -1 for boolean true, and +1 for no match.  0 and 1 are
   not accepted as booleans as they are common integer values. */
int yesno(const string& s)
{
    if( (s=="yes") || (s=="ok") || (s=="y") || (s=="true")
            || (s=="on") || (s=="t") ) return(-1);
    if( (s=="no") || (s=="n") || (s=="false") || (s=="off")
            || (s=="f") ) return(0);
    return(1);
}
/* Guess the type of the value token.  A real contains a period and/or
an e/E.  Any other alphabetic character makes it a string. */
PfStyleInputType arg_type(const string& token)
{
    if(token.find("&Arr")!=string::npos) return(PFMDARR);
    if(token.find("&Tbl")!=string::npos) return(PFMDTBL);
    if(token.size()==0) return(PFMDSTRING);
    if(yesno(token)!=1) return(PFMDBOOL);
    bool found_an_e(false);
    bool found_a_digit(false);
    for(size_t i=0; i<token.size(); ++i)
    {
        char c=token[i];
        if(isdigit(c))
        {
            found_a_digit=true;
            continue;
        }
        if((c=='e') || (c=='E'))
        {
            if(found_an_e) return(PFMDSTRING);
            found_an_e=true;
            continue;
        }
        if((c=='.') || (c=='-') || (c=='+')) continue;
        return(PFMDSTRING);
    }
    if(!found_a_digit) return(PFMDSTRING);
    if(token.find(".")!=string::npos) return(PFMDREAL);
    if(found_an_e) return(PFMDREAL);
    return(PFMDINT);
}
/* returns true if the first nonwhite space character is a # sign*/
bool is_comment_line(const string& testline)
{
    size_t start=testline.find_first_not_of(" \t\n",0);
    if(start==string::npos) return(false);
    return testline[start]=='#';
}
bool is_blank_line(const string& testline)
{
    return testline.find_first_not_of(" \t\n\r",0)==string::npos;
}
pair<string,string> split_line(const string& s)
{
    const string white(" \t\r");
    const string terminators("\n\r#");
    pair<string,string> result;
    size_t is,ie;
    is=s.find_first_not_of(white,0);
    if(is==string::npos) return result;
    ie=s.find_first_of(white,is);
    result.first.assign(s,is,ie==string::npos ? string::npos : ie-is);
    if(ie==string::npos) return result;
    is=s.find_first_not_of(white,ie);
    if(is==string::npos) return result;
    ie=s.find_first_of(terminators,is);
    string val;
    val.assign(s,is,ie==string::npos ? string::npos : ie-is);
    /* drop trailing white space */
    size_t last=val.find_last_not_of(white);
    if(last!=string::npos) val.erase(last+1);
    result.second=val;
    return result;
}
string trim(const string& s)
{
    const string white(" \t\r\n");
    size_t is=s.find_first_not_of(white);
    if(is==string::npos) return string();
    size_t ie=s.find_last_not_of(white);
    return s.substr(is,ie-is+1);
}
list<string> read_pf_lines(const string& fname)
{
    const string base_error("AntelopePf file constructor:  ");
    struct stat buffer;
    if(stat(fname.c_str(),&buffer))
      throw AntelopePfError(base_error+"file="+fname+" does not exist");
    ifstream inp;
    inp.open(fname.c_str(),ios::in);
    if(inp.fail())
        throw AntelopePfError(base_error + "open failed for file="+fname);
    list<string> alllines;
    string rawline;
    while(getline(inp,rawline))
        alllines.push_back(rawline);
    return alllines;
}
}   // end unnamed namespace

AntelopePf::AntelopePf(const string fname) : AntelopePf(read_pf_lines(fname))
{
}
AntelopePf::AntelopePf(const list<string>& alllines) : Metadata()
{
    const string base_error("AntelopePf constructor:  ");
    list<string>::const_iterator lptr;
    for(lptr=alllines.begin(); lptr!=alllines.end(); ++lptr)
    {
        if(is_blank_line(*lptr) || is_comment_line(*lptr)) continue;
        pair<string,string> sl=split_line(*lptr);
        const string& key=sl.first;
        const string& token2=sl.second;
        list<string> block;
        bool closed(false);
        switch(arg_type(token2))
        {
        case  PFMDSTRING:
            this->put(key,token2);
            break;
        case PFMDREAL:
            this->put(key,atof(token2.c_str()));
            break;
        case PFMDINT:
            this->put(key,atoi(token2.c_str()));
            break;
        case PFMDBOOL:
            this->put<bool>(key,yesno(token2)!=0);
            break;
        case PFMDTBL:
            /* A Tbl ends on the first line holding a closing curly bracket.
            The bracket must be alone on that line. */
            for(++lptr; lptr!=alllines.end(); ++lptr)
            {
                if(lptr->find("}")!=string::npos)
                {
                    closed=true;
                    break;
                }
                if(is_blank_line(*lptr) || is_comment_line(*lptr)) continue;
                block.push_back(trim(*lptr));
            }
            if(!closed)
                throw AntelopePfError(base_error
                   + "Tbl with key="+key+" has no closing curly bracket");
            pftbls[key]=block;
            break;
        case PFMDARR:
        default:
            throw AntelopePfError(base_error
                   +"Error parsing this line->" +*lptr
                   +"\nNested Arr blocks are not supported");
        }
    }
}

AntelopePf::AntelopePf(const AntelopePf& parent)
    : Metadata(parent)
{
    pftbls=parent.pftbls;
}
list<string> AntelopePf::get_tbl(const string key) const
{
    map<string,list<string> >::const_iterator iptr;
    iptr=pftbls.find(key);
    if(iptr==pftbls.end()) throw AntelopePfError(
            "get_tbl failed trying to find data for key="+key);
    return(iptr->second);
}
AntelopePf& AntelopePf::operator=(const AntelopePf& parent)
{
    if(this!=&parent)
    {
        this->Metadata::operator=(parent);
        pftbls=parent.pftbls;
    }
    return(*this);
}
void AntelopePf::pfwrite(ostream& ofs) const
{
    set<string> allkeys=this->keys();
    for(auto kptr=allkeys.begin(); kptr!=allkeys.end(); ++kptr)
    {
        string typ=this->type(*kptr);
        ofs << *kptr << " ";
        if(typ=="bool")
            ofs << (this->get_bool(*kptr) ? "true" : "false") << endl;
        else if(typ=="int")
            ofs << this->get_int(*kptr) << endl;
        else if(typ=="double")
        {
            /* keep a decimal point so the value reads back as real */
            ostringstream ss;
            ss << setprecision(numeric_limits<double>::max_digits10)
               << this->get_double(*kptr);
            string sval=ss.str();
            if(sval.find_first_of(".eE")==string::npos) sval += ".0";
            ofs << sval << endl;
        }
        else
            ofs << this->get_string(*kptr) << endl;
    }
    map<string,list<string> >::const_iterator tptr;
    for(tptr=pftbls.begin(); tptr!=pftbls.end(); ++tptr)
    {
        ofs << tptr->first << " &Tbl{" << endl;
        for(auto lptr=tptr->second.begin(); lptr!=tptr->second.end(); ++lptr)
            ofs << *lptr << endl;
        ofs << "}" << endl;
    }
}
} // End seisconv::utility namespace
