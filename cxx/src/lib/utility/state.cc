#include "seisconv/utility/state.h"
namespace seisconv::utility
{
namespace {
bool structure_checks_enabled(true);
bool header_checks_enabled(true);
bool verbose_enabled(false);
}
bool structure_check_state()
{
  return structure_checks_enabled;
}
bool structure_check_state(const bool newstate)
{
  bool old=structure_checks_enabled;
  structure_checks_enabled=newstate;
  return old;
}
bool header_check_state()
{
  return header_checks_enabled;
}
bool header_check_state(const bool newstate)
{
  bool old=header_checks_enabled;
  header_checks_enabled=newstate;
  return old;
}
bool seisconv_verbose()
{
  return verbose_enabled;
}
bool set_seisconv_verbose(const bool newstate)
{
  bool old=verbose_enabled;
  verbose_enabled=newstate;
  return old;
}

ScopedCheckState::ScopedCheckState()
{
  saved_structure=structure_check_state();
  saved_header=header_check_state();
  saved_verbose=seisconv_verbose();
}
ScopedCheckState::~ScopedCheckState()
{
  structure_check_state(saved_structure);
  header_check_state(saved_header);
  set_seisconv_verbose(saved_verbose);
}
void ScopedCheckState::disable_checks()
{
  structure_check_state(false);
  header_check_state(false);
}
void ScopedCheckState::set_verbose(const bool newstate)
{
  set_seisconv_verbose(newstate);
}
} // end seisconv::utility namespace
