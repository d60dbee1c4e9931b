#include "MyConstants.h"
#include "pathUtils.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <cstdio>
#include <map>
#include <vector>

using std::vector;
using std::map;

bool hasSuffix(const string &name, const string &suffix) {
  if(name.size() < suffix.size()) { return false; }
  return name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

/* COBRA metabolite names end with the compartment (glc__D_e, atp_c).
   The database keys don't have it */
string stripCompartment(const string &metName) {
  size_t pos = metName.rfind('_');
  if(pos == string::npos || pos == 0) { return metName; }
  /* Compartment tags are short (c, e, m, p, c0 ...) */
  if(metName.size() - pos - 1 > 2) { return metName; }
  return metName.substr(0, pos);
}

/* SBML ids carry "R_" / "M_" in front of the COBRA identifier */
string stripIdPrefix(const string &id, const char* prefix) {
  string pre(prefix);
  if(id.size() > pre.size() && id.compare(0, pre.size(), pre) == 0) {
    return id.substr(pre.size());
  }
  return id;
}

string trimWhitespace(const string &in) {
  const char* ws = " \t\r\n";
  size_t first = in.find_first_not_of(ws);
  if(first == string::npos) { return string(); }
  size_t last = in.find_last_not_of(ws);
  return in.substr(first, last - first + 1);
}

/* strtod with a check that the whole string was used */
double parseDouble(const string &in, bool &ok) {
  string tmp = trimWhitespace(in);
  ok = false;
  if(tmp.empty()) { return 0.0f; }
  if(tmp == "inf" || tmp == "INF" || tmp == "Inf") { ok = true; return HUGE_VAL; }
  if(tmp == "-inf" || tmp == "-INF" || tmp == "-Inf") { ok = true; return -HUGE_VAL; }
  char* end = NULL;
  double value = strtod(tmp.c_str(), &end);
  if(end == tmp.c_str() || *end != '\0') { return 0.0f; }
  ok = true;
  return value;
}

void addScaledStoich(map<int, double> &lumped, const REACTION &rxn, double coefficient) {
  for(int i=0; i<rxn.stoich.size(); i++) {
    lumped[rxn.stoich[i].met_id] += coefficient * rxn.stoich[i].rxn_coeff;
  }
}

vector<STOICH> stoichFromMap(const map<int, double> &lumped, const METSPACE &metspace, double cutoff) {
  vector<STOICH> result;
  for(map<int, double>::const_iterator it = lumped.begin(); it != lumped.end(); ++it) {
    if(rougheq(it->second, 0.0f, cutoff)) { continue; }
    STOICH tmp;
    tmp.met_id = it->first;
    tmp.rxn_coeff = it->second;
    if(metspace.idIn(it->first)) { tmp.met_name = metspace.metPtrFromId(it->first)->name; }
    result.push_back(tmp);
  }
  return result;
}

/* Test if two variables are equal within a constant */
int rougheq(const double one, const double two, const double constant){
  if(one < two + constant && one > two - constant){ return 1;}
  else{ return 0; }
}
