#include "Variables.h"

#include <cmath>
#include <map>
#include <string>

using std::map;
using std::string;

/**************** LINEXPR ****************/

LINEXPR::LINEXPR() {
  constant = 0.0f;
}

LINEXPR::LINEXPR(const string &varName, double coefficient) {
  constant = 0.0f;
  coef[varName] = coefficient;
}

LINEXPR::LINEXPR(double value) {
  constant = value;
}

LINEXPR& LINEXPR::operator+=(const LINEXPR &rhs) {
  for(map<string, double>::const_iterator it = rhs.coef.begin(); it != rhs.coef.end(); ++it) {
    coef[it->first] += it->second;
  }
  constant += rhs.constant;
  return *this;
}

LINEXPR& LINEXPR::operator-=(const LINEXPR &rhs) {
  for(map<string, double>::const_iterator it = rhs.coef.begin(); it != rhs.coef.end(); ++it) {
    coef[it->first] -= it->second;
  }
  constant -= rhs.constant;
  return *this;
}

LINEXPR LINEXPR::operator+(const LINEXPR &rhs) const {
  LINEXPR result = *this;
  result += rhs;
  return result;
}

LINEXPR LINEXPR::operator-(const LINEXPR &rhs) const {
  LINEXPR result = *this;
  result -= rhs;
  return result;
}

LINEXPR LINEXPR::operator*(double scale) const {
  LINEXPR result;
  for(map<string, double>::const_iterator it = coef.begin(); it != coef.end(); ++it) {
    result.coef[it->first] = it->second * scale;
  }
  result.constant = constant * scale;
  return result;
}

double LINEXPR::evaluate(const map<string, double> &primals) const {
  double value = constant;
  for(map<string, double>::const_iterator it = coef.begin(); it != coef.end(); ++it) {
    map<string, double>::const_iterator p = primals.find(it->first);
    if(p == primals.end()) { continue; }
    value += it->second * p->second;
  }
  return value;
}

bool LINEXPR::empty() const {
  for(map<string, double>::const_iterator it = coef.begin(); it != coef.end(); ++it) {
    if(it->second != 0.0f) { return false; }
  }
  return true;
}

void LINEXPR::compact() {
  map<string, double>::iterator it = coef.begin();
  while(it != coef.end()) {
    if(it->second == 0.0f) { coef.erase(it++); }
    else { ++it; }
  }
}

/**************** Variables ****************/

GENERICVARIABLE::GENERICVARIABLE(const string &hookName, double lowerBound, double upperBound, int varKind) {
  hook = hookName;
  lb = lowerBound;
  ub = upperBound;
  kind = varKind;
}

GENERICVARIABLE::~GENERICVARIABLE() {
}

string GENERICVARIABLE::name() const {
  return string(prefix()) + hook;
}

LINEXPR GENERICVARIABLE::expr() const {
  return LINEXPR(name(), 1.0f);
}

/* Negative lower bounds belong to the reverse variable and vice versa */
FORWARDFLUXVARIABLE::FORWARDFLUXVARIABLE(const REACTION &rxn)
  : GENERICVARIABLE(rxn.name, rxn.lb > 0.0f ? rxn.lb : 0.0f, rxn.ub > 0.0f ? rxn.ub : 0.0f, VAR_CONTINUOUS) {
}
const char* FORWARDFLUXVARIABLE::prefix() const { return "F_"; }

REVERSEFLUXVARIABLE::REVERSEFLUXVARIABLE(const REACTION &rxn)
  : GENERICVARIABLE(rxn.name, rxn.ub < 0.0f ? -rxn.ub : 0.0f, rxn.lb < 0.0f ? -rxn.lb : 0.0f, VAR_CONTINUOUS) {
}
const char* REVERSEFLUXVARIABLE::prefix() const { return "R_"; }

LUMPINDICATORVARIABLE::LUMPINDICATORVARIABLE(const REACTION &rxn)
  : GENERICVARIABLE(rxn.name, 0.0f, 1.0f, VAR_BINARY) {
}
const char* LUMPINDICATORVARIABLE::prefix() const { return "LC_"; }

FORWARDUSEVARIABLE::FORWARDUSEVARIABLE(const REACTION &rxn)
  : GENERICVARIABLE(rxn.name, 0.0f, 1.0f, VAR_BINARY) {
}
const char* FORWARDUSEVARIABLE::prefix() const { return "FU_"; }

BACKWARDUSEVARIABLE::BACKWARDUSEVARIABLE(const REACTION &rxn)
  : GENERICVARIABLE(rxn.name, 0.0f, 1.0f, VAR_BINARY) {
}
const char* BACKWARDUSEVARIABLE::prefix() const { return "BU_"; }

DELTAGVARIABLE::DELTAGVARIABLE(const REACTION &rxn, double lowerBound, double upperBound)
  : GENERICVARIABLE(rxn.name, lowerBound, upperBound, VAR_CONTINUOUS) {
}
const char* DELTAGVARIABLE::prefix() const { return "DG_"; }

LOGCONCVARIABLE::LOGCONCVARIABLE(const METABOLITE &met, double lowerBound, double upperBound)
  : GENERICVARIABLE(met.name, lowerBound, upperBound, VAR_CONTINUOUS) {
}
const char* LOGCONCVARIABLE::prefix() const { return "LN_"; }
