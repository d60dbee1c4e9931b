#ifndef VARIABLES_H
#define VARIABLES_H

/******************** Variables.h ****************
    Linear expressions and the named variables
    that go into them. Every concrete kind of
    variable declares the prefix its names start
    with; the abstract base does not.
****************************************/

#include "DataStructures.h"

#include <map>
#include <string>

#define VAR_CONTINUOUS 0
#define VAR_BINARY     1
#define VAR_INTEGER    2

/* sum(coef[name] * name) + constant */
class LINEXPR {
 public:
  map<string, double> coef;
  double constant;

  LINEXPR();
  LINEXPR(const string &varName, double coefficient);
  explicit LINEXPR(double value);

  LINEXPR& operator+=(const LINEXPR &rhs);
  LINEXPR& operator-=(const LINEXPR &rhs);
  LINEXPR operator+(const LINEXPR &rhs) const;
  LINEXPR operator-(const LINEXPR &rhs) const;
  LINEXPR operator*(double scale) const;

  /* Variables missing from primals count as 0 */
  double evaluate(const map<string, double> &primals) const;
  bool empty() const;
  /* Drops terms whose coefficient is exactly zero */
  void compact();
};

class GENERICVARIABLE {
 public:
  virtual ~GENERICVARIABLE();

  /* Names are prefix() + hook, e.g. "F_PGI" */
  virtual const char* prefix() const = 0;
  string name() const;
  LINEXPR expr() const;

  /* Name of the reaction / metabolite the variable is attached to */
  string hook;
  double lb;
  double ub;
  int kind;

 protected:
  GENERICVARIABLE(const string &hookName, double lowerBound, double upperBound, int varKind);
};

/* Flux through a reaction in the forward direction */
class FORWARDFLUXVARIABLE : public GENERICVARIABLE {
 public:
  explicit FORWARDFLUXVARIABLE(const REACTION &rxn);
  const char* prefix() const;
};

/* Flux through a reaction in the reverse direction (the net flux is F - R) */
class REVERSEFLUXVARIABLE : public GENERICVARIABLE {
 public:
  explicit REVERSEFLUXVARIABLE(const REACTION &rxn);
  const char* prefix() const;
};

/* Binary indicator attached to every non-core reaction by the lumping problem */
class LUMPINDICATORVARIABLE : public GENERICVARIABLE {
 public:
  explicit LUMPINDICATORVARIABLE(const REACTION &rxn);
  const char* prefix() const;
};

/* 1 if the reaction is allowed to carry forward flux */
class FORWARDUSEVARIABLE : public GENERICVARIABLE {
 public:
  explicit FORWARDUSEVARIABLE(const REACTION &rxn);
  const char* prefix() const;
};

/* 1 if the reaction is allowed to carry reverse flux */
class BACKWARDUSEVARIABLE : public GENERICVARIABLE {
 public:
  explicit BACKWARDUSEVARIABLE(const REACTION &rxn);
  const char* prefix() const;
};

/* Transformed Gibbs free energy of a reaction (kJ/mol) */
class DELTAGVARIABLE : public GENERICVARIABLE {
 public:
  DELTAGVARIABLE(const REACTION &rxn, double lowerBound, double upperBound);
  const char* prefix() const;
};

/* Natural log of a metabolite concentration (M) */
class LOGCONCVARIABLE : public GENERICVARIABLE {
 public:
  LOGCONCVARIABLE(const METABOLITE &met, double lowerBound, double upperBound);
  const char* prefix() const;
};

#endif
