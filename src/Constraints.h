#ifndef CONSTRAINTS_H
#define CONSTRAINTS_H

/******************** Constraints.h ****************
    Named linear constraints lb <= expr <= ub.
    As with the variables, every concrete kind
    declares its naming prefix and knows how to
    build its own expression.
****************************************/

#include "DataStructures.h"
#include "Variables.h"

#include <cmath>
#include <string>

/* Use for a side of a constraint that has no bound */
#define NO_BOUND HUGE_VAL

class GENERICCONSTRAINT {
 public:
  virtual ~GENERICCONSTRAINT();

  virtual const char* prefix() const = 0;
  string name() const;

  string hook;
  LINEXPR expr;
  double lb; /* -NO_BOUND if free below */
  double ub; /* NO_BOUND if free above */

  /* True if expr is within [lb, ub] (to within tol) at the given primal values */
  bool satisfiedBy(const map<string, double> &primals, double tol) const;

 protected:
  GENERICCONSTRAINT(const string &hookName, const LINEXPR &expression, double lowerBound, double upperBound);
};

/* sum(S * (F - R)) = 0 for one metabolite */
class MASSBALANCE : public GENERICCONSTRAINT {
 public:
  MASSBALANCE(const METABOLITE &met, const LINEXPR &expression);
  const char* prefix() const;
};

/* F + R + C*z <= C for one non-core reaction (C = carbon uptake, z = its lumping indicator) */
class CARBONUPTAKECOUPLING : public GENERICCONSTRAINT {
 public:
  CARBONUPTAKECOUPLING(const REACTION &rxn, const GENERICVARIABLE &forward, const GENERICVARIABLE &reverse,
		       const GENERICVARIABLE &indicator, double carbonUptake);
  const char* prefix() const;
};

/* flux(biomass) >= growth rate */
class GROWTHCONSTRAINT : public GENERICCONSTRAINT {
 public:
  GROWTHCONSTRAINT(const REACTION &rxn, const LINEXPR &fluxExpression, double growthRate);
  const char* prefix() const;
};

/* DG0 - err <= DG - RT * sum(S * LN) <= DG0 + err */
class DELTAGDEFINITION : public GENERICCONSTRAINT {
 public:
  DELTAGDEFINITION(const REACTION &rxn, const GENERICVARIABLE &deltaG, const LINEXPR &logConcTerm,
		   double deltaG0, double deltaG0err);
  const char* prefix() const;
};

/* FU + BU <= 1 */
class SIMULTANEOUSUSE : public GENERICCONSTRAINT {
 public:
  SIMULTANEOUSUSE(const REACTION &rxn, const GENERICVARIABLE &forwardUse, const GENERICVARIABLE &backwardUse);
  const char* prefix() const;
};

/* F - M * FU <= 0 */
class FORWARDFLUXCOUPLING : public GENERICCONSTRAINT {
 public:
  FORWARDFLUXCOUPLING(const REACTION &rxn, const GENERICVARIABLE &forward, const GENERICVARIABLE &forwardUse, double bigM);
  const char* prefix() const;
};

/* R - M * BU <= 0 */
class REVERSEFLUXCOUPLING : public GENERICCONSTRAINT {
 public:
  REVERSEFLUXCOUPLING(const REACTION &rxn, const GENERICVARIABLE &reverse, const GENERICVARIABLE &backwardUse, double bigM);
  const char* prefix() const;
};

/* DG + K * FU <= K - eps */
class FORWARDDELTAGCOUPLING : public GENERICCONSTRAINT {
 public:
  FORWARDDELTAGCOUPLING(const REACTION &rxn, const GENERICVARIABLE &deltaG, const GENERICVARIABLE &forwardUse,
			double bigK, double epsilon);
  const char* prefix() const;
};

/* -DG + K * BU <= K - eps */
class BACKWARDDELTAGCOUPLING : public GENERICCONSTRAINT {
 public:
  BACKWARDDELTAGCOUPLING(const REACTION &rxn, const GENERICVARIABLE &deltaG, const GENERICVARIABLE &backwardUse,
			 double bigK, double epsilon);
  const char* prefix() const;
};

#endif
